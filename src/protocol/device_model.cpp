/**
 * @file device_model.cpp
 * @brief Device model table implementation.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#include "kasad/protocol/device_model.hpp"

namespace kasad {
namespace protocol {

namespace {

constexpr double JOULES_PER_KWH = 3.6e6;
constexpr double JOULES_PER_WH = 3600.0;
constexpr double MILLI = 1e-3;

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

ModelProfile emeterV1() {
    ModelProfile p;
    p.tag = PROFILE_EMETER_V1;
    p.emeter_modules = {"emeter"};
    p.sources[static_cast<size_t>(Quantity::CURRENT)] = {{"current", 1.0}};
    p.sources[static_cast<size_t>(Quantity::VOLTAGE)] = {{"voltage", 1.0}};
    p.sources[static_cast<size_t>(Quantity::POWER)] = {{"power", 1.0}};
    p.sources[static_cast<size_t>(Quantity::ENERGY)] = {{"total", JOULES_PER_KWH}};
    return p;
}

ModelProfile emeterV2() {
    ModelProfile p;
    p.tag = PROFILE_EMETER_V2;
    p.emeter_modules = {"emeter"};
    p.sources[static_cast<size_t>(Quantity::CURRENT)] = {{"current_ma", MILLI}};
    p.sources[static_cast<size_t>(Quantity::VOLTAGE)] = {{"voltage_mv", MILLI}};
    p.sources[static_cast<size_t>(Quantity::POWER)] = {{"power_mw", MILLI}};
    p.sources[static_cast<size_t>(Quantity::ENERGY)] = {{"total_wh", JOULES_PER_WH}};
    return p;
}

ModelProfile generic() {
    ModelProfile v1 = emeterV1();
    ModelProfile v2 = emeterV2();

    ModelProfile p;
    p.tag = PROFILE_GENERIC;
    p.emeter_modules = {"emeter", "smartlife.iot.common.emeter"};
    for (size_t i = 0; i < QUANTITY_COUNT; ++i) {
        p.sources[i] = v1.sources[i];
        p.sources[i].insert(p.sources[i].end(), v2.sources[i].begin(), v2.sources[i].end());
    }
    return p;
}

}  // namespace

ModelTable::ModelTable() {
    addProfile(generic());
}

ModelTable ModelTable::defaults() {
    ModelTable table;
    table.addProfile(emeterV1());
    table.addProfile(emeterV2());

    table.addRule({"HS110", "1.", PROFILE_EMETER_V1});
    table.addRule({"HS110", "", PROFILE_EMETER_V2});
    table.addRule({"KP115", "", PROFILE_EMETER_V2});
    table.addRule({"KP125", "", PROFILE_EMETER_V2});
    table.addRule({"EP25", "", PROFILE_EMETER_V2});
    return table;
}

void ModelTable::addProfile(const ModelProfile& profile) {
    profiles_[profile.tag] = profile;
}

void ModelTable::addRule(const ModelRule& rule) {
    rules_.push_back(rule);
}

std::string ModelTable::resolveTag(const std::string& model,
                                   const std::string& hwVersion) const {
    if (model.empty()) {
        return PROFILE_GENERIC;
    }
    for (const auto& rule : rules_) {
        if (startsWith(model, rule.model_prefix) && startsWith(hwVersion, rule.hw_prefix)) {
            return rule.tag;
        }
    }
    return PROFILE_GENERIC;
}

const ModelProfile& ModelTable::profile(const std::string& tag) const {
    auto it = profiles_.find(tag);
    if (it == profiles_.end()) {
        return profiles_.at(PROFILE_GENERIC);
    }
    return it->second;
}

JsonValue buildTelemetryRequest(const ModelProfile& profile) {
    JsonValue request = makeObject();
    member(member(request, "system"), "get_sysinfo").mutable_struct_value();
    for (const auto& module : profile.emeter_modules) {
        member(member(request, module), "get_realtime").mutable_struct_value();
    }
    return request;
}

const JsonValue* findSysinfo(const JsonValue& response) {
    const JsonValue* sysinfo = findPath(response, {"system", "get_sysinfo"});
    if (!sysinfo || sysinfo->kind_case() != JsonValue::kStructValue) {
        return nullptr;
    }
    return sysinfo;
}

std::optional<RealtimeValues> extractRealtime(const ModelProfile& profile,
                                              const JsonValue& response,
                                              std::string& problem) {
    const JsonValue* block = nullptr;
    std::string deviceError;

    for (const auto& module : profile.emeter_modules) {
        const JsonValue* candidate = findPath(response, {module, "get_realtime"});
        if (!candidate || candidate->kind_case() != JsonValue::kStructValue) {
            continue;
        }
        auto errCode = numberMember(*candidate, "err_code");
        if (errCode && *errCode != 0) {
            deviceError = module + " err_code " + std::to_string(static_cast<long long>(*errCode));
            auto message = stringMember(*candidate, "err_msg");
            if (message) {
                deviceError += " (" + *message + ")";
            }
            continue;
        }
        block = candidate;
        break;
    }

    if (!block) {
        problem = deviceError.empty() ? "no get_realtime block in response" : deviceError;
        return std::nullopt;
    }

    RealtimeValues result;
    for (size_t i = 0; i < QUANTITY_COUNT; ++i) {
        auto quantity = static_cast<Quantity>(i);
        bool found = false;
        for (const auto& source : profile.sourcesFor(quantity)) {
            auto raw = numberMember(*block, source.field);
            if (raw) {
                result.set(quantity, *raw * source.scale);
                found = true;
                break;
            }
        }
        if (!found) {
            problem = std::string("missing ") + quantityToString(quantity) + " field";
            return std::nullopt;
        }
    }

    return result;
}

}  // namespace protocol
}  // namespace kasad
