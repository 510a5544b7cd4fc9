/**
 * @file device_model.hpp
 * @brief Table-driven field mapping and unit scaling per device model.
 *
 * Firmware generations report the same quantities under different field
 * names and units (amperes vs. milliamperes, kWh vs. Wh). A ModelProfile
 * lists, per quantity, the candidate fields and the factor that brings
 * each one to SI units. The ModelTable picks a profile from the model and
 * hardware version reported in the system info.
 *
 * Usage:
 * @code
 * auto table = ModelTable::defaults();
 * const ModelProfile& profile = table.profileFor("HS110(EU)", "2.0");
 * JsonValue request = buildTelemetryRequest(profile);
 * ...
 * std::string problem;
 * auto values = extractRealtime(profile, response, problem);
 * @endcode
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#pragma once

#include "kasad/protocol/export.hpp"
#include "kasad/protocol/json_value.hpp"

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kasad {
namespace protocol {

constexpr const char* PROFILE_EMETER_V1 = "emeter.v1";
constexpr const char* PROFILE_EMETER_V2 = "emeter.v2";
constexpr const char* PROFILE_GENERIC = "generic";

/**
 * @enum Quantity
 * @brief Electrical quantities read from the energy meter.
 */
enum class Quantity {
    CURRENT = 0,   ///< amperes
    VOLTAGE,       ///< volts
    POWER,         ///< watts
    ENERGY         ///< joules, cumulative
};

constexpr size_t QUANTITY_COUNT = 4;

inline const char* quantityToString(Quantity quantity) {
    switch (quantity) {
        case Quantity::CURRENT: return "current";
        case Quantity::VOLTAGE: return "voltage";
        case Quantity::POWER: return "power";
        case Quantity::ENERGY: return "energy";
        default: return "unknown";
    }
}

/**
 * @struct FieldSource
 * @brief One candidate field and its factor to SI units.
 */
struct KASAD_PROTOCOL_API FieldSource {
    std::string field;
    double scale;
};

/**
 * @struct ModelProfile
 * @brief How to ask a model for telemetry and how to read its answer.
 */
struct KASAD_PROTOCOL_API ModelProfile {
    std::string tag;
    std::vector<std::string> emeter_modules;   ///< Tried in order
    std::array<std::vector<FieldSource>, QUANTITY_COUNT> sources;  ///< First present wins

    const std::vector<FieldSource>& sourcesFor(Quantity quantity) const {
        return sources[static_cast<size_t>(quantity)];
    }
};

/**
 * @struct ModelRule
 * @brief Prefix match on (model, hw_version); an empty prefix matches anything.
 */
struct KASAD_PROTOCOL_API ModelRule {
    std::string model_prefix;
    std::string hw_prefix;
    std::string tag;
};

/**
 * @struct RealtimeValues
 * @brief Meter values in SI units, indexed by Quantity.
 */
struct KASAD_PROTOCOL_API RealtimeValues {
    std::array<double, QUANTITY_COUNT> values{};

    double get(Quantity quantity) const { return values[static_cast<size_t>(quantity)]; }
    void set(Quantity quantity, double value) { values[static_cast<size_t>(quantity)] = value; }
};

/**
 * @class ModelTable
 * @brief Ordered rules from model to profile tag, plus the profiles.
 *
 * Rules are evaluated in insertion order and the first match wins.
 * A model no rule matches, or a tag with no profile, falls back to the
 * generic profile.
 */
class KASAD_PROTOCOL_API ModelTable {
public:
    ModelTable();

    /**
     * @brief The built-in table (HS110 v1/v2, KP115, KP125, EP25, generic).
     */
    static ModelTable defaults();

    void addProfile(const ModelProfile& profile);
    void addRule(const ModelRule& rule);

    /**
     * @brief Tag for a model and hardware version.
     */
    std::string resolveTag(const std::string& model, const std::string& hwVersion) const;

    /**
     * @brief Profile registered under @p tag, or the generic profile.
     */
    const ModelProfile& profile(const std::string& tag) const;

    const ModelProfile& profileFor(const std::string& model,
                                   const std::string& hwVersion) const {
        return profile(resolveTag(model, hwVersion));
    }

    size_t ruleCount() const { return rules_.size(); }

private:
    std::vector<ModelRule> rules_;
    std::map<std::string, ModelProfile> profiles_;
};

/**
 * @brief Request for system info plus get_realtime on every emeter module.
 *
 * e.g. {"system":{"get_sysinfo":{}},"emeter":{"get_realtime":{}}}
 */
KASAD_PROTOCOL_API JsonValue buildTelemetryRequest(const ModelProfile& profile);

/**
 * @brief The system info block of a response, or nullptr.
 */
KASAD_PROTOCOL_API const JsonValue* findSysinfo(const JsonValue& response);

/**
 * @brief Map the realtime block of a response to SI values.
 *
 * The first module in the profile whose get_realtime block is an object
 * with a zero (or absent) err_code is used.
 *
 * @param problem Output: why no values could be produced.
 * @return The values, or nullopt if no module answered, the device
 *         reported an error, or a quantity has no present field.
 */
KASAD_PROTOCOL_API std::optional<RealtimeValues> extractRealtime(
    const ModelProfile& profile, const JsonValue& response, std::string& problem);

}  // namespace protocol
}  // namespace kasad
