/**
 * @file json_value.cpp
 * @brief JSON value helpers over google.protobuf.Value.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#include "kasad/protocol/json_value.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace kasad {
namespace protocol {

JsonValue makeObject() {
    JsonValue value;
    value.mutable_struct_value();
    return value;
}

JsonValue& member(JsonValue& object, const std::string& key) {
    return (*object.mutable_struct_value()->mutable_fields())[key];
}

const JsonValue* findMember(const JsonValue& object, const std::string& key) {
    if (object.kind_case() != JsonValue::kStructValue) {
        return nullptr;
    }
    const auto& fields = object.struct_value().fields();
    auto it = fields.find(key);
    if (it == fields.end()) {
        return nullptr;
    }
    return &it->second;
}

const JsonValue* findPath(const JsonValue& root,
                          std::initializer_list<std::string> path) {
    const JsonValue* current = &root;
    for (const auto& key : path) {
        current = findMember(*current, key);
        if (!current) {
            return nullptr;
        }
    }
    return current;
}

std::optional<double> numberMember(const JsonValue& object, const std::string& key) {
    const JsonValue* value = findMember(object, key);
    if (!value || value->kind_case() != JsonValue::kNumberValue) {
        return std::nullopt;
    }
    return value->number_value();
}

std::optional<std::string> stringMember(const JsonValue& object, const std::string& key) {
    const JsonValue* value = findMember(object, key);
    if (!value || value->kind_case() != JsonValue::kStringValue) {
        return std::nullopt;
    }
    return value->string_value();
}

std::optional<JsonValue> parseJson(const std::string& text, std::string* error) {
    JsonValue value;
    auto status = google::protobuf::util::JsonStringToMessage(text, &value);
    if (!status.ok()) {
        if (error) {
            *error = status.ToString();
        }
        return std::nullopt;
    }
    return value;
}

std::string printJson(const JsonValue& value) {
    std::string out;
    auto status = google::protobuf::util::MessageToJsonString(value, &out);
    if (!status.ok()) {
        throw std::runtime_error("cannot print JSON: " + status.ToString());
    }
    return out;
}

}  // namespace protocol
}  // namespace kasad
