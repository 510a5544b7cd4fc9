/**
 * @file json_value.hpp
 * @brief Dynamic JSON values for the vendor envelope.
 *
 * Device requests and responses are free-form JSON objects whose shape
 * varies by model and firmware. They are carried as protobuf's
 * google.protobuf.Value and converted to and from text with the protobuf
 * JSON utilities.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#pragma once

#include "kasad/protocol/export.hpp"

#include <google/protobuf/struct.pb.h>

#include <initializer_list>
#include <optional>
#include <string>

namespace kasad {
namespace protocol {

using JsonValue = google::protobuf::Value;

/**
 * @brief An empty JSON object ({}).
 */
KASAD_PROTOCOL_API JsonValue makeObject();

/**
 * @brief Get or create member @p key of an object value.
 *
 * Turns @p object into an object first if it holds anything else.
 */
KASAD_PROTOCOL_API JsonValue& member(JsonValue& object, const std::string& key);

/**
 * @brief Look up a member of an object value.
 * @return nullptr if @p object is not an object or has no such member.
 */
KASAD_PROTOCOL_API const JsonValue* findMember(const JsonValue& object,
                                               const std::string& key);

/**
 * @brief Walk nested objects, e.g. {"system", "get_sysinfo", "alias"}.
 */
KASAD_PROTOCOL_API const JsonValue* findPath(const JsonValue& root,
                                             std::initializer_list<std::string> path);

/**
 * @brief Numeric member, or nullopt if absent or not a number.
 */
KASAD_PROTOCOL_API std::optional<double> numberMember(const JsonValue& object,
                                                      const std::string& key);

/**
 * @brief String member, or nullopt if absent or not a string.
 */
KASAD_PROTOCOL_API std::optional<std::string> stringMember(const JsonValue& object,
                                                           const std::string& key);

/**
 * @brief Parse JSON text.
 * @param error Optional output for the parser's message on failure.
 * @return The value, or nullopt if the text is not valid JSON.
 */
KASAD_PROTOCOL_API std::optional<JsonValue> parseJson(const std::string& text,
                                                      std::string* error = nullptr);

/**
 * @brief Print a value as compact JSON text.
 * @throws std::runtime_error if the value cannot be represented (e.g. NaN).
 */
KASAD_PROTOCOL_API std::string printJson(const JsonValue& value);

}  // namespace protocol
}  // namespace kasad
