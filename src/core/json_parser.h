// Minimal flat-object JSON parser for tool configuration (no external dependencies).
//
// Handles a flat object with string, number, boolean, and null values.
// Nested objects and arrays are skipped.

#ifndef SCL_CORE_JSON_PARSER_H
#define SCL_CORE_JSON_PARSER_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace scl {

/// @brief A single JSON value (string, number, or boolean).
struct JsonValue {
  enum Type { String, Number, Bool, Null };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;

  /// @brief Get value as double, with default.
  double asDouble(double default_val = 0.0) const;

  /// @brief Get value as integer, with default.
  int64_t asInt(int64_t default_val = 0) const;

  /// @brief Get value as boolean, with default.
  bool asBool(bool default_val = false) const;

  /// @brief Get value as string, with default.
  std::string asString(const std::string& default_val = "") const;
};

/// Parsed top-level object: key -> value.
using JsonObject = std::map<std::string, JsonValue>;

/// @brief Parse a flat JSON object into a key-value map.
///
/// @param json Pointer to JSON text.
/// @param length Length of JSON text.
/// @param ok Optional output: false if the text is not a well-formed object
///        (the entries parsed before the error are still returned).
/// @return Map of key-value pairs.
JsonObject parseJsonObject(const char* json, size_t length, bool* ok = nullptr);

/// @brief Look up a key and return its value, or nullptr if absent.
const JsonValue* findJsonValue(const JsonObject& object, const std::string& key);

}  // namespace scl

#endif  // SCL_CORE_JSON_PARSER_H
