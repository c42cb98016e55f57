// Minimal JSON serialization writer (no external dependencies).
//
// Builds JSON output via a string-builder approach. Used for the CLI's
// --json report and the C API's scale export. Does not parse JSON.

#ifndef SCL_CORE_JSON_HELPERS_H
#define SCL_CORE_JSON_HELPERS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace scl {

/// @brief Simple JSON writer that builds a JSON string incrementally.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("pitch");
///   writer.value("5/4");
///   writer.key("freq");
///   writer.value(550.0);
///   writer.endObject();
///   std::string json = writer.toString();
///   // -> {"pitch":"5/4","freq":550}
/// @endcode
///
/// Tracks comma insertion automatically. Does not validate structure
/// (caller must match begin/end pairs).
class JsonWriter {
 public:
  JsonWriter() = default;

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key (must be followed by a value call).
  void key(std::string_view name);

  /// @brief Write a string value (JSON-escaped).
  void value(std::string_view val);

  /// @brief Write a string value (JSON-escaped).
  void value(const char* val) { value(std::string_view(val)); }

  /// @brief Write an integer value.
  void value(int64_t val);

  /// @brief Write an integer value.
  void value(int val) { value(static_cast<int64_t>(val)); }

  /// @brief Write a floating-point value with up to 17 significant digits.
  ///
  /// NaN and infinity have no JSON representation and are written as null.
  void value(double val);

  /// @brief Write a boolean value.
  void value(bool val);

  /// @brief Write a null value.
  void valueNull();

  /// @brief Get the accumulated JSON string.
  std::string toString() const;

  /// @brief Get the accumulated JSON string with pretty-print indentation.
  /// @param indent_size Number of spaces per indent level (default: 2).
  std::string toPrettyString(int indent_size = 2) const;

 private:
  /// Write a comma if needed before the next value/key.
  void maybeComma();

  /// Mark the current container as holding at least one element.
  void markValueWritten();

  /// Escape special characters in a string for JSON output.
  static std::string escapeString(std::string_view input);

  std::string buffer_;

  // One entry per open container: whether the next element needs a comma.
  std::vector<bool> needs_comma_;
};

}  // namespace scl

#endif  // SCL_CORE_JSON_HELPERS_H
