// Scala scale (.scl) reader. Parses the line-oriented text format into a Scale.

#ifndef SCL_FORMAT_SCL_READER_H
#define SCL_FORMAT_SCL_READER_H

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>

#include "core/scale.h"
#include "core/scl_error.h"

namespace scl {

/// @brief Scale file reader.
///
/// Lines starting with '!' are comments and are skipped wherever they occur.
/// The first remaining line is the description (kept verbatim), the second
/// the pitch count, and every later line one pitch entry whose first
/// whitespace-delimited field is a ratio ("5/4", "3") or cents ("386.3").
/// The first malformed line aborts the read.
class SclReader {
 public:
  SclReader() = default;

  /// @brief Read and parse a scale file from disk.
  /// @param path File path to read.
  /// @return True on success. On failure, call getError() for details.
  bool read(const std::string& path);

  /// @brief Read and parse a scale from an input stream until end of stream.
  /// @param input Stream positioned at the start of the scale text.
  /// @return True on success. On failure, call getError() for details.
  bool read(std::istream& input);

  /// @brief Read and parse a scale from an in-memory string.
  /// @param text Complete scale file contents.
  /// @return True on success. On failure, call getError() for details.
  bool readString(const std::string& text);

  /// @brief Get the parsed scale (valid only after a successful read).
  const Scale& getScale() const { return scale_; }

  /// @brief Get the error message from the last failed read().
  const std::string& getError() const { return error_; }

  /// @brief Get the kind of the last failure (None after a successful read).
  SclErrorKind getErrorKind() const { return error_kind_; }

  /// @brief 1-based line number of the last failure, or 0 if not line-specific.
  size_t getErrorLine() const { return error_line_; }

 private:
  /// Parser position within the file.
  enum class State : uint8_t {
    AwaitingDescription,
    AwaitingCount,
    ReadingPitches
  };

  Scale scale_;
  std::string error_;
  SclErrorKind error_kind_ = SclErrorKind::None;
  size_t error_line_ = 0;

  /// Reset parse state before a new read.
  void reset();

  /// Record a failure and return false.
  bool fail(SclErrorKind kind, size_t line, const std::string& message);

  /// Parse the pitch count line into declared_count.
  bool parseCountLine(const std::string& line, size_t line_no, int64_t& declared_count);

  /// Parse one pitch entry line and append it to the scale.
  bool parsePitchLine(const std::string& line, size_t line_no);
};

}  // namespace scl

#endif  // SCL_FORMAT_SCL_READER_H
