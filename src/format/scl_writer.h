// Scala scale (.scl) writer. Serializes a Scale into the text format.

#ifndef SCL_FORMAT_SCL_WRITER_H
#define SCL_FORMAT_SCL_WRITER_H

#include <ostream>
#include <string>

#include "core/scale.h"

namespace scl {

/// @brief Scale file writer producing canonical .scl text.
///
/// Output layout:
/// @code
///   ! <name>          (only when name is non-empty)
///   !
///   <description>
///    <pitch count>
///    <pitch 1>
///    ...
/// @endcode
/// Comment lines of a previously read file are not preserved.
class SclWriter {
 public:
  SclWriter();

  /// @brief Build the text for a scale.
  /// @param scale Scale to serialize.
  /// @param name Optional attribution (usually the file name) written as a
  ///        header comment. Empty = no header.
  void build(const Scale& scale, const std::string& name = "");

  /// @brief Get the text produced by build().
  const std::string& toString() const { return text_; }

  /// @brief Write the built text to a stream.
  /// @param output Destination stream.
  /// @return True if every byte was written.
  bool write(std::ostream& output) const;

  /// @brief Write the built text to a file.
  /// @param path Output file path.
  /// @return True if the file was written successfully.
  bool writeToFile(const std::string& path) const;

 private:
  std::string text_;

  /// Append one line (text + '\n').
  void writeLine(const std::string& line);
};

/// @brief Serialize a scale directly to a stream.
/// @param output Destination stream.
/// @param scale Scale to serialize.
/// @param name Optional attribution header, see SclWriter::build().
/// @return False on the first failed write.
bool writeScale(std::ostream& output, const Scale& scale, const std::string& name = "");

}  // namespace scl

#endif  // SCL_FORMAT_SCL_WRITER_H
