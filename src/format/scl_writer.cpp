/// @file
/// @brief Scala scale file writer implementation.

#include "format/scl_writer.h"

#include <fstream>

namespace scl {

SclWriter::SclWriter() = default;

void SclWriter::build(const Scale& scale, const std::string& name) {
  text_.clear();

  // Attribution header: "! name" followed by an empty comment line.
  if (!name.empty()) {
    writeLine("! " + name);
    writeLine("!");
  }

  writeLine(scale.description);
  writeLine(" " + std::to_string(scale.pitches.size()));

  for (const auto& pitch : scale.pitches) {
    writeLine(" " + pitch.toString());
  }
}

bool SclWriter::write(std::ostream& output) const {
  output.write(text_.data(), static_cast<std::streamsize>(text_.size()));
  output.flush();
  return static_cast<bool>(output);
}

bool SclWriter::writeToFile(const std::string& path) const {
  std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    return false;
  }
  if (!write(file)) {
    return false;
  }
  file.close();
  return !file.fail();
}

void SclWriter::writeLine(const std::string& line) {
  text_ += line;
  text_ += '\n';
}

bool writeScale(std::ostream& output, const Scale& scale, const std::string& name) {
  SclWriter writer;
  writer.build(scale, name);
  return writer.write(output);
}

}  // namespace scl
