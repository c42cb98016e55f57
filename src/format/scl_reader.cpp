/// @file
/// @brief Scala scale file reader implementation.

#include "format/scl_reader.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string_view>

#include "core/pitch.h"

namespace scl {

namespace {

/// Comment lines start with this character.
constexpr char kCommentMarker = '!';

bool isSpace(char chr) {
  return std::isspace(static_cast<unsigned char>(chr)) != 0;
}

/// @brief Strip leading and trailing whitespace.
std::string_view trim(std::string_view text) {
  size_t start = 0;
  while (start < text.size() && isSpace(text[start])) ++start;
  size_t end = text.size();
  while (end > start && isSpace(text[end - 1])) --end;
  return text.substr(start, end - start);
}

/// @brief First whitespace-delimited field of a line (empty if the line is blank).
std::string_view firstField(std::string_view line) {
  size_t start = 0;
  while (start < line.size() && isSpace(line[start])) ++start;
  size_t end = start;
  while (end < line.size() && !isSpace(line[end])) ++end;
  return line.substr(start, end - start);
}

}  // namespace

// ---------------------------------------------------------------------------
// SclReader -- public
// ---------------------------------------------------------------------------

bool SclReader::read(const std::string& path) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    reset();
    return fail(SclErrorKind::Io, 0, "Failed to open file: " + path);
  }
  return read(file);
}

bool SclReader::readString(const std::string& text) {
  std::istringstream input(text);
  return read(input);
}

bool SclReader::read(std::istream& input) {
  reset();

  State state = State::AwaitingDescription;
  int64_t declared_count = 0;
  std::string line;

  for (size_t line_no = 1; std::getline(input, line); ++line_no) {
    // Accept CRLF files: the '\r' is not part of the line.
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    if (!line.empty() && line[0] == kCommentMarker) {
      continue;
    }

    switch (state) {
      case State::AwaitingDescription:
        scale_.description = line;
        state = State::AwaitingCount;
        break;
      case State::AwaitingCount:
        if (!parseCountLine(line, line_no, declared_count)) return false;
        state = State::ReadingPitches;
        break;
      case State::ReadingPitches:
        if (!parsePitchLine(line, line_no)) return false;
        break;
    }
  }

  if (input.bad()) {
    return fail(SclErrorKind::Io, 0, "Failed to read stream");
  }

  // Without a count line the declared count stays 0.
  if (static_cast<int64_t>(scale_.pitches.size()) != declared_count) {
    return fail(SclErrorKind::PitchCountMismatch, 0,
                "read " + std::to_string(scale_.pitches.size()) +
                    " pitches but expected " + std::to_string(declared_count));
  }

  return true;
}

// ---------------------------------------------------------------------------
// SclReader -- private
// ---------------------------------------------------------------------------

void SclReader::reset() {
  scale_ = Scale{};
  error_.clear();
  error_kind_ = SclErrorKind::None;
  error_line_ = 0;
}

bool SclReader::fail(SclErrorKind kind, size_t line, const std::string& message) {
  error_kind_ = kind;
  error_line_ = line;
  error_ = message;
  return false;
}

/// @brief Parse the declared pitch count: a trimmed, non-negative base-10 integer.
bool SclReader::parseCountLine(const std::string& line, size_t line_no,
                               int64_t& declared_count) {
  std::string text(trim(line));
  char* end = nullptr;
  errno = 0;
  long long value = text.empty() ? 0 : std::strtoll(text.c_str(), &end, 10);
  if (text.empty() || errno == ERANGE || end != text.c_str() + text.size() || value < 0) {
    return fail(SclErrorKind::MalformedCount, line_no,
                "malformed number of pitches: " + text);
  }
  declared_count = static_cast<int64_t>(value);
  return true;
}

/// @brief Parse the first field of a pitch line; trailing fields are annotations.
bool SclReader::parsePitchLine(const std::string& line, size_t line_no) {
  std::string_view token = firstField(line);
  if (token.empty()) {
    return fail(SclErrorKind::MalformedRatio, line_no,
                "line " + std::to_string(line_no) + ": malformed pitch ratio: (empty)");
  }

  Pitch pitch;
  std::string message;
  SclErrorKind kind = parsePitch(token, pitch, message);
  if (kind != SclErrorKind::None) {
    return fail(kind, line_no, "line " + std::to_string(line_no) + ": " + message);
  }

  scale_.pitches.push_back(pitch);
  return true;
}

}  // namespace scl
