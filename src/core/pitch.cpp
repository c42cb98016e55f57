/// @file
/// @brief Ratio/cents pitch rendering, frequency computation, and token parsing.

#include "core/pitch.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace scl {

namespace {

/// @brief Parse a complete base-10 int64 (optional sign, no trailing text).
bool parseInt64(std::string_view text, int64_t& out) {
  if (text.empty()) return false;
  std::string buf(text);
  char* end = nullptr;
  errno = 0;
  long long value = std::strtoll(buf.c_str(), &end, 10);
  if (errno == ERANGE || end != buf.c_str() + buf.size()) return false;
  // strtoll skips leading whitespace; a field never contains any.
  if (std::isspace(static_cast<unsigned char>(buf[0]))) return false;
  out = static_cast<int64_t>(value);
  return true;
}

/// @brief Parse a complete floating-point number; overflow to infinity fails.
bool parseDouble(std::string_view text, double& out) {
  if (text.empty()) return false;
  std::string buf(text);
  char* end = nullptr;
  errno = 0;
  double value = std::strtod(buf.c_str(), &end);
  if (end != buf.c_str() + buf.size()) return false;
  if (std::isspace(static_cast<unsigned char>(buf[0]))) return false;
  if (errno == ERANGE && std::isinf(value)) return false;
  out = value;
  return true;
}

}  // namespace

// ---------------------------------------------------------------------------
// RatioPitch / CentsPitch
// ---------------------------------------------------------------------------

double RatioPitch::freq(double base) const {
  return static_cast<double>(numerator) * base / static_cast<double>(denominator);
}

std::string RatioPitch::toString() const {
  return std::to_string(numerator) + "/" + std::to_string(denominator);
}

double CentsPitch::freq(double base) const {
  return base * std::exp2(cents / kCentsPerOctave);
}

std::string CentsPitch::toString() const {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%f", cents);
  return buf;
}

// ---------------------------------------------------------------------------
// Pitch
// ---------------------------------------------------------------------------

Pitch::Pitch(const RatioPitch& ratio) : kind_(PitchKind::Ratio), ratio_(ratio) {}

Pitch::Pitch(const CentsPitch& cents) : kind_(PitchKind::Cents), cents_(cents) {}

Pitch Pitch::ratio(int64_t numerator, int64_t denominator) {
  return Pitch(RatioPitch{numerator, denominator});
}

Pitch Pitch::cents(double value) {
  return Pitch(CentsPitch{value});
}

double Pitch::freq(double base) const {
  return kind_ == PitchKind::Cents ? cents_.freq(base) : ratio_.freq(base);
}

std::string Pitch::toString() const {
  return kind_ == PitchKind::Cents ? cents_.toString() : ratio_.toString();
}

bool Pitch::operator==(const Pitch& other) const {
  if (kind_ != other.kind_) return false;
  if (kind_ == PitchKind::Cents) return cents_.cents == other.cents_.cents;
  return ratio_.numerator == other.ratio_.numerator &&
         ratio_.denominator == other.ratio_.denominator;
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

SclErrorKind parsePitch(std::string_view token, Pitch& out, std::string& error) {
  if (token.find('.') != std::string_view::npos) {
    double value = 0.0;
    if (!parseDouble(token, value)) {
      error = "malformed cents value: " + std::string(token);
      return SclErrorKind::MalformedCents;
    }
    out = Pitch::cents(value);
    return SclErrorKind::None;
  }

  RatioPitch ratio;
  bool parsed = false;
  size_t slash = token.find('/');
  if (slash == std::string_view::npos) {
    // "N" alone: denominator stays 1.
    parsed = parseInt64(token, ratio.numerator);
  } else if (token.find('/', slash + 1) == std::string_view::npos) {
    parsed = parseInt64(token.substr(0, slash), ratio.numerator) &&
             parseInt64(token.substr(slash + 1), ratio.denominator);
  }

  if (!parsed || ratio.numerator <= 0 || ratio.denominator <= 0) {
    error = "malformed pitch ratio: " + std::string(token);
    return SclErrorKind::MalformedRatio;
  }

  out = Pitch(ratio);
  return SclErrorKind::None;
}

}  // namespace scl
