// Scale pitch model -- a pitch is either an integer ratio or a value in cents.

#ifndef SCL_CORE_PITCH_H
#define SCL_CORE_PITCH_H

#include <cstdint>
#include <string>
#include <string_view>

#include "core/scl_error.h"

namespace scl {

/// Cents per octave (frequency ratio 2:1).
constexpr double kCentsPerOctave = 1200.0;

/// @brief Which representation a Pitch holds.
enum class PitchKind : uint8_t {
  Ratio = 0,
  Cents = 1
};

/// @brief A pitch given as the ratio of two positive integers.
struct RatioPitch {
  int64_t numerator = 1;
  int64_t denominator = 1;

  /// @brief Frequency of this pitch relative to a base frequency.
  /// @param base Base frequency in Hz.
  /// @return base * numerator / denominator.
  double freq(double base) const;

  /// @brief Render as "N/D" (the denominator is always written).
  std::string toString() const;
};

/// @brief A pitch given in cents above the base frequency.
struct CentsPitch {
  double cents = 0.0;

  /// @brief Frequency of this pitch relative to a base frequency.
  /// @param base Base frequency in Hz.
  /// @return base * 2^(cents / 1200).
  double freq(double base) const;

  /// @brief Render with six digits after the decimal point.
  std::string toString() const;
};

/// @brief One scale degree: a tagged value holding a RatioPitch or a CentsPitch.
///
/// Default-constructed pitches are the unison ratio 1/1.
class Pitch {
 public:
  Pitch() = default;
  Pitch(const RatioPitch& ratio);  // NOLINT(google-explicit-constructor)
  Pitch(const CentsPitch& cents);  // NOLINT(google-explicit-constructor)

  /// @brief Build a ratio pitch.
  static Pitch ratio(int64_t numerator, int64_t denominator);

  /// @brief Build a cents pitch.
  static Pitch cents(double value);

  PitchKind kind() const { return kind_; }
  bool isRatio() const { return kind_ == PitchKind::Ratio; }
  bool isCents() const { return kind_ == PitchKind::Cents; }

  /// @brief Ratio payload (meaningful only when isRatio()).
  const RatioPitch& asRatio() const { return ratio_; }

  /// @brief Cents payload (meaningful only when isCents()).
  const CentsPitch& asCents() const { return cents_; }

  /// @brief Frequency of this pitch relative to a base frequency.
  double freq(double base) const;

  /// @brief Canonical text form, as written in a scale file.
  std::string toString() const;

  bool operator==(const Pitch& other) const;
  bool operator!=(const Pitch& other) const { return !(*this == other); }

 private:
  PitchKind kind_ = PitchKind::Ratio;
  RatioPitch ratio_;
  CentsPitch cents_;
};

/// @brief Parse one pitch entry token.
///
/// A token containing '.' is parsed as cents. Otherwise it is a ratio "N" or
/// "N/D" whose terms must both be positive 64-bit integers.
///
/// @param token Pitch token (the first whitespace-delimited field of a line).
/// @param out Output pitch, assigned only on success.
/// @param error Output message on failure (e.g. "malformed pitch ratio: 0/4").
/// @return SclErrorKind::None on success, MalformedRatio or MalformedCents otherwise.
SclErrorKind parsePitch(std::string_view token, Pitch& out, std::string& error);

}  // namespace scl

#endif  // SCL_CORE_PITCH_H
