// Scale value -- a description plus an ordered list of pitches.

#ifndef SCL_CORE_SCALE_H
#define SCL_CORE_SCALE_H

#include <cstddef>
#include <string>
#include <vector>

#include "core/pitch.h"

namespace scl {

/// Conventional reference frequency (A4) used when none is given.
constexpr double kDefaultBaseFreq = 440.0;

/// @brief A tuning: free-text description and the pitches of one period.
///
/// The unison (1/1) is implicit and never stored; the last pitch is usually
/// the period (e.g. 2/1 for an octave-repeating scale).
struct Scale {
  std::string description;
  std::vector<Pitch> pitches;

  /// @brief Number of stored pitches (the declared count in a scale file).
  size_t pitchCount() const { return pitches.size(); }

  /// @brief One period of frequencies, starting at and including the base.
  /// @param base Base frequency in Hz.
  /// @return Vector of pitchCount() + 1 frequencies: base, then each pitch.
  std::vector<double> freqs(double base) const;

  bool operator==(const Scale& other) const {
    return description == other.description && pitches == other.pitches;
  }
  bool operator!=(const Scale& other) const { return !(*this == other); }
};

}  // namespace scl

#endif  // SCL_CORE_SCALE_H
