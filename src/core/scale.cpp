/// @file
/// @brief Frequency table generation for Scale.

#include "core/scale.h"

namespace scl {

std::vector<double> Scale::freqs(double base) const {
  std::vector<double> result;
  result.reserve(pitches.size() + 1);
  result.push_back(base);
  for (const auto& pitch : pitches) {
    result.push_back(pitch.freq(base));
  }
  return result;
}

}  // namespace scl
