// JSON export of a scale and its frequency table.

#ifndef SCL_FORMAT_SCL_JSON_H
#define SCL_FORMAT_SCL_JSON_H

#include <string>

#include "core/scale.h"

namespace scl {

/// @brief Serialize a scale and its frequencies at a given base to JSON.
///
/// Layout:
/// @code
///   {"description":"...","pitch_count":2,"base_freq":440,
///    "pitches":[{"degree":1,"kind":"ratio","text":"5/4","numerator":5,
///                "denominator":4,"freq":550}, ...],
///    "freqs":[440,550,...]}
/// @endcode
/// Cents entries carry "cents" instead of "numerator"/"denominator".
///
/// @param scale Scale to export.
/// @param base Base frequency in Hz.
/// @param pretty Indent the output.
/// @return JSON text.
std::string scaleToJson(const Scale& scale, double base, bool pretty = false);

}  // namespace scl

#endif  // SCL_FORMAT_SCL_JSON_H
