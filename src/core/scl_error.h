// Error vocabulary shared by the scale reader, writer, and C API.

#ifndef SCL_CORE_SCL_ERROR_H
#define SCL_CORE_SCL_ERROR_H

#include <cstdint>

namespace scl {

/// @brief Kind of failure reported by the scale codec.
enum class SclErrorKind : uint8_t {
  None = 0,
  Io,                  ///< Underlying stream or file could not be read/written.
  MalformedCount,      ///< Pitch count line is not a valid non-negative integer.
  MalformedRatio,      ///< Ratio entry has a bad structure or a non-positive term.
  MalformedCents,      ///< Entry containing '.' is not a valid floating-point number.
  PitchCountMismatch,  ///< Number of pitch lines differs from the declared count.
};

/// @brief Convert an error kind to a short identifier.
/// @param kind Error kind.
/// @return Static string such as "malformed_ratio".
const char* errorKindToString(SclErrorKind kind);

}  // namespace scl

#endif  // SCL_CORE_SCL_ERROR_H
