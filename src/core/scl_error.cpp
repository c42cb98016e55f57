/// @file
/// @brief Error kind names.

#include "core/scl_error.h"

namespace scl {

const char* errorKindToString(SclErrorKind kind) {
  switch (kind) {
    case SclErrorKind::None: return "none";
    case SclErrorKind::Io: return "io";
    case SclErrorKind::MalformedCount: return "malformed_count";
    case SclErrorKind::MalformedRatio: return "malformed_ratio";
    case SclErrorKind::MalformedCents: return "malformed_cents";
    case SclErrorKind::PitchCountMismatch: return "pitch_count_mismatch";
  }
  return "unknown";
}

}  // namespace scl
