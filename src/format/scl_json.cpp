/// @file
/// @brief JSON export of scales.

#include "format/scl_json.h"

#include <cstddef>
#include <vector>

#include "core/json_helpers.h"

namespace scl {

std::string scaleToJson(const Scale& scale, double base, bool pretty) {
  std::vector<double> freqs = scale.freqs(base);

  JsonWriter writer;
  writer.beginObject();
  writer.key("description");
  writer.value(scale.description);
  writer.key("pitch_count");
  writer.value(static_cast<int64_t>(scale.pitchCount()));
  writer.key("base_freq");
  writer.value(base);

  writer.key("pitches");
  writer.beginArray();
  for (size_t idx = 0; idx < scale.pitches.size(); ++idx) {
    const Pitch& pitch = scale.pitches[idx];
    writer.beginObject();
    writer.key("degree");
    writer.value(static_cast<int64_t>(idx + 1));
    writer.key("kind");
    writer.value(pitch.isCents() ? "cents" : "ratio");
    writer.key("text");
    writer.value(pitch.toString());
    if (pitch.isCents()) {
      writer.key("cents");
      writer.value(pitch.asCents().cents);
    } else {
      writer.key("numerator");
      writer.value(pitch.asRatio().numerator);
      writer.key("denominator");
      writer.value(pitch.asRatio().denominator);
    }
    writer.key("freq");
    writer.value(freqs[idx + 1]);
    writer.endObject();
  }
  writer.endArray();

  writer.key("freqs");
  writer.beginArray();
  for (double freq : freqs) {
    writer.value(freq);
  }
  writer.endArray();
  writer.endObject();

  return pretty ? writer.toPrettyString() : writer.toString();
}

}  // namespace scl
