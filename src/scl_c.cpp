// Implementation of C API for WASM and FFI bindings.

#include "scl_c.h"

#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "core/scale.h"
#include "core/scl_error.h"
#include "core/version_info.h"
#include "format/scl_json.h"
#include "format/scl_reader.h"
#include "format/scl_writer.h"
#include "tool_config.h"

namespace {

/// @brief Internal state held per SclHandle.
struct SclInstance {
  scl::Scale scale;
  bool has_scale = false;
  std::string error_message;
  size_t error_line = 0;
  std::string pitch_text;  // backing storage for scl_pitch_text
};

/// @brief Map a reader error kind to its C error code.
SclError toSclError(scl::SclErrorKind kind) {
  switch (kind) {
    case scl::SclErrorKind::None: return SCL_OK;
    case scl::SclErrorKind::Io: return SCL_ERROR_IO;
    case scl::SclErrorKind::MalformedCount: return SCL_ERROR_MALFORMED_COUNT;
    case scl::SclErrorKind::MalformedRatio: return SCL_ERROR_MALFORMED_RATIO;
    case scl::SclErrorKind::MalformedCents: return SCL_ERROR_MALFORMED_CENTS;
    case scl::SclErrorKind::PitchCountMismatch: return SCL_ERROR_PITCH_COUNT_MISMATCH;
  }
  return SCL_ERROR_INVALID_PARAM;
}

/// @brief Store the outcome of a read on the instance.
SclError finishRead(SclInstance* instance, bool success, const scl::SclReader& reader) {
  if (!success) {
    instance->scale = scl::Scale{};
    instance->has_scale = false;
    instance->error_message = reader.getError();
    instance->error_line = reader.getErrorLine();
    return toSclError(reader.getErrorKind());
  }
  instance->scale = reader.getScale();
  instance->has_scale = true;
  instance->error_message.clear();
  instance->error_line = 0;
  return SCL_OK;
}

/// @brief Copy a string into a malloc'ed SclTextData.
SclTextData* makeTextData(const std::string& text) {
  auto* result = static_cast<SclTextData*>(malloc(sizeof(SclTextData)));
  if (!result) return nullptr;

  result->length = text.size();
  result->text = static_cast<char*>(malloc(result->length + 1));
  if (!result->text) {
    free(result);
    return nullptr;
  }

  memcpy(result->text, text.c_str(), result->length + 1);
  return result;
}

}  // namespace

extern "C" {

// ============================================================================
// Lifecycle
// ============================================================================

SclHandle scl_create(void) {
  return new SclInstance();
}

void scl_destroy(SclHandle handle) {
  delete static_cast<SclInstance*>(handle);
}

// ============================================================================
// Reading
// ============================================================================

SclError scl_read(SclHandle handle, const char* text, size_t length) {
  if (!handle || (!text && length > 0)) {
    return SCL_ERROR_INVALID_PARAM;
  }

  auto* instance = static_cast<SclInstance*>(handle);
  scl::SclReader reader;
  bool success = reader.readString(length > 0 ? std::string(text, length) : std::string());
  return finishRead(instance, success, reader);
}

SclError scl_read_file(SclHandle handle, const char* path) {
  if (!handle || !path) {
    return SCL_ERROR_INVALID_PARAM;
  }

  auto* instance = static_cast<SclInstance*>(handle);
  scl::SclReader reader;
  bool success = reader.read(std::string(path));
  return finishRead(instance, success, reader);
}

const char* scl_error_message(SclHandle handle) {
  if (!handle) return "";
  return static_cast<SclInstance*>(handle)->error_message.c_str();
}

size_t scl_error_line(SclHandle handle) {
  if (!handle) return 0;
  return static_cast<SclInstance*>(handle)->error_line;
}

// ============================================================================
// Scale Access
// ============================================================================

const char* scl_description(SclHandle handle) {
  if (!handle) return "";
  return static_cast<SclInstance*>(handle)->scale.description.c_str();
}

size_t scl_pitch_count(SclHandle handle) {
  if (!handle) return 0;
  return static_cast<SclInstance*>(handle)->scale.pitchCount();
}

const char* scl_pitch_text(SclHandle handle, size_t index) {
  if (!handle) return nullptr;
  auto* instance = static_cast<SclInstance*>(handle);
  if (index >= instance->scale.pitches.size()) return nullptr;

  instance->pitch_text = instance->scale.pitches[index].toString();
  return instance->pitch_text.c_str();
}

SclFreqData* scl_get_freqs(SclHandle handle, double base) {
  if (!handle) return nullptr;
  auto* instance = static_cast<SclInstance*>(handle);
  if (!instance->has_scale) return nullptr;

  std::vector<double> freqs = instance->scale.freqs(base);

  auto* result = static_cast<SclFreqData*>(malloc(sizeof(SclFreqData)));
  if (!result) return nullptr;

  result->count = freqs.size();
  result->freqs = static_cast<double*>(malloc(result->count * sizeof(double)));
  if (!result->freqs) {
    free(result);
    return nullptr;
  }

  memcpy(result->freqs, freqs.data(), result->count * sizeof(double));
  return result;
}

void scl_free_freqs(SclFreqData* data) {
  if (data) {
    free(data->freqs);
    free(data);
  }
}

// ============================================================================
// Writing
// ============================================================================

SclTextData* scl_write(SclHandle handle, const char* name) {
  if (!handle) return nullptr;
  auto* instance = static_cast<SclInstance*>(handle);
  if (!instance->has_scale) return nullptr;

  scl::SclWriter writer;
  writer.build(instance->scale, name ? std::string(name) : std::string());
  return makeTextData(writer.toString());
}

SclTextData* scl_get_json(SclHandle handle, double base) {
  if (!handle) return nullptr;
  auto* instance = static_cast<SclInstance*>(handle);
  if (!instance->has_scale) return nullptr;

  return makeTextData(scl::scaleToJson(instance->scale, base));
}

SclTextData* scl_render_from_json(SclHandle handle, const char* json, size_t length) {
  if (!handle || !json) return nullptr;
  auto* instance = static_cast<SclInstance*>(handle);
  if (!instance->has_scale) return nullptr;

  bool well_formed = false;
  auto kv = scl::parseJsonObject(json, length, &well_formed);
  if (!well_formed) return nullptr;
  scl::ToolConfig config = scl::configFromJson(kv);

  if (config.json_output) {
    return makeTextData(scl::scaleToJson(instance->scale, config.base_freq));
  }
  scl::SclWriter writer;
  writer.build(instance->scale, config.name);
  return makeTextData(writer.toString());
}

void scl_free_text(SclTextData* data) {
  if (data) {
    free(data->text);
    free(data);
  }
}

// ============================================================================
// Error Handling
// ============================================================================

const char* scl_error_string(SclError error) {
  switch (error) {
    case SCL_OK: return "No error";
    case SCL_ERROR_INVALID_PARAM: return "Invalid parameter";
    case SCL_ERROR_IO: return "I/O error";
    case SCL_ERROR_MALFORMED_COUNT: return "Malformed number of pitches";
    case SCL_ERROR_MALFORMED_RATIO: return "Malformed pitch ratio";
    case SCL_ERROR_MALFORMED_CENTS: return "Malformed cents value";
    case SCL_ERROR_PITCH_COUNT_MISMATCH: return "Pitch count does not match declared count";
  }
  return "Unknown error";
}

// ============================================================================
// Utilities
// ============================================================================

const char* scl_version(void) {
  return SCL_VERSION;
}

}  // extern "C"
