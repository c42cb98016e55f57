// C API for WASM and FFI bindings.

#ifndef SCL_C_H
#define SCL_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Handle and Error Definitions
// ============================================================================

/// @brief Opaque handle to a scale instance.
typedef void* SclHandle;

/// @brief Error codes returned by API functions.
typedef enum {
  SCL_OK = 0,
  SCL_ERROR_INVALID_PARAM = 1,
  SCL_ERROR_IO = 2,
  SCL_ERROR_MALFORMED_COUNT = 3,
  SCL_ERROR_MALFORMED_RATIO = 4,
  SCL_ERROR_MALFORMED_CENTS = 5,
  SCL_ERROR_PITCH_COUNT_MISMATCH = 6,
} SclError;

// ============================================================================
// Output Data Structures
// ============================================================================

/// @brief Frequency table output.
typedef struct {
  double* freqs;  ///< base followed by one frequency per pitch
  size_t count;   ///< Number of entries (pitch count + 1)
} SclFreqData;

/// @brief Text output (scale file text or JSON).
typedef struct {
  char* text;     ///< NUL-terminated text
  size_t length;  ///< Text length, excluding the terminator
} SclTextData;

// ============================================================================
// Lifecycle
// ============================================================================

/// @brief Create a new, empty scale instance.
/// @return Handle (must be freed with scl_destroy)
SclHandle scl_create(void);

/// @brief Destroy a scale instance.
/// @param handle Handle to destroy
void scl_destroy(SclHandle handle);

// ============================================================================
// Reading
// ============================================================================

/// @brief Parse scale file text into the instance.
///
/// On failure the instance holds no scale; scl_error_message() and
/// scl_error_line() describe the problem.
///
/// @param handle Scale instance
/// @param text Scale file contents (need not be NUL-terminated)
/// @param length Length of text in bytes
/// @return SCL_OK or the error kind
SclError scl_read(SclHandle handle, const char* text, size_t length);

/// @brief Parse a scale file from disk into the instance.
/// @param handle Scale instance
/// @param path NUL-terminated file path
/// @return SCL_OK or the error kind
SclError scl_read_file(SclHandle handle, const char* path);

/// @brief Message of the last failed read (static per handle, do not free).
const char* scl_error_message(SclHandle handle);

/// @brief 1-based line number of the last failed read, 0 if not line-specific.
size_t scl_error_line(SclHandle handle);

// ============================================================================
// Scale Access
// ============================================================================

/// @brief Description of the loaded scale (do not free). Empty if none loaded.
const char* scl_description(SclHandle handle);

/// @brief Number of pitches in the loaded scale.
size_t scl_pitch_count(SclHandle handle);

/// @brief Canonical text of one pitch (e.g. "5/4", "386.313714").
/// @param handle Scale instance
/// @param index Pitch index (0-based)
/// @return Text valid until the next call on this handle, or NULL if out of range
const char* scl_pitch_text(SclHandle handle, size_t index);

/// @brief Frequency table of the loaded scale.
/// @param handle Scale instance
/// @param base Base frequency in Hz
/// @return Allocated table (free with scl_free_freqs), or NULL if no scale is loaded
SclFreqData* scl_get_freqs(SclHandle handle, double base);

/// @brief Free a frequency table returned by scl_get_freqs.
void scl_free_freqs(SclFreqData* data);

// ============================================================================
// Writing
// ============================================================================

/// @brief Serialize the loaded scale as scale file text.
/// @param handle Scale instance
/// @param name Attribution header, or NULL / "" for none
/// @return Allocated text (free with scl_free_text), or NULL if no scale is loaded
SclTextData* scl_write(SclHandle handle, const char* name);

/// @brief Export the loaded scale and its frequencies as JSON.
/// @param handle Scale instance
/// @param base Base frequency in Hz
/// @return Allocated text (free with scl_free_text), or NULL if no scale is loaded
SclTextData* scl_get_json(SclHandle handle, double base);

/// @brief Render the loaded scale as selected by a JSON tool config.
///
/// JSON keys (all optional, same as the scl_cli config file):
///   json: bool (true = JSON export, false = scale file text)
///   base_freq: number (Hz, used by the JSON export)
///   name: string (attribution header of the scale file text)
/// Other config keys are accepted and ignored.
///
/// @param handle Scale instance
/// @param json JSON config string
/// @param length Length of the JSON string
/// @return Allocated text (free with scl_free_text), or NULL if no scale is
///         loaded or the config is not a JSON object
SclTextData* scl_render_from_json(SclHandle handle, const char* json, size_t length);

/// @brief Free text returned by scl_write, scl_get_json or scl_render_from_json.
void scl_free_text(SclTextData* data);

// ============================================================================
// Error Handling
// ============================================================================

/// @brief Get error message for error code.
/// @param error Error code
/// @return Error message (static, do not free)
const char* scl_error_string(SclError error);

// ============================================================================
// Utilities
// ============================================================================

/// @brief Get library version string.
/// @return Version (e.g., "0.1.0")
const char* scl_version(void);

#ifdef __cplusplus
}
#endif

#endif  // SCL_C_H
