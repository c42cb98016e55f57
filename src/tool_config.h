// Tool configuration shared by the CLI and the C API.

#ifndef SCL_TOOL_CONFIG_H
#define SCL_TOOL_CONFIG_H

#include <string>

#include "core/json_parser.h"
#include "core/scale.h"

namespace scl {

/// @brief Options controlling how scales are reported and re-written.
struct ToolConfig {
  double base_freq = kDefaultBaseFreq;  ///< Base frequency for frequency tables (Hz).
  std::string name;                     ///< Attribution header for written files.
  bool print_freqs = false;             ///< Print the frequency table of each scale.
  bool json_output = false;             ///< Report scales as JSON.
  bool quiet = false;                   ///< Only report failures.
  bool verbose = false;                 ///< Log progress to stderr.
  std::string output;                   ///< Canonical re-write target (empty = none).
};

/// @brief Apply values from a parsed JSON object on top of a config.
///
/// Keys: base_freq (number > 0), name (string), freqs, json, quiet,
/// verbose (bool), output (string). Unknown keys are ignored; values of the
/// wrong type or out of range leave the field unchanged.
///
/// @param object Parsed flat JSON object.
/// @param config Config to update in place.
void applyConfigJson(const JsonObject& object, ToolConfig& config);

/// @brief Build a config from a parsed JSON object, starting from defaults.
ToolConfig configFromJson(const JsonObject& object);

/// @brief Load a JSON config file on top of a config.
/// @param path Config file path.
/// @param config Config to update in place.
/// @param error Output message on failure.
/// @return False if the file cannot be read or is not a JSON object.
bool loadConfigFile(const std::string& path, ToolConfig& config, std::string& error);

}  // namespace scl

#endif  // SCL_TOOL_CONFIG_H
