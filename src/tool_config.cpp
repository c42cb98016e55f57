/// @file
/// @brief ToolConfig loading from flat JSON.

#include "tool_config.h"

#include <cmath>
#include <fstream>
#include <sstream>

namespace scl {

void applyConfigJson(const JsonObject& object, ToolConfig& config) {
  const JsonValue* val = findJsonValue(object, "base_freq");
  if (val) {
    double base = val->asDouble(0.0);
    if (base > 0.0 && std::isfinite(base)) {
      config.base_freq = base;
    }
  }

  val = findJsonValue(object, "name");
  if (val && val->type == JsonValue::String) {
    config.name = val->string_val;
  }

  val = findJsonValue(object, "output");
  if (val && val->type == JsonValue::String) {
    config.output = val->string_val;
  }

  val = findJsonValue(object, "freqs");
  if (val) config.print_freqs = val->asBool(config.print_freqs);

  val = findJsonValue(object, "json");
  if (val) config.json_output = val->asBool(config.json_output);

  val = findJsonValue(object, "quiet");
  if (val) config.quiet = val->asBool(config.quiet);

  val = findJsonValue(object, "verbose");
  if (val) config.verbose = val->asBool(config.verbose);
}

ToolConfig configFromJson(const JsonObject& object) {
  ToolConfig config;
  applyConfigJson(object, config);
  return config;
}

bool loadConfigFile(const std::string& path, ToolConfig& config, std::string& error) {
  std::ifstream file(path);
  if (!file.is_open()) {
    error = "Failed to open config file: " + path;
    return false;
  }

  std::ostringstream contents;
  contents << file.rdbuf();
  if (file.bad()) {
    error = "Failed to read config file: " + path;
    return false;
  }

  std::string text = contents.str();
  bool well_formed = false;
  JsonObject object = parseJsonObject(text.data(), text.size(), &well_formed);
  if (!well_formed) {
    error = "Config file is not a JSON object: " + path;
    return false;
  }

  applyConfigJson(object, config);
  return true;
}

}  // namespace scl
