/// @file
/// @brief CLI entry point for the Scala scale tool.

#include <cstdio>
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

/// Exit codes.
constexpr int kExitOk = 0;
constexpr int kExitReadFailed = 1;
constexpr int kExitUsage = 2;

/// @brief Command-line options parsed from argv.
struct CliOptions {
  scl::ToolConfig config;
  std::vector<std::string> files;
  bool help = false;
};

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("scl_cli - Scala scale file tool\n\n");
  std::printf("Usage: scl_cli [options] FILE...\n\n");
  std::printf("Options:\n");
  std::printf("  --base HZ        Base frequency for frequency tables (default 440)\n");
  std::printf("  --name NAME      Attribution name written as a header comment with -o\n");
  std::printf("  --config FILE    JSON config file (later flags override it)\n");
  std::printf("  --freqs          Print the frequency table of each file\n");
  std::printf("  --json           Print each scale as JSON\n");
  std::printf("  --quiet          Only report failures\n");
  std::printf("  --verbose        Log progress to stderr\n");
  std::printf("  -o FILE          Re-write the input scale in canonical form\n");
  std::printf("  --help           Show this help\n");
}

/// @brief Parse command-line arguments into CliOptions.
/// @param argc Argument count from main().
/// @param argv Argument vector from main().
/// @param opts Output structure populated with parsed values.
/// @return False on a usage error (already reported to stderr).
bool parseArgs(int argc, char* argv[], CliOptions& opts) {
  for (int idx = 1; idx < argc; ++idx) {
    const char* arg = argv[idx];
    bool has_value = idx + 1 < argc;

    if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      opts.help = true;
      return true;
    }
    if (std::strcmp(arg, "--base") == 0 && has_value) {
      const char* text = argv[++idx];
      char* end = nullptr;
      double base = std::strtod(text, &end);
      if (end == text || *end != '\0' || !(base > 0.0)) {
        std::fprintf(stderr, "Error: invalid base frequency: %s\n", text);
        return false;
      }
      opts.config.base_freq = base;
    } else if (std::strcmp(arg, "--name") == 0 && has_value) {
      opts.config.name = argv[++idx];
    } else if (std::strcmp(arg, "--config") == 0 && has_value) {
      std::string error;
      if (!scl::loadConfigFile(argv[++idx], opts.config, error)) {
        std::fprintf(stderr, "Error: %s\n", error.c_str());
        return false;
      }
    } else if (std::strcmp(arg, "-o") == 0 && has_value) {
      opts.config.output = argv[++idx];
    } else if (std::strcmp(arg, "--freqs") == 0) {
      opts.config.print_freqs = true;
    } else if (std::strcmp(arg, "--json") == 0) {
      opts.config.json_output = true;
    } else if (std::strcmp(arg, "--quiet") == 0) {
      opts.config.quiet = true;
    } else if (std::strcmp(arg, "--verbose") == 0) {
      opts.config.verbose = true;
    } else if (arg[0] == '-' && arg[1] != '\0') {
      std::fprintf(stderr, "Error: unknown or incomplete option: %s\n", arg);
      return false;
    } else {
      opts.files.push_back(arg);
    }
  }

  if (opts.files.empty()) {
    std::fprintf(stderr, "Error: no input files\n");
    return false;
  }
  if (!opts.config.output.empty() && opts.files.size() != 1) {
    std::fprintf(stderr, "Error: -o requires exactly one input file\n");
    return false;
  }
  return true;
}

/// @brief Print the frequency table: degree, pitch text, frequency.
void printFreqs(const scl::Scale& scale, double base) {
  std::vector<double> freqs = scale.freqs(base);
  std::printf("  0\t1/1\t%.6f\n", freqs[0]);
  for (size_t idx = 0; idx < scale.pitches.size(); ++idx) {
    std::printf("  %zu\t%s\t%.6f\n", idx + 1, scale.pitches[idx].toString().c_str(),
                freqs[idx + 1]);
  }
}

/// @brief Read, report, and optionally re-write one scale file.
/// @return True if the file was read (and written, if requested) successfully.
bool processFile(const std::string& path, const scl::ToolConfig& config) {
  if (config.verbose) {
    std::fprintf(stderr, "[scl_cli] reading %s\n", path.c_str());
  }

  scl::SclReader reader;
  if (!reader.read(path)) {
    std::fprintf(stderr, "%s: %s\n", path.c_str(), reader.getError().c_str());
    if (config.verbose) {
      std::fprintf(stderr, "[scl_cli] %s failed (%s)\n", path.c_str(),
                   scl::errorKindToString(reader.getErrorKind()));
    }
    return false;
  }

  const scl::Scale& scale = reader.getScale();
  if (scale.description.empty()) {
    std::fprintf(stderr, "Warning: %s: empty description\n", path.c_str());
  }

  if (config.json_output) {
    std::printf("%s\n", scl::scaleToJson(scale, config.base_freq, true).c_str());
  } else if (!config.quiet) {
    std::printf("%s: %s (%zu pitches)\n", path.c_str(), scale.description.c_str(),
                scale.pitchCount());
    if (config.print_freqs) {
      printFreqs(scale, config.base_freq);
    }
  }

  if (!config.output.empty()) {
    scl::SclWriter writer;
    writer.build(scale, config.name);
    if (!writer.writeToFile(config.output)) {
      std::fprintf(stderr, "Error: failed to write %s\n", config.output.c_str());
      return false;
    }
    if (config.verbose) {
      std::fprintf(stderr, "[scl_cli] wrote %s\n", config.output.c_str());
    }
  }

  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  if (!parseArgs(argc, argv, opts)) {
    return kExitUsage;
  }
  if (opts.help) {
    printUsage();
    return kExitOk;
  }

  if (opts.config.verbose) {
    std::fprintf(stderr, "[scl_cli] v%s, base %.3f Hz, %zu file(s)\n", SCL_VERSION,
                 opts.config.base_freq, opts.files.size());
  }

  size_t failures = 0;
  for (const auto& path : opts.files) {
    if (!processFile(path, opts.config)) {
      ++failures;
    }
  }

  if (opts.files.size() > 1 && !opts.config.json_output && !opts.config.quiet) {
    std::printf("\n%zu of %zu file(s) read successfully\n", opts.files.size() - failures,
                opts.files.size());
  }

  return failures == 0 ? kExitOk : kExitReadFailed;
}
