/// @file
/// @brief CLI entry point for the music entropy analyzer.

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "analysis/piece_analyzer.h"
#include "analysis/report_writer.h"
#include "core/encoding.h"
#include "loader/text_loader.h"

namespace {

enum class Command { None, Analyze, AnalyzeBatch };

/// @brief Command-line options parsed from argv.
struct CliOptions {
  Command command = Command::None;
  std::string input;
  bool input_type_specified = false;
  musent::InputType input_type = musent::InputType::Json;
  std::string pattern = "*";
  std::string config_path;
  std::string output_csv;
  std::string local_csv;
  std::string output_json;
  bool verbose = false;

  // Explicit flags win over --config values.
  bool markov_order_set = false;
  int markov_order = 1;
  bool window_size_set = false;
  int window_size = 16;
  bool window_step_set = false;
  int window_step = 8;
  bool time_unit_set = false;
  double time_unit = 0.25;
  bool local = false;
};

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("musent_cli - entropy and complexity metrics for symbolic music\n\n");
  std::printf("Usage:\n");
  std::printf("  musent_cli analyze --input FILE --input-type TYPE [options]\n");
  std::printf("  musent_cli analyze-batch --input DIR --input-type TYPE [options]\n\n");
  std::printf("Options:\n");
  std::printf("  --input PATH        Input file (analyze) or folder (analyze-batch)\n");
  std::printf("  --input-type TYPE   midi, json or csv\n");
  std::printf("  --pattern GLOB      File name pattern inside the folder (default *)\n");
  std::printf("  --markov-order N    Markov order k (default 1)\n");
  std::printf("  --window-size N     Window size for local metrics (default 16)\n");
  std::printf("  --window-step N     Stride for local metrics (default 8)\n");
  std::printf("  --time-unit X       Beat resolution for MIDI rhythm grid (default 0.25)\n");
  std::printf("  --local             Compute local entropies\n");
  std::printf("  --config FILE       JSON config (explicit flags take precedence)\n");
  std::printf("  --output-csv FILE   Save global metrics CSV\n");
  std::printf("  --local-csv FILE    Save local metrics CSV\n");
  std::printf("  --output-json FILE  Save JSON summary (analyze only)\n");
  std::printf("  --verbose           Log progress to stderr\n");
  std::printf("  --help              Show this help\n");
}

/// @brief Parse an integer option value; rejects garbage and values
///        outside the int range.
bool parseIntArg(const char* text, int& out) {
  auto value = musent::parseInteger(text);
  if (!value) return false;
  out = *value;
  return true;
}

/// @brief Parse a floating-point option value, rejecting trailing garbage.
bool parseDoubleArg(const char* text, double& out) {
  char* end = nullptr;
  double value = std::strtod(text, &end);
  if (end == text || *end != '\0') return false;
  out = value;
  return true;
}

/// @brief Parse command-line arguments into CliOptions.
/// @param argc Argument count from main().
/// @param argv Argument vector from main().
/// @param opts Output structure populated with parsed values.
/// @param error Set when parsing fails.
/// @return False on --help or a parse error (error is empty for --help).
bool parseArgs(int argc, char* argv[], CliOptions& opts, std::string& error) {
  if (argc < 2) {
    printUsage();
    error = "missing command";
    return false;
  }

  int first = 1;
  if (std::strcmp(argv[1], "analyze") == 0) {
    opts.command = Command::Analyze;
    first = 2;
  } else if (std::strcmp(argv[1], "analyze-batch") == 0) {
    opts.command = Command::AnalyzeBatch;
    first = 2;
  }

  for (int idx = first; idx < argc; ++idx) {
    const char* arg = argv[idx];
    bool has_value = idx + 1 < argc;

    if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      printUsage();
      return false;
    }
    if (std::strcmp(arg, "--input") == 0 && has_value) {
      opts.input = argv[++idx];
    } else if (std::strcmp(arg, "--input-type") == 0 && has_value) {
      const char* val = argv[++idx];
      if (!musent::inputTypeFromString(val, opts.input_type)) {
        error = std::string("invalid --input-type '") + val + "' (choose midi, json, csv)";
        return false;
      }
      opts.input_type_specified = true;
    } else if (std::strcmp(arg, "--pattern") == 0 && has_value) {
      opts.pattern = argv[++idx];
    } else if (std::strcmp(arg, "--markov-order") == 0 && has_value) {
      if (!parseIntArg(argv[++idx], opts.markov_order)) {
        error = "--markov-order expects an integer";
        return false;
      }
      opts.markov_order_set = true;
    } else if (std::strcmp(arg, "--window-size") == 0 && has_value) {
      if (!parseIntArg(argv[++idx], opts.window_size)) {
        error = "--window-size expects an integer";
        return false;
      }
      opts.window_size_set = true;
    } else if (std::strcmp(arg, "--window-step") == 0 && has_value) {
      if (!parseIntArg(argv[++idx], opts.window_step)) {
        error = "--window-step expects an integer";
        return false;
      }
      opts.window_step_set = true;
    } else if (std::strcmp(arg, "--time-unit") == 0 && has_value) {
      if (!parseDoubleArg(argv[++idx], opts.time_unit)) {
        error = "--time-unit expects a number";
        return false;
      }
      opts.time_unit_set = true;
    } else if (std::strcmp(arg, "--local") == 0) {
      opts.local = true;
    } else if (std::strcmp(arg, "--config") == 0 && has_value) {
      opts.config_path = argv[++idx];
    } else if (std::strcmp(arg, "--output-csv") == 0 && has_value) {
      opts.output_csv = argv[++idx];
    } else if (std::strcmp(arg, "--local-csv") == 0 && has_value) {
      opts.local_csv = argv[++idx];
    } else if (std::strcmp(arg, "--output-json") == 0 && has_value) {
      opts.output_json = argv[++idx];
    } else if (std::strcmp(arg, "--verbose") == 0) {
      opts.verbose = true;
    } else {
      error = std::string("unrecognized argument '") + arg + "'";
      return false;
    }
  }

  if (opts.command == Command::None) {
    error = "expected command 'analyze' or 'analyze-batch'";
    return false;
  }
  if (opts.input.empty()) {
    error = "--input is required";
    return false;
  }
  if (!opts.input_type_specified) {
    error = "--input-type is required";
    return false;
  }
  return true;
}

/// @brief Build an AnalysisConfig: defaults, then --config, then flags.
/// @return False (with error set) if the config file is unreadable or invalid.
bool buildAnalysisConfig(const CliOptions& opts, musent::AnalysisConfig& config,
                         std::string& error) {
  if (!opts.config_path.empty()) {
    std::string json;
    if (!musent::readFileToString(opts.config_path, json)) {
      error = "Config file not found: " + opts.config_path;
      return false;
    }
    if (!musent::applyConfigJson(json, config, error)) {
      return false;
    }
  }

  if (opts.markov_order_set) config.markov_order = opts.markov_order;
  if (opts.window_size_set) config.window_size = opts.window_size;
  if (opts.window_step_set) config.window_step = opts.window_step;
  if (opts.time_unit_set) config.time_unit = opts.time_unit;
  if (opts.local) config.compute_local = true;

  error = config.validate();
  return error.empty();
}

/// @brief Write a report file, logging the outcome.
/// @return False if the file could not be written.
bool saveReport(const std::string& path, const std::string& contents, const char* label) {
  std::string error;
  if (!musent::writeTextFile(path, contents, error)) {
    std::fprintf(stderr, "Error: %s\n", error.c_str());
    return false;
  }
  std::printf("%s saved: %s\n", label, path.c_str());
  return true;
}

int handleAnalyze(const CliOptions& opts, const musent::AnalysisConfig& config) {
  musent::AnalysisResult result = musent::analyzePiece(opts.input, opts.input_type, config);
  if (!result.success) {
    std::fprintf(stderr, "Error: %s\n", result.error_message.c_str());
    return 1;
  }

  std::printf("%s", musent::resultToTextSummary(result).c_str());

  const std::vector<musent::AnalysisResult> results = {result};
  bool ok = true;
  if (!opts.output_csv.empty()) {
    ok = saveReport(opts.output_csv, musent::resultsToCsv(results), "Global metrics CSV") && ok;
  }
  if (!opts.local_csv.empty() && result.has_local) {
    ok = saveReport(opts.local_csv, musent::localMetricsToCsv(results), "Local metrics CSV") && ok;
  }
  if (!opts.output_json.empty()) {
    ok = saveReport(opts.output_json, musent::resultToJson(result), "JSON summary") && ok;
  }
  return ok ? 0 : 1;
}

int handleAnalyzeBatch(const CliOptions& opts, const musent::AnalysisConfig& config) {
  musent::BatchResult batch = musent::analyzeFolder(opts.input, opts.input_type, config,
                                                    opts.pattern, opts.verbose);
  if (!batch.success) {
    std::fprintf(stderr, "Error: %s\n", batch.error_message.c_str());
    return 1;
  }
  if (batch.results.empty()) {
    std::fprintf(stderr, "No files processed.\n");
    return 1;
  }

  for (const auto& result : batch.results) {
    std::printf("%s", musent::resultToTextSummary(result).c_str());
  }

  bool ok = true;
  if (!opts.output_csv.empty()) {
    ok = saveReport(opts.output_csv, musent::resultsToCsv(batch.results),
                    "Batch results CSV") && ok;
  }
  if (!opts.local_csv.empty()) {
    std::string local_csv = musent::localMetricsToCsv(batch.results);
    if (!local_csv.empty()) {
      ok = saveReport(opts.local_csv, local_csv, "Local metrics CSV") && ok;
    }
  }
  if (!opts.output_json.empty()) {
    std::fprintf(stderr, "[musent_cli] WARNING: --output-json is ignored for analyze-batch\n");
  }
  return ok ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  std::string error;
  if (!parseArgs(argc, argv, opts, error)) {
    if (error.empty()) return 0;  // --help
    std::fprintf(stderr, "Error: %s\n", error.c_str());
    return 1;
  }

  musent::AnalysisConfig config;
  if (!buildAnalysisConfig(opts, config, error)) {
    std::fprintf(stderr, "Error: %s\n", error.c_str());
    return 1;
  }

  if (opts.verbose) {
    std::fprintf(stderr, "[musent_cli] input=%s type=%s k=%d window=%d step=%d unit=%.4f local=%s\n",
                 opts.input.c_str(), musent::inputTypeToString(opts.input_type),
                 config.markov_order, config.window_size, config.window_step,
                 config.time_unit, config.compute_local ? "yes" : "no");
  }

  if (opts.command == Command::Analyze) {
    return handleAnalyze(opts, config);
  }
  return handleAnalyzeBatch(opts, config);
}
