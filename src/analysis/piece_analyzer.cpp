/// @file
/// @brief Piece and folder analysis.

#include "analysis/piece_analyzer.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <limits>
#include <system_error>

#include "core/encoding.h"
#include "core/json_parser.h"
#include "loader/text_loader.h"
#include "metrics/complexity.h"
#include "metrics/entropy.h"
#include "midi/midi_loader.h"

namespace musent {

// ---------------------------------------------------------------------------
// InputType
// ---------------------------------------------------------------------------

const char* inputTypeToString(InputType type) {
  switch (type) {
    case InputType::Midi: return "midi";
    case InputType::Json: return "json";
    case InputType::Csv:  return "csv";
  }
  return "unknown";
}

bool inputTypeFromString(const std::string& name, InputType& type) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char chr) { return static_cast<char>(std::tolower(chr)); });
  if (lower == "midi") {
    type = InputType::Midi;
  } else if (lower == "json") {
    type = InputType::Json;
  } else if (lower == "csv") {
    type = InputType::Csv;
  } else {
    return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// AnalysisConfig
// ---------------------------------------------------------------------------

std::string AnalysisConfig::validate() const {
  if (markov_order < 0) return "markov_order must be non-negative.";
  if (window_size <= 0 || window_step <= 0) {
    return "window_size and step must be positive integers.";
  }
  if (!(time_unit > 0.0)) return "time_unit must be positive.";
  return "";
}

bool applyConfigJson(const std::string& json, AnalysisConfig& config, std::string& error) {
  bool parsed = false;
  auto kv = parseJsonObject(json.data(), json.size(), &parsed);
  if (!parsed) {
    error = "Config is not a valid JSON object.";
    return false;
  }

  auto readNumber = [&](const char* key, double& out) {
    auto it = kv.find(key);
    if (it == kv.end()) return true;
    if (it->second.type != JsonValue::Number) {
      error = std::string("Config key '") + key + "' must be a number.";
      return false;
    }
    out = it->second.number_val;
    return true;
  };

  // Integral and within int range; 2.5 or 1e10 are rejected, not truncated.
  auto readInteger = [&](const char* key, int& out) {
    double value = 0.0;
    auto it = kv.find(key);
    if (it == kv.end()) return true;
    if (!readNumber(key, value)) return false;
    if (std::trunc(value) != value ||
        value < static_cast<double>(std::numeric_limits<int>::min()) ||
        value > static_cast<double>(std::numeric_limits<int>::max())) {
      error = std::string("Config key '") + key + "' must be an integer.";
      return false;
    }
    out = static_cast<int>(value);
    return true;
  };

  int markov_order = config.markov_order;
  int window_size = config.window_size;
  int window_step = config.window_step;
  double time_unit = config.time_unit;
  if (!readInteger("markov_order", markov_order) || !readInteger("window_size", window_size) ||
      !readInteger("window_step", window_step) || !readNumber("time_unit", time_unit)) {
    return false;
  }

  auto local_it = kv.find("compute_local");
  if (local_it != kv.end()) {
    if (local_it->second.type != JsonValue::Bool) {
      error = "Config key 'compute_local' must be a boolean.";
      return false;
    }
    config.compute_local = local_it->second.bool_val;
  }

  config.markov_order = markov_order;
  config.window_size = window_size;
  config.window_step = window_step;
  config.time_unit = time_unit;
  return true;
}

// ---------------------------------------------------------------------------
// Analysis
// ---------------------------------------------------------------------------

AnalysisResult analyzeSequences(const std::vector<Symbol>& melody,
                                const std::vector<int>& rhythm,
                                const AnalysisConfig& config) {
  AnalysisResult result;
  result.melody_length = melody.size();
  result.rhythm_length = rhythm.size();
  result.alphabet_size = alphabetSize(melody);

  result.h0 = shannonEntropy(melody);
  result.hk = markovEntropy(melody, config.markov_order);
  result.hmax = maxEntropy(result.alphabet_size);
  result.redundancy = redundancy(result.hmax, result.hk);
  result.lzc = lempelZivComplexity(rhythm);
  result.lzc_normalized = normalizedLzc(rhythm);
  result.ip = predictabilityIndex(result.hk, result.hmax);

  if (config.compute_local) {
    auto windows = slidingWindowEntropies(melody, config.window_size, config.window_step,
                                          config.markov_order);
    result.has_local = true;
    result.local.reserve(windows.size());
    for (size_t idx = 0; idx < windows.size(); ++idx) {
      LocalWindowMetrics entry;
      entry.window = static_cast<int>(idx);
      entry.h0 = windows[idx].h0;
      entry.hk = windows[idx].hk;
      result.local.push_back(entry);
    }
  }

  result.success = true;
  return result;
}

AnalysisResult analyzePiece(const std::string& path, InputType type,
                            const AnalysisConfig& config) {
  AnalysisResult failed;
  failed.path = path;

  std::string config_error = config.validate();
  if (!config_error.empty()) {
    failed.error_message = config_error;
    return failed;
  }

  std::vector<Symbol> melody;
  std::vector<int> rhythm;

  if (type == InputType::Midi) {
    MidiLoader loader;
    if (!loader.load(path, config.time_unit)) {
      failed.error_message = loader.getError();
      return failed;
    }
    melody = symbolsFromInts(loader.getSequence().melody);
    rhythm = standardizeRhythm(loader.getSequence().rhythm);
  } else {
    TextLoader loader;
    if (!loader.load(path)) {
      failed.error_message = loader.getError();
      return failed;
    }
    EncodedSequences encoded =
        encodeSequences(loader.getSequence().melody, loader.getSequence().rhythm);
    melody = std::move(encoded.melody);
    rhythm = std::move(encoded.rhythm);
  }

  AnalysisResult result = analyzeSequences(melody, rhythm, config);
  result.path = path;
  return result;
}

// ---------------------------------------------------------------------------
// Folder analysis
// ---------------------------------------------------------------------------

namespace {

bool globMatchAt(const std::string& pattern, size_t pat_pos,
                 const std::string& name, size_t name_pos) {
  while (pat_pos < pattern.size()) {
    char pat_chr = pattern[pat_pos];
    if (pat_chr == '*') {
      // Collapse runs of '*', then try every split point.
      while (pat_pos < pattern.size() && pattern[pat_pos] == '*') ++pat_pos;
      if (pat_pos == pattern.size()) return true;
      for (size_t pos = name_pos; pos <= name.size(); ++pos) {
        if (globMatchAt(pattern, pat_pos, name, pos)) return true;
      }
      return false;
    }
    if (name_pos >= name.size()) return false;
    if (pat_chr != '?' && pat_chr != name[name_pos]) return false;
    ++pat_pos;
    ++name_pos;
  }
  return name_pos == name.size();
}

/// @brief Whether a file extension is accepted for the input type.
bool acceptsExtension(InputType type, std::string ext) {
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char chr) { return static_cast<char>(std::tolower(chr)); });
  switch (type) {
    case InputType::Midi: return ext == ".mid" || ext == ".midi";
    case InputType::Json: return ext == ".json";
    case InputType::Csv:  return ext == ".csv";
  }
  return false;
}

}  // namespace

bool globMatch(const std::string& pattern, const std::string& name) {
  return globMatchAt(pattern, 0, name, 0);
}

BatchResult analyzeFolder(const std::string& folder, InputType type,
                          const AnalysisConfig& config, const std::string& pattern,
                          bool verbose) {
  namespace fs = std::filesystem;
  BatchResult batch;

  std::string config_error = config.validate();
  if (!config_error.empty()) {
    batch.error_message = config_error;
    return batch;
  }

  std::error_code ec;
  if (!fs::is_directory(folder, ec)) {
    batch.error_message = "Folder not found: " + folder;
    return batch;
  }

  std::vector<fs::path> candidates;
  for (fs::directory_iterator it(folder, ec), end; !ec && it != end; it.increment(ec)) {
    const fs::directory_entry& entry = *it;
    std::error_code type_ec;
    if (entry.is_directory(type_ec)) continue;
    if (!globMatch(pattern, entry.path().filename().string())) continue;
    if (!acceptsExtension(type, entry.path().extension().string())) continue;
    candidates.push_back(entry.path());
  }
  if (ec) {
    batch.error_message = "Failed to list folder " + folder + ": " + ec.message();
    return batch;
  }
  std::sort(candidates.begin(), candidates.end());

  for (const auto& path : candidates) {
    if (verbose) {
      std::fprintf(stderr, "[analyzeFolder] analyzing %s\n", path.string().c_str());
    }
    AnalysisResult result = analyzePiece(path.string(), type, config);
    if (!result.success) {
      std::fprintf(stderr, "[analyzeFolder] WARNING: skipping %s: %s\n",
                   path.string().c_str(), result.error_message.c_str());
      continue;
    }
    batch.results.push_back(std::move(result));
  }

  batch.success = true;
  return batch;
}

}  // namespace musent
