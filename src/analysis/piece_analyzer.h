// Piece analyzer -- loads a piece (MIDI, JSON or CSV), standardizes its
// melody and rhythm, and computes the full metric record.

#ifndef MUSENT_ANALYSIS_PIECE_ANALYZER_H
#define MUSENT_ANALYSIS_PIECE_ANALYZER_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/symbol.h"

namespace musent {

/// Kind of input file a piece is read from.
enum class InputType : uint8_t {
  Midi,
  Json,
  Csv
};

/// @brief Convert InputType to its CLI name ("midi", "json", "csv").
const char* inputTypeToString(InputType type);

/// @brief Parse a CLI input type name (case-insensitive).
/// @param name Input type name.
/// @param type Output value, untouched on failure.
/// @return False if the name is not one of midi, json, csv.
bool inputTypeFromString(const std::string& name, InputType& type);

/// Parameters of a piece analysis.
struct AnalysisConfig {
  int markov_order = 1;      ///< Context length k for Hk.
  int window_size = 16;      ///< Symbols per local window.
  int window_step = 8;       ///< Distance between local window starts.
  double time_unit = 0.25;   ///< MIDI rhythm grid resolution in beats.
  bool compute_local = false;

  /// @brief Check the parameters before running an analysis.
  /// @return Empty string if valid, otherwise a description of the problem.
  std::string validate() const;
};

/// @brief Overlay config values from a flat JSON object.
///
/// Recognized keys mirror the AnalysisConfig members. Unknown keys are
/// ignored; present keys of the wrong type are an error.
///
/// @param json JSON text.
/// @param config Config to update in place.
/// @param error Set to a description on failure.
/// @return False if the text is not a JSON object or a key has the wrong type.
bool applyConfigJson(const std::string& json, AnalysisConfig& config, std::string& error);

/// Entropy of one local window.
struct LocalWindowMetrics {
  int window = 0;
  double h0 = 0.0;
  double hk = 0.0;
};

/// Full metric record of one piece.
struct AnalysisResult {
  bool success = false;
  std::string error_message;
  std::string path;

  double h0 = 0.0;              ///< Order-0 entropy of the melody (bits).
  double hk = 0.0;              ///< Order-k conditional entropy of the melody.
  double hmax = 0.0;            ///< log2 of the melody alphabet size.
  double redundancy = 0.0;      ///< max(0, hmax - hk).
  int lzc = 0;                  ///< LZ76 phrase count of the rhythm.
  double lzc_normalized = 0.0;  ///< LZ76 count scaled into [0,1].
  double ip = 0.0;              ///< Predictability index 1 - hk/hmax.

  size_t melody_length = 0;
  size_t rhythm_length = 0;
  int alphabet_size = 0;

  bool has_local = false;
  std::vector<LocalWindowMetrics> local;
};

/// Results of a folder analysis.
struct BatchResult {
  bool success = false;
  std::string error_message;
  std::vector<AnalysisResult> results;
};

/// @brief Compute all metrics for standardized sequences.
///
/// The config must be valid (see AnalysisConfig::validate()).
///
/// @param melody Standardized melody symbols.
/// @param rhythm Binary rhythm grid.
/// @param config Analysis parameters.
/// @return Metric record with success = true.
AnalysisResult analyzeSequences(const std::vector<Symbol>& melody,
                                const std::vector<int>& rhythm,
                                const AnalysisConfig& config);

/// @brief Load and analyze a single piece.
/// @param path Input file.
/// @param type How to read the file.
/// @param config Analysis parameters.
/// @return Metric record; success = false with error_message if the config
///         is invalid or the file cannot be loaded.
AnalysisResult analyzePiece(const std::string& path, InputType type,
                            const AnalysisConfig& config);

/// @brief Match a file name against a glob pattern ('*' and '?').
///
/// Wildcards match a leading '.', so "*" selects hidden files too.
bool globMatch(const std::string& pattern, const std::string& name);

/// @brief Analyze all compatible files in a folder.
///
/// Files are visited in sorted path order; hidden files are included when
/// the pattern matches them. MIDI runs accept .mid/.midi,
/// JSON and CSV runs accept only their own extension. Pieces that fail to
/// load are reported on stderr and skipped.
///
/// @param folder Folder to scan (not recursive).
/// @param type Input file type.
/// @param config Analysis parameters.
/// @param pattern Glob applied to file names.
/// @param verbose Log each processed file to stderr.
/// @return Successful piece results; success = false if the folder is
///         missing or the config is invalid.
BatchResult analyzeFolder(const std::string& folder, InputType type,
                          const AnalysisConfig& config,
                          const std::string& pattern = "*", bool verbose = false);

}  // namespace musent

#endif  // MUSENT_ANALYSIS_PIECE_ANALYZER_H
