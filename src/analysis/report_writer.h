// Report output for analysis results -- console summary, JSON and CSV.

#ifndef MUSENT_ANALYSIS_REPORT_WRITER_H
#define MUSENT_ANALYSIS_REPORT_WRITER_H

#include <string>
#include <vector>

#include "analysis/piece_analyzer.h"

namespace musent {

/// @brief Generate the human-readable summary printed by the CLI.
/// @param result Analysis result.
/// @return Multi-line text ending with a newline.
std::string resultToTextSummary(const AnalysisResult& result);

/// @brief Serialize one result to pretty-printed JSON.
///
/// Keys: path, h0, hk, hmax, redundancy, lzc, lzc_normalized, ip, local
/// (array of {window, h0, hk}, or null when local metrics were not computed).
std::string resultToJson(const AnalysisResult& result);

/// @brief Global metrics table, one row per result.
/// @return CSV text with header path,h0,hk,hmax,redundancy,lzc,lzc_normalized,ip.
std::string resultsToCsv(const std::vector<AnalysisResult>& results);

/// @brief Local window table across all results that carry local metrics.
/// @return CSV text with header window,h0,hk,path; empty string if no result
///         has local metrics.
std::string localMetricsToCsv(const std::vector<AnalysisResult>& results);

/// @brief Quote a CSV field if it contains a comma, quote or line break.
std::string csvEscape(const std::string& field);

/// @brief Write text to a file, replacing any existing content.
/// @param path Destination path.
/// @param contents Text to write.
/// @param error Set to a description on failure.
/// @return False if the file could not be written.
bool writeTextFile(const std::string& path, const std::string& contents, std::string& error);

}  // namespace musent

#endif  // MUSENT_ANALYSIS_REPORT_WRITER_H
