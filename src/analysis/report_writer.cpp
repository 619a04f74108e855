/// @file
/// @brief Analysis report formatting: text summary, JSON and CSV.

#include "analysis/report_writer.h"

#include <cstdio>
#include <fstream>
#include <sstream>

#include "core/json_helpers.h"

namespace musent {

namespace {

/// @brief Format a metric with 4 decimals.
std::string fixed4(double value) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.4f", value);
  return buf;
}

/// @brief Format a metric for CSV without losing precision.
std::string csvNumber(double value) {
  std::ostringstream oss;
  oss.precision(12);
  oss << value;
  return oss.str();
}

}  // namespace

std::string resultToTextSummary(const AnalysisResult& result) {
  std::string text;
  text += "File: " + result.path + "\n";
  text += "  H0: " + fixed4(result.h0) + "\n";
  text += "  Hk (order): " + fixed4(result.hk) + "\n";
  text += "  Hmax: " + fixed4(result.hmax) + "\n";
  text += "  Redundancy: " + fixed4(result.redundancy) + "\n";
  text += "  LZC: " + std::to_string(result.lzc) + "\n";
  text += "  LZC normalized: " + fixed4(result.lzc_normalized) + "\n";
  text += "  Predictability (IP): " + fixed4(result.ip) + "\n";
  if (result.has_local && !result.local.empty()) {
    text += "  Local windows: " + std::to_string(result.local.size()) + "\n";
  }
  return text;
}

std::string resultToJson(const AnalysisResult& result) {
  JsonWriter writer;
  writer.beginObject();

  writer.key("path");
  writer.value(std::string_view(result.path));
  writer.key("h0");
  writer.value(result.h0);
  writer.key("hk");
  writer.value(result.hk);
  writer.key("hmax");
  writer.value(result.hmax);
  writer.key("redundancy");
  writer.value(result.redundancy);
  writer.key("lzc");
  writer.value(result.lzc);
  writer.key("lzc_normalized");
  writer.value(result.lzc_normalized);
  writer.key("ip");
  writer.value(result.ip);

  writer.key("local");
  if (result.has_local) {
    writer.beginArray();
    for (const auto& window : result.local) {
      writer.beginObject();
      writer.key("window");
      writer.value(window.window);
      writer.key("h0");
      writer.value(window.h0);
      writer.key("hk");
      writer.value(window.hk);
      writer.endObject();
    }
    writer.endArray();
  } else {
    writer.valueNull();
  }

  writer.endObject();
  return writer.toPrettyString();
}

std::string resultsToCsv(const std::vector<AnalysisResult>& results) {
  std::string csv = "path,h0,hk,hmax,redundancy,lzc,lzc_normalized,ip\n";
  for (const auto& result : results) {
    csv += csvEscape(result.path);
    csv += ',' + csvNumber(result.h0);
    csv += ',' + csvNumber(result.hk);
    csv += ',' + csvNumber(result.hmax);
    csv += ',' + csvNumber(result.redundancy);
    csv += ',' + std::to_string(result.lzc);
    csv += ',' + csvNumber(result.lzc_normalized);
    csv += ',' + csvNumber(result.ip);
    csv += '\n';
  }
  return csv;
}

std::string localMetricsToCsv(const std::vector<AnalysisResult>& results) {
  std::string rows;
  for (const auto& result : results) {
    if (!result.has_local) continue;
    for (const auto& window : result.local) {
      rows += std::to_string(window.window);
      rows += ',' + csvNumber(window.h0);
      rows += ',' + csvNumber(window.hk);
      rows += ',' + csvEscape(result.path);
      rows += '\n';
    }
  }
  if (rows.empty()) return "";
  return "window,h0,hk,path\n" + rows;
}

std::string csvEscape(const std::string& field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
  std::string quoted = "\"";
  for (char chr : field) {
    if (chr == '"') quoted += '"';
    quoted += chr;
  }
  quoted += '"';
  return quoted;
}

bool writeTextFile(const std::string& path, const std::string& contents, std::string& error) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    error = "failed to write " + path;
    return false;
  }
  file << contents;
  file.close();
  if (file.fail()) {
    error = "failed to write " + path;
    return false;
  }
  return true;
}

}  // namespace musent
