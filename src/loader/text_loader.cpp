/// @file
/// @brief JSON / CSV piece loader.

#include "loader/text_loader.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include "core/json_parser.h"

namespace musent {

namespace {

std::string toLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char chr) { return static_cast<char>(std::tolower(chr)); });
  return text;
}

std::string trim(const std::string& text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  return text.substr(begin, end - begin);
}

/// @brief Lower-case file extension including the dot, or "" if none.
std::string extensionOf(const std::string& path) {
  size_t slash = path.find_last_of("/\\");
  size_t dot = path.rfind('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return "";
  return toLower(path.substr(dot));
}

/// @brief Index of a header column by (trimmed, case-insensitive) name, or -1.
int findColumn(const std::vector<std::string>& header, const std::string& name) {
  for (size_t idx = 0; idx < header.size(); ++idx) {
    if (toLower(trim(header[idx])) == name) return static_cast<int>(idx);
  }
  return -1;
}

/// @brief Append the tokens of a cell, if the row has one at that column.
void appendCell(const std::vector<std::string>& row, int column,
                std::vector<std::string>& out) {
  if (column < 0 || static_cast<size_t>(column) >= row.size()) return;
  for (auto& token : splitSequenceTokens(row[static_cast<size_t>(column)])) {
    out.push_back(std::move(token));
  }
}

}  // namespace

std::vector<std::string> splitSequenceTokens(const std::string& cell) {
  std::vector<std::string> tokens;
  std::string current;
  for (char chr : cell) {
    if (chr == ',' || std::isspace(static_cast<unsigned char>(chr))) {
      if (!current.empty()) {
        tokens.push_back(current);
        current.clear();
      }
    } else {
      current += chr;
    }
  }
  if (!current.empty()) tokens.push_back(current);
  return tokens;
}

std::vector<std::vector<std::string>> parseCsvRows(const std::string& text) {
  std::vector<std::vector<std::string>> rows;
  std::vector<std::string> row;
  std::string field;
  bool in_quotes = false;
  bool row_has_content = false;

  auto endField = [&]() {
    row.push_back(field);
    field.clear();
  };
  auto endRow = [&]() {
    endField();
    if (row_has_content) rows.push_back(row);
    row.clear();
    row_has_content = false;
  };

  for (size_t pos = 0; pos < text.size(); ++pos) {
    char chr = text[pos];
    if (in_quotes) {
      if (chr == '"') {
        if (pos + 1 < text.size() && text[pos + 1] == '"') {
          field += '"';
          ++pos;
        } else {
          in_quotes = false;
        }
      } else {
        field += chr;
      }
      continue;
    }

    switch (chr) {
      case '"':
        in_quotes = true;
        row_has_content = true;
        break;
      case ',':
        endField();
        row_has_content = true;
        break;
      case '\r':
        break;
      case '\n':
        endRow();
        break;
      default:
        field += chr;
        if (!std::isspace(static_cast<unsigned char>(chr))) row_has_content = true;
        break;
    }
  }
  if (!field.empty() || !row.empty() || row_has_content) endRow();
  return rows;
}

bool readFileToString(const std::string& path, std::string& contents) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) return false;
  std::ostringstream oss;
  oss << file.rdbuf();
  if (file.bad()) return false;
  contents = oss.str();
  return true;
}

bool TextLoader::fail(const std::string& message) {
  error_ = message;
  return false;
}

bool TextLoader::load(const std::string& path) {
  sequence_ = TextSequence{};
  error_.clear();

  std::ifstream probe(path);
  if (!probe.is_open()) {
    return fail("Text file not found: " + path);
  }
  probe.close();

  std::string ext = extensionOf(path);
  if (ext != ".json" && ext != ".csv") {
    return fail("Unsupported text format. Use .json or .csv.");
  }

  std::string contents;
  if (!readFileToString(path, contents)) {
    return fail("Failed to read file: " + path);
  }
  return ext == ".json" ? loadJson(contents) : loadCsv(contents);
}

bool TextLoader::loadJson(const std::string& text) {
  sequence_ = TextSequence{};
  error_.clear();

  bool parsed = false;
  auto kv = parseJsonObject(text.data(), text.size(), &parsed);
  if (!parsed) {
    return fail("Invalid JSON document.");
  }

  auto melody_it = kv.find("melody");
  auto rhythm_it = kv.find("rhythm");
  if (melody_it == kv.end() || rhythm_it == kv.end()) {
    return fail("JSON must contain 'melody' and 'rhythm' keys.");
  }
  if (melody_it->second.type != JsonValue::Array ||
      rhythm_it->second.type != JsonValue::Array) {
    return fail("JSON 'melody' and 'rhythm' must be arrays.");
  }

  for (const auto& item : melody_it->second.items) {
    sequence_.melody.push_back(item.toToken());
  }
  for (const auto& item : rhythm_it->second.items) {
    sequence_.rhythm.push_back(item.toToken());
  }
  return true;
}

bool TextLoader::loadCsv(const std::string& text) {
  sequence_ = TextSequence{};
  error_.clear();

  auto rows = parseCsvRows(text);
  if (rows.empty()) {
    return fail("Unsupported CSV format. Include columns melody/rhythm or type/sequence.");
  }
  const auto& header = rows.front();

  int melody_col = findColumn(header, "melody");
  int rhythm_col = findColumn(header, "rhythm");
  if (melody_col >= 0 && rhythm_col >= 0) {
    for (size_t idx = 1; idx < rows.size(); ++idx) {
      appendCell(rows[idx], melody_col, sequence_.melody);
      appendCell(rows[idx], rhythm_col, sequence_.rhythm);
    }
    return true;
  }

  int type_col = findColumn(header, "type");
  int seq_col = findColumn(header, "sequence");
  if (type_col >= 0 && seq_col >= 0) {
    for (size_t idx = 1; idx < rows.size(); ++idx) {
      const auto& row = rows[idx];
      if (static_cast<size_t>(type_col) >= row.size()) continue;
      std::string seq_type = toLower(trim(row[static_cast<size_t>(type_col)]));
      if (seq_type == "melody") {
        appendCell(row, seq_col, sequence_.melody);
      } else if (seq_type == "rhythm") {
        appendCell(row, seq_col, sequence_.rhythm);
      }
    }
    if (sequence_.melody.empty() || sequence_.rhythm.empty()) {
      return fail("CSV with type/sequence must include both melody and rhythm rows.");
    }
    return true;
  }

  if (header.size() >= 2) {
    for (size_t idx = 1; idx < rows.size(); ++idx) {
      appendCell(rows[idx], 0, sequence_.melody);
      appendCell(rows[idx], 1, sequence_.rhythm);
    }
    return true;
  }

  return fail("Unsupported CSV format. Include columns melody/rhythm or type/sequence.");
}

}  // namespace musent
