/// @file
/// @brief Note-name parsing and sequence standardization.

#include "core/encoding.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace musent {

namespace {

// Larger octaves cannot produce a pitch that fits in an int.
constexpr long long kMaxOctaveMagnitude = 200000000LL;

/// @brief Strip leading and trailing whitespace.
std::string trim(const std::string& text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  return text.substr(begin, end - begin);
}

/// @brief Parse a whole token as a floating-point number.
std::optional<double> parseNumber(const std::string& token) {
  std::string text = trim(token);
  if (text.empty()) return std::nullopt;
  char* end = nullptr;
  double value = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size()) return std::nullopt;
  if (std::isnan(value)) return std::nullopt;
  return value;
}

/// @brief Resolve one raw melody token.
Symbol standardizeToken(const std::string& token) {
  if (auto number = parseInteger(token)) {
    return Symbol::integer(*number);
  }
  if (auto midi = noteNameToMidi(token)) {
    return Symbol::integer(*midi);
  }
  return Symbol::text(token);
}

}  // namespace

std::optional<int> parseInteger(const std::string& token) {
  std::string text = trim(token);
  if (text.empty()) return std::nullopt;

  size_t pos = 0;
  if (text[pos] == '+' || text[pos] == '-') ++pos;
  if (pos == text.size()) return std::nullopt;
  for (size_t idx = pos; idx < text.size(); ++idx) {
    if (!std::isdigit(static_cast<unsigned char>(text[idx]))) return std::nullopt;
  }

  errno = 0;
  long long value = std::strtoll(text.c_str(), nullptr, 10);
  if (errno == ERANGE || value > std::numeric_limits<int>::max() ||
      value < std::numeric_limits<int>::min()) {
    return std::nullopt;
  }
  return static_cast<int>(value);
}

std::optional<int> noteNameToMidi(const std::string& name) {
  std::string text = trim(name);
  if (text.size() < 2) return std::nullopt;

  char letter = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
  if (letter < 'A' || letter > 'G') return std::nullopt;
  int base = kLetterSemitones[letter - 'A'];

  size_t pos = 1;
  if (text[pos] == '#') {
    base += 1;
    ++pos;
  } else if (text[pos] == 'b') {
    base -= 1;
    ++pos;
  }

  // Octave: optional minus sign followed by at least one digit, nothing else.
  bool negative = pos < text.size() && text[pos] == '-';
  if (negative) ++pos;
  if (pos == text.size()) return std::nullopt;

  long long octave = 0;
  for (size_t idx = pos; idx < text.size(); ++idx) {
    if (!std::isdigit(static_cast<unsigned char>(text[idx]))) return std::nullopt;
    octave = octave * 10 + (text[idx] - '0');
    if (octave > kMaxOctaveMagnitude) return std::nullopt;
  }
  if (negative) octave = -octave;

  long long midi = (octave + 1) * 12 + base;
  if (midi < std::numeric_limits<int>::min() || midi > std::numeric_limits<int>::max()) {
    return std::nullopt;
  }
  return static_cast<int>(midi);
}

std::vector<Symbol> standardizeMelody(const std::vector<std::string>& tokens) {
  std::vector<Symbol> melody;
  melody.reserve(tokens.size());
  for (const auto& token : tokens) {
    melody.push_back(standardizeToken(token));
  }
  return melody;
}

std::vector<Symbol> standardizeMelody(const std::vector<Symbol>& symbols) {
  std::vector<Symbol> melody;
  melody.reserve(symbols.size());
  for (const auto& symbol : symbols) {
    if (symbol.isInteger()) {
      melody.push_back(symbol);
    } else {
      melody.push_back(standardizeToken(symbol.text_val));
    }
  }
  return melody;
}

std::vector<int> standardizeRhythm(const std::vector<std::string>& tokens) {
  std::vector<int> rhythm;
  rhythm.reserve(tokens.size());
  for (const auto& token : tokens) {
    int value = 0;
    if (auto number = parseNumber(token)) {
      double truncated = std::trunc(*number);
      value = truncated > 0.0 ? 1 : 0;
    }
    rhythm.push_back(value);
  }
  return rhythm;
}

std::vector<int> standardizeRhythm(const std::vector<int>& values) {
  std::vector<int> rhythm;
  rhythm.reserve(values.size());
  for (int value : values) {
    rhythm.push_back(value > 0 ? 1 : 0);
  }
  return rhythm;
}

EncodedSequences encodeSequences(const std::vector<std::string>& melody_tokens,
                                 const std::vector<std::string>& rhythm_tokens) {
  EncodedSequences encoded;
  encoded.melody = standardizeMelody(melody_tokens);
  encoded.rhythm = standardizeRhythm(rhythm_tokens);
  return encoded;
}

}  // namespace musent
