/// @file
/// @brief Minimal JSON object parser implementation.

#include "core/json_parser.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace musent {

std::string JsonValue::toToken() const {
  switch (type) {
    case String:
      return string_val;
    case Number: {
      if (std::trunc(number_val) == number_val && std::fabs(number_val) < 1e15) {
        return std::to_string(static_cast<long long>(number_val));
      }
      std::ostringstream oss;
      oss << number_val;
      return oss.str();
    }
    case Bool:
      return bool_val ? "1" : "0";
    case Null:
    case Array:
      break;
  }
  return "";
}

namespace {

/// Cursor over the JSON text; `failed` latches on the first syntax error.
struct ParseState {
  const char* json;
  size_t length;
  size_t pos = 0;
  bool failed = false;

  bool atEnd() const { return pos >= length; }
  char peek() const { return json[pos]; }
};

void skipWhitespace(ParseState& state) {
  while (!state.atEnd() && std::isspace(static_cast<unsigned char>(state.peek()))) {
    ++state.pos;
  }
}

/// @brief Parse a JSON string literal (expects pos at opening quote).
std::string parseString(ParseState& state) {
  if (state.atEnd() || state.peek() != '"') {
    state.failed = true;
    return "";
  }
  ++state.pos;

  std::string result;
  while (!state.atEnd() && state.peek() != '"') {
    char chr = state.peek();
    if (chr == '\\' && state.pos + 1 < state.length) {
      ++state.pos;
      switch (state.peek()) {
        case '"':  result += '"'; break;
        case '\\': result += '\\'; break;
        case '/':  result += '/'; break;
        case 'b':  result += '\b'; break;
        case 'f':  result += '\f'; break;
        case 'n':  result += '\n'; break;
        case 't':  result += '\t'; break;
        case 'r':  result += '\r'; break;
        case 'u': {
          // Basic Multilingual Plane only; encoded as UTF-8.
          if (state.pos + 4 >= state.length) {
            state.failed = true;
            return result;
          }
          std::string hex(state.json + state.pos + 1, 4);
          unsigned code = static_cast<unsigned>(std::strtoul(hex.c_str(), nullptr, 16));
          if (code < 0x80) {
            result += static_cast<char>(code);
          } else if (code < 0x800) {
            result += static_cast<char>(0xC0 | (code >> 6));
            result += static_cast<char>(0x80 | (code & 0x3F));
          } else {
            result += static_cast<char>(0xE0 | (code >> 12));
            result += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            result += static_cast<char>(0x80 | (code & 0x3F));
          }
          state.pos += 4;
          break;
        }
        default:   result += state.peek(); break;
      }
    } else {
      result += chr;
    }
    ++state.pos;
  }

  if (state.atEnd()) {
    state.failed = true;  // unterminated string
    return result;
  }
  ++state.pos;  // closing quote
  return result;
}

/// @brief Parse a JSON number (integer, fraction, exponent).
JsonValue parseNumber(ParseState& state) {
  JsonValue val;
  val.type = JsonValue::Number;

  size_t start = state.pos;
  auto isNumberChar = [](char chr) {
    return std::isdigit(static_cast<unsigned char>(chr)) || chr == '-' || chr == '+' ||
           chr == '.' || chr == 'e' || chr == 'E';
  };
  while (!state.atEnd() && isNumberChar(state.peek())) ++state.pos;

  std::string num_str(state.json + start, state.pos - start);
  if (num_str.empty()) {
    state.failed = true;
    return val;
  }
  char* end = nullptr;
  val.number_val = std::strtod(num_str.c_str(), &end);
  if (end != num_str.c_str() + num_str.size()) {
    state.failed = true;
  }
  return val;
}

/// @brief Consume a literal keyword (true / false / null).
bool consumeKeyword(ParseState& state, const char* keyword) {
  size_t len = std::strlen(keyword);
  if (state.pos + len > state.length ||
      std::strncmp(state.json + state.pos, keyword, len) != 0) {
    state.failed = true;
    return false;
  }
  state.pos += len;
  return true;
}

/// @brief Parse a string, number, boolean or null.
JsonValue parseScalar(ParseState& state) {
  JsonValue val;
  char chr = state.peek();
  if (chr == '"') {
    val.type = JsonValue::String;
    val.string_val = parseString(state);
  } else if (chr == 't') {
    val.type = JsonValue::Bool;
    val.bool_val = true;
    consumeKeyword(state, "true");
  } else if (chr == 'f') {
    val.type = JsonValue::Bool;
    val.bool_val = false;
    consumeKeyword(state, "false");
  } else if (chr == 'n') {
    val.type = JsonValue::Null;
    consumeKeyword(state, "null");
  } else {
    val = parseNumber(state);
  }
  return val;
}

/// @brief Skip a nested object or array we do not keep.
void skipContainer(ParseState& state) {
  char open = state.peek();
  char close = (open == '{') ? '}' : ']';
  int depth = 1;
  ++state.pos;
  while (!state.atEnd() && depth > 0) {
    char chr = state.peek();
    if (chr == '"') {
      parseString(state);
      if (state.failed) return;
      continue;
    }
    if (chr == open) ++depth;
    if (chr == close) --depth;
    ++state.pos;
  }
  if (depth > 0) state.failed = true;
}

/// @brief Parse an array of scalars (nested containers are skipped).
JsonValue parseArray(ParseState& state) {
  JsonValue val;
  val.type = JsonValue::Array;
  ++state.pos;  // '['

  skipWhitespace(state);
  if (!state.atEnd() && state.peek() == ']') {
    ++state.pos;
    return val;
  }

  while (!state.atEnd() && !state.failed) {
    skipWhitespace(state);
    if (state.atEnd()) break;

    if (state.peek() == '{' || state.peek() == '[') {
      skipContainer(state);
    } else {
      val.items.push_back(parseScalar(state));
    }

    skipWhitespace(state);
    if (state.atEnd()) break;
    if (state.peek() == ',') {
      ++state.pos;
      continue;
    }
    if (state.peek() == ']') {
      ++state.pos;
      return val;
    }
    state.failed = true;
  }
  state.failed = true;
  return val;
}

}  // namespace

std::map<std::string, JsonValue> parseJsonObject(const char* json, size_t length, bool* ok) {
  std::map<std::string, JsonValue> result;
  if (ok) *ok = false;
  if (!json || length == 0) return result;

  ParseState state{json, length};
  skipWhitespace(state);
  if (state.atEnd() || state.peek() != '{') return result;
  ++state.pos;

  bool closed = false;
  while (!state.atEnd() && !state.failed) {
    skipWhitespace(state);
    if (state.atEnd()) break;
    if (state.peek() == '}') {
      ++state.pos;
      closed = true;
      break;
    }

    std::string key = parseString(state);
    if (state.failed) break;

    skipWhitespace(state);
    if (state.atEnd() || state.peek() != ':') {
      state.failed = true;
      break;
    }
    ++state.pos;
    skipWhitespace(state);
    if (state.atEnd()) break;

    if (state.peek() == '[') {
      result[key] = parseArray(state);
    } else if (state.peek() == '{') {
      skipContainer(state);
    } else {
      result[key] = parseScalar(state);
    }
    if (state.failed) break;

    skipWhitespace(state);
    if (state.atEnd()) break;
    if (state.peek() == ',') {
      ++state.pos;
    } else if (state.peek() != '}') {
      state.failed = true;
    }
  }

  if (state.failed || !closed) {
    result.clear();
    return result;
  }
  if (ok) *ok = true;
  return result;
}

}  // namespace musent
