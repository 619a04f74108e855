// Minimal JSON serialization writer (no external dependencies).
//
// Builds JSON output via a string-builder approach. Used for analysis
// reports. Parsing lives in core/json_parser.h.

#ifndef MUSENT_CORE_JSON_HELPERS_H
#define MUSENT_CORE_JSON_HELPERS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/symbol.h"

namespace musent {

/// @brief Simple JSON writer that builds a JSON string incrementally.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("h0");
///   writer.value(1.5);
///   writer.key("path");
///   writer.value("piece.json");
///   writer.endObject();
///   std::string json = writer.toString();
///   // -> {"h0":1.5,"path":"piece.json"}
/// @endcode
///
/// Comma insertion is tracked per nesting level. Structure is not validated
/// (caller must match begin/end pairs).
class JsonWriter {
 public:
  JsonWriter() = default;

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key (must be followed by a value call).
  void key(std::string_view name);

  /// @brief Write a string value (JSON-escaped).
  void value(std::string_view val);

  /// @brief Write a string value; overload keeps literals off the bool path.
  void value(const char* val) { value(std::string_view(val)); }

  void value(int val);
  void value(uint32_t val);

  /// @brief Write a floating-point value with up to 12 significant digits.
  ///        NaN and infinity are written as null.
  void value(double val);

  void value(bool val);

  /// @brief Write a melody symbol: integers as numbers, text as strings.
  void value(const Symbol& val);

  void valueNull();

  /// @brief Get the accumulated compact JSON string.
  std::string toString() const;

  /// @brief Get the accumulated JSON string with indentation.
  /// @param indent_size Number of spaces per indent level (default: 2).
  std::string toPrettyString(int indent_size = 2) const;

 private:
  /// Write a comma if needed before the next value/key.
  void maybeComma();

  /// Mark the current level as holding at least one element.
  void markWritten();

  static std::string escapeString(std::string_view input);

  std::string buffer_;

  // One entry per open object/array: whether the next element needs a comma.
  std::vector<bool> needs_comma_;
};

}  // namespace musent

#endif  // MUSENT_CORE_JSON_HELPERS_H
