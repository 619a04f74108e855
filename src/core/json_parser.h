// Minimal JSON object parser for piece files and analysis config
// (no external dependencies).
//
// Handles a top-level object whose values are strings, numbers, booleans,
// null, or flat arrays of those scalars. Nested objects are skipped.

#ifndef MUSENT_CORE_JSON_PARSER_H
#define MUSENT_CORE_JSON_PARSER_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace musent {

/// @brief A single JSON value (scalar, or a flat array of scalars).
struct JsonValue {
  enum Type { String, Number, Bool, Null, Array };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;
  std::vector<JsonValue> items;  ///< Elements when type == Array.

  /// @brief Render a scalar as a sequence token.
  ///
  /// Strings are returned as-is, integral numbers without a fraction
  /// ("60", not "60.000000"), other numbers in shortest form, booleans as
  /// "1"/"0", null as an empty string.
  std::string toToken() const;
};

/// @brief Parse a JSON object into a key-value map.
///
/// @param json Pointer to JSON text.
/// @param length Length of JSON text.
/// @param ok Optional out-parameter, set to false if the text is not a
///        well-formed object (the returned map is then empty).
/// @return Map of key-value pairs.
std::map<std::string, JsonValue> parseJsonObject(const char* json, size_t length,
                                                 bool* ok = nullptr);

}  // namespace musent

#endif  // MUSENT_CORE_JSON_PARSER_H
