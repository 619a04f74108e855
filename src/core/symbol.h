// Symbol type for melodic sequences -- an integer pitch code or an
// unresolved text token, compared and hashed by value.

#ifndef MUSENT_CORE_SYMBOL_H
#define MUSENT_CORE_SYMBOL_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace musent {

/// @brief A single discrete value in a melodic sequence.
///
/// Tagged value: either an integer code (usually a MIDI pitch) or a text
/// token that could not be resolved to a pitch.  Integer and Text symbols
/// never compare equal, even when the text spells the same digits.
struct Symbol {
  enum class Kind : uint8_t { Integer, Text };

  Kind kind = Kind::Integer;
  int int_val = 0;
  std::string text_val;

  /// @brief Create an integer symbol.
  static Symbol integer(int value);

  /// @brief Create a text symbol.
  static Symbol text(std::string value);

  bool isInteger() const { return kind == Kind::Integer; }
  bool isText() const { return kind == Kind::Text; }

  /// @brief Render the symbol for reports ("60" or the raw token).
  std::string toString() const;
};

bool operator==(const Symbol& lhs, const Symbol& rhs);
bool operator!=(const Symbol& lhs, const Symbol& rhs);

/// Hash functor for unordered containers keyed by Symbol.
struct SymbolHash {
  size_t operator()(const Symbol& symbol) const;
};

/// Hash functor for a context (fixed-length run of symbols).
struct SymbolSequenceHash {
  size_t operator()(const std::vector<Symbol>& symbols) const;
};

/// @brief Wrap plain integer values as Integer symbols.
/// @param values Integer codes (pitches, rhythm cells, ...).
/// @return One Integer symbol per input value, same order.
std::vector<Symbol> symbolsFromInts(const std::vector<int>& values);

}  // namespace musent

#endif  // MUSENT_CORE_SYMBOL_H
