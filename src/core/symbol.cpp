/// @file
/// @brief Symbol construction, comparison and hashing.

#include "core/symbol.h"

#include <functional>
#include <utility>

namespace musent {

Symbol Symbol::integer(int value) {
  Symbol symbol;
  symbol.kind = Kind::Integer;
  symbol.int_val = value;
  return symbol;
}

Symbol Symbol::text(std::string value) {
  Symbol symbol;
  symbol.kind = Kind::Text;
  symbol.text_val = std::move(value);
  return symbol;
}

std::string Symbol::toString() const {
  if (kind == Kind::Integer) return std::to_string(int_val);
  return text_val;
}

bool operator==(const Symbol& lhs, const Symbol& rhs) {
  if (lhs.kind != rhs.kind) return false;
  if (lhs.kind == Symbol::Kind::Integer) return lhs.int_val == rhs.int_val;
  return lhs.text_val == rhs.text_val;
}

bool operator!=(const Symbol& lhs, const Symbol& rhs) {
  return !(lhs == rhs);
}

size_t SymbolHash::operator()(const Symbol& symbol) const {
  // Kind is mixed in so that 60 and "60" land in different buckets.
  size_t seed = static_cast<size_t>(symbol.kind);
  size_t value_hash = symbol.isInteger() ? std::hash<int>{}(symbol.int_val)
                                         : std::hash<std::string>{}(symbol.text_val);
  return value_hash ^ (seed + 0x9e3779b9u + (value_hash << 6) + (value_hash >> 2));
}

size_t SymbolSequenceHash::operator()(const std::vector<Symbol>& symbols) const {
  SymbolHash element_hash;
  size_t seed = symbols.size();
  for (const auto& symbol : symbols) {
    seed ^= element_hash(symbol) + 0x9e3779b9u + (seed << 6) + (seed >> 2);
  }
  return seed;
}

std::vector<Symbol> symbolsFromInts(const std::vector<int>& values) {
  std::vector<Symbol> symbols;
  symbols.reserve(values.size());
  for (int value : values) {
    symbols.push_back(Symbol::integer(value));
  }
  return symbols;
}

}  // namespace musent
