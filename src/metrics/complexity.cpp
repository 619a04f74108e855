/// @file
/// @brief LZ76 incremental parser.

#include "metrics/complexity.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>

namespace musent {

namespace {

/// @brief Map activation values onto the '0'/'1' alphabet.
std::string toBinaryString(const std::vector<int>& sequence) {
  std::string bits;
  bits.reserve(sequence.size());
  for (int value : sequence) {
    bits += value > 0 ? '1' : '0';
  }
  return bits;
}

}  // namespace

int lempelZivComplexity(const std::vector<int>& sequence) {
  const std::string bits = toBinaryString(sequence);
  const size_t length = bits.size();
  if (length == 0) return 0;
  if (length == 1) return 1;

  // l: end of the parsed prefix, i: start of the candidate copy inside the
  // prefix, k: length of the current match.
  int count = 1;
  size_t prefix_end = 1;
  size_t copy_start = 0;
  size_t match_len = 1;

  while (true) {
    if (prefix_end + match_len > length) {
      // Remaining tail is the last phrase.
      ++count;
      break;
    }
    if (bits[copy_start + match_len - 1] == bits[prefix_end + match_len - 1]) {
      ++match_len;
      continue;
    }
    ++copy_start;
    if (copy_start == prefix_end) {
      ++count;
      prefix_end += match_len;
      if (prefix_end >= length) break;
      copy_start = 0;
      match_len = 1;
    }
  }
  return count;
}

double normalizedLzc(const std::vector<int>& sequence) {
  if (sequence.empty()) return 0.0;
  const double length = static_cast<double>(sequence.size());
  const double phrases = static_cast<double>(lempelZivComplexity(sequence));
  return std::min(1.0, phrases * std::log2(length) / length);
}

}  // namespace musent
