// Lempel-Ziv (LZ76) complexity of binary rhythm grids.

#ifndef MUSENT_METRICS_COMPLEXITY_H
#define MUSENT_METRICS_COMPLEXITY_H

#include <vector>

namespace musent {

/// @brief LZ76 phrase count of a binary sequence.
///
/// Values are read as binary activations: any value > 0 is a 1, everything
/// else a 0.  The sequence is parsed left to right into the fewest phrases
/// that are each a copy of an earlier substring plus one new symbol.
///
/// @param sequence Activation values (not modified).
/// @return Number of phrases: 0 for an empty sequence, 1 for one element.
int lempelZivComplexity(const std::vector<int>& sequence);

/// @brief Length-normalized LZ76 complexity c * log2(n) / n, capped at 1.0.
/// @param sequence Activation values (not modified).
/// @return Value in [0,1]; 0.0 for an empty sequence.
double normalizedLzc(const std::vector<int>& sequence);

}  // namespace musent

#endif  // MUSENT_METRICS_COMPLEXITY_H
