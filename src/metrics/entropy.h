// Entropy metrics over symbolic sequences -- order-0 Shannon entropy,
// order-k conditional (Markov) entropy, redundancy, predictability, and
// sliding-window decomposition.

#ifndef MUSENT_METRICS_ENTROPY_H
#define MUSENT_METRICS_ENTROPY_H

#include <cstddef>
#include <vector>

#include "core/symbol.h"

namespace musent {

/// Order-0 and order-k entropy of one analysis window.
struct WindowEntropy {
  double h0 = 0.0;  ///< Shannon entropy of the window (bits).
  double hk = 0.0;  ///< Conditional entropy of the window given k predecessors.
};

/// @brief Order-0 Shannon entropy of the empirical symbol distribution.
/// @param sequence Input sequence (not modified).
/// @return Entropy in bits, or 0.0 for an empty sequence.
double shannonEntropy(const std::vector<Symbol>& sequence);

/// @brief Order-0 Shannon entropy of an integer sequence.
double shannonEntropy(const std::vector<int>& sequence);

/// @brief Empirical conditional entropy H(next | previous k symbols).
///
/// Every run of k consecutive symbols is a context; the symbol following it
/// is recorded as a successor.  The result is the average successor entropy
/// over all contexts, weighted by how often each context occurs.  This is a
/// plug-in estimate and is biased low for short sequences or large k.
///
/// @param sequence Input sequence (not modified).
/// @param order_k Context length.  k <= 0 falls back to shannonEntropy().
/// @return Conditional entropy in bits, or 0.0 if the sequence has no more
///         than k symbols.
double markovEntropy(const std::vector<Symbol>& sequence, int order_k);

/// @brief Conditional entropy of an integer sequence.
double markovEntropy(const std::vector<int>& sequence, int order_k);

/// @brief Maximum entropy for a uniform distribution.
/// @param alphabet_size Number of distinct symbols.
/// @return log2(alphabet_size), or 0.0 if alphabet_size <= 0.
double maxEntropy(int alphabet_size);

/// @brief Redundancy R = Hmax - H*, floored at zero.
double redundancy(double h_max, double h_star);

/// @brief Predictability index IP = 1 - H*/Hmax, clamped to [0,1].
/// @return 0.0 if h_max <= 0.
double predictabilityIndex(double h_star, double h_max);

/// @brief Number of distinct symbols in a sequence.
int alphabetSize(const std::vector<Symbol>& sequence);

/// @brief Entropy profile over consecutive windows.
///
/// Windows start at 0, step, 2*step, ... and cover up to window_size
/// symbols; the last window may be shorter.  Empty windows are not emitted.
///
/// @param sequence Input sequence (not modified).
/// @param window_size Maximum number of symbols per window (> 0).
/// @param step Distance between window starts (> 0).
/// @param order_k Context length for the conditional entropy of each window.
/// @return One WindowEntropy per non-empty window, in window order.
/// @throws std::invalid_argument if window_size <= 0 or step <= 0.
std::vector<WindowEntropy> slidingWindowEntropies(const std::vector<Symbol>& sequence,
                                                  int window_size, int step,
                                                  int order_k = 1);

}  // namespace musent

#endif  // MUSENT_METRICS_ENTROPY_H
