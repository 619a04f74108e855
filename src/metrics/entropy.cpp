/// @file
/// @brief Shannon and Markov entropy estimators.

#include "metrics/entropy.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace musent {

namespace {

using SymbolCounts = std::unordered_map<Symbol, size_t, SymbolHash>;

/// @brief Entropy in bits of a count table with the given total.
double entropyFromCounts(const SymbolCounts& counts, size_t total) {
  if (total == 0) return 0.0;
  double entropy = 0.0;
  for (const auto& entry : counts) {
    double prob = static_cast<double>(entry.second) / static_cast<double>(total);
    entropy -= prob * std::log2(prob);
  }
  // -0.0 from a single-symbol distribution reads badly in reports.
  return entropy > 0.0 ? entropy : 0.0;
}

}  // namespace

double shannonEntropy(const std::vector<Symbol>& sequence) {
  if (sequence.empty()) return 0.0;
  SymbolCounts counts;
  for (const auto& symbol : sequence) {
    ++counts[symbol];
  }
  return entropyFromCounts(counts, sequence.size());
}

double shannonEntropy(const std::vector<int>& sequence) {
  return shannonEntropy(symbolsFromInts(sequence));
}

double markovEntropy(const std::vector<Symbol>& sequence, int order_k) {
  if (order_k <= 0) return shannonEntropy(sequence);

  const size_t order = static_cast<size_t>(order_k);
  const size_t num_symbols = sequence.size();
  if (num_symbols <= order) return 0.0;

  // Context -> successor counts.
  std::unordered_map<std::vector<Symbol>, SymbolCounts, SymbolSequenceHash> transitions;
  for (size_t idx = 0; idx + order < num_symbols; ++idx) {
    std::vector<Symbol> context(sequence.begin() + static_cast<std::ptrdiff_t>(idx),
                                sequence.begin() + static_cast<std::ptrdiff_t>(idx + order));
    ++transitions[std::move(context)][sequence[idx + order]];
  }

  const double total = static_cast<double>(num_symbols - order);
  double entropy = 0.0;
  for (const auto& entry : transitions) {
    size_t occurrences = 0;
    for (const auto& successor : entry.second) {
      occurrences += successor.second;
    }
    double weight = static_cast<double>(occurrences) / total;
    entropy += weight * entropyFromCounts(entry.second, occurrences);
  }
  return entropy;
}

double markovEntropy(const std::vector<int>& sequence, int order_k) {
  return markovEntropy(symbolsFromInts(sequence), order_k);
}

double maxEntropy(int alphabet_size) {
  if (alphabet_size <= 0) return 0.0;
  return std::log2(static_cast<double>(alphabet_size));
}

double redundancy(double h_max, double h_star) {
  return std::max(0.0, h_max - h_star);
}

double predictabilityIndex(double h_star, double h_max) {
  if (h_max <= 0.0) return 0.0;
  double index = 1.0 - (h_star / h_max);
  return std::min(1.0, std::max(0.0, index));
}

int alphabetSize(const std::vector<Symbol>& sequence) {
  std::unordered_set<Symbol, SymbolHash> distinct(sequence.begin(), sequence.end());
  return static_cast<int>(distinct.size());
}

std::vector<WindowEntropy> slidingWindowEntropies(const std::vector<Symbol>& sequence,
                                                  int window_size, int step,
                                                  int order_k) {
  if (window_size <= 0 || step <= 0) {
    throw std::invalid_argument("window_size and step must be positive integers.");
  }

  std::vector<WindowEntropy> results;
  const size_t num_symbols = sequence.size();
  const size_t width = static_cast<size_t>(window_size);
  for (size_t start = 0; start < num_symbols; start += static_cast<size_t>(step)) {
    size_t end = std::min(num_symbols, start + width);
    std::vector<Symbol> window(sequence.begin() + static_cast<std::ptrdiff_t>(start),
                               sequence.begin() + static_cast<std::ptrdiff_t>(end));
    if (window.empty()) continue;

    WindowEntropy entry;
    entry.h0 = shannonEntropy(window);
    entry.hk = markovEntropy(window, order_k);
    results.push_back(entry);
  }
  return results;
}

}  // namespace musent
