// Tests for metrics/entropy.h -- Shannon / Markov entropy and derived indices.

#include "metrics/entropy.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <random>
#include <stdexcept>
#include <vector>

#include "core/symbol.h"
#include "test_helpers.h"

namespace musent {
namespace {

using test_helpers::repeat;

constexpr double kTolerance = 1e-9;

// ---------------------------------------------------------------------------
// shannonEntropy
// ---------------------------------------------------------------------------

TEST(ShannonEntropyTest, EmptySequenceIsZero) {
  EXPECT_EQ(shannonEntropy(std::vector<Symbol>{}), 0.0);
  EXPECT_EQ(shannonEntropy(std::vector<int>{}), 0.0);
}

TEST(ShannonEntropyTest, ConstantSequenceIsZero) {
  EXPECT_EQ(shannonEntropy(std::vector<int>(20, 1)), 0.0);
  EXPECT_EQ(shannonEntropy(std::vector<Symbol>(7, Symbol::text("X1"))), 0.0);
}

TEST(ShannonEntropyTest, FourEquiprobableSymbolsIsTwoBits) {
  EXPECT_NEAR(shannonEntropy(repeat<int>({0, 1, 2, 3}, 5)), 2.0, kTolerance);
}

TEST(ShannonEntropyTest, EquiprobableSymbolsMatchLog2) {
  for (int alphabet = 1; alphabet <= 12; ++alphabet) {
    std::vector<int> pattern;
    for (int sym = 0; sym < alphabet; ++sym) pattern.push_back(sym * 3);
    EXPECT_NEAR(shannonEntropy(repeat(pattern, 4)), std::log2(alphabet), kTolerance)
        << "alphabet " << alphabet;
  }
}

TEST(ShannonEntropyTest, SkewedDistribution) {
  // p = {2/3, 1/3}
  double expected = -(2.0 / 3.0) * std::log2(2.0 / 3.0) - (1.0 / 3.0) * std::log2(1.0 / 3.0);
  EXPECT_NEAR(shannonEntropy(std::vector<int>{1, 1, 2}), expected, kTolerance);
}

TEST(ShannonEntropyTest, OrderDoesNotMatter) {
  std::vector<int> forward = {60, 62, 64, 60, 67, 62, 60};
  std::vector<int> shuffled = {60, 60, 60, 62, 62, 64, 67};
  EXPECT_NEAR(shannonEntropy(forward), shannonEntropy(shuffled), kTolerance);
}

TEST(ShannonEntropyTest, IntegerAndTextSymbolsAreDistinct) {
  std::vector<Symbol> mixed = {Symbol::integer(60), Symbol::text("60")};
  EXPECT_NEAR(shannonEntropy(mixed), 1.0, kTolerance);
}

TEST(ShannonEntropyTest, DoesNotModifyInput) {
  std::vector<Symbol> seq = {Symbol::integer(3), Symbol::text("x"), Symbol::integer(3)};
  std::vector<Symbol> copy = seq;
  shannonEntropy(seq);
  markovEntropy(seq, 1);
  EXPECT_EQ(seq, copy);
}

// ---------------------------------------------------------------------------
// markovEntropy
// ---------------------------------------------------------------------------

TEST(MarkovEntropyTest, DeterministicAlternationHasZeroConditionalEntropy) {
  auto seq = repeat<int>({0, 1}, 20);
  EXPECT_NEAR(shannonEntropy(seq), 1.0, kTolerance);
  EXPECT_EQ(markovEntropy(seq, 1), 0.0);
}

TEST(MarkovEntropyTest, OrderZeroDelegatesToShannon) {
  std::vector<int> seq = {0, 0, 1, 0, 0, 1, 1, 1, 2};
  EXPECT_EQ(markovEntropy(seq, 0), shannonEntropy(seq));
  EXPECT_EQ(markovEntropy(seq, -3), shannonEntropy(seq));
}

TEST(MarkovEntropyTest, InsufficientDataIsZero) {
  std::vector<int> seq = {5, 7, 9};
  EXPECT_EQ(markovEntropy(seq, 3), 0.0);
  EXPECT_EQ(markovEntropy(seq, 4), 0.0);
  EXPECT_EQ(markovEntropy(std::vector<int>{}, 1), 0.0);
}

TEST(MarkovEntropyTest, KnownOrderOneValue) {
  // Contexts: 0 -> {0,1,0,1} (4 of 7), 1 -> {0,1,1} (3 of 7).
  std::vector<int> seq = {0, 0, 1, 0, 0, 1, 1, 1};
  double h_zero_ctx = 1.0;
  double h_one_ctx = -(1.0 / 3.0) * std::log2(1.0 / 3.0) - (2.0 / 3.0) * std::log2(2.0 / 3.0);
  double expected = (4.0 / 7.0) * h_zero_ctx + (3.0 / 7.0) * h_one_ctx;
  EXPECT_NEAR(markovEntropy(seq, 1), expected, kTolerance);
}

TEST(MarkovEntropyTest, KnownOrderTwoValue) {
  // Only context (0,1) is ambiguous: successors {0,1} -> 1 bit, weight 2/6.
  std::vector<int> seq = {0, 0, 1, 0, 0, 1, 1, 1};
  EXPECT_NEAR(markovEntropy(seq, 2), 1.0 / 3.0, kTolerance);
}

TEST(MarkovEntropyTest, CycleOfFourIsFullyPredictable) {
  EXPECT_EQ(markovEntropy(repeat<int>({0, 1, 2, 3}, 5), 1), 0.0);
}

TEST(MarkovEntropyTest, NeverExceedsShannonEntropy) {
  std::mt19937 rng(42);
  std::uniform_int_distribution<int> pitch(60, 67);
  for (int trial = 0; trial < 50; ++trial) {
    std::vector<int> seq(40 + trial);
    for (auto& value : seq) value = pitch(rng);
    double h0 = shannonEntropy(seq);
    for (int order = 0; order <= 3; ++order) {
      double hk = markovEntropy(seq, order);
      EXPECT_GE(hk, 0.0);
      EXPECT_LE(hk, h0 + kTolerance) << "trial " << trial << " order " << order;
    }
  }
}

TEST(MarkovEntropyTest, MixedSymbolContexts) {
  // "r" always followed by 60, 60 always followed by "r".
  std::vector<Symbol> seq;
  for (int idx = 0; idx < 6; ++idx) {
    seq.push_back(Symbol::text("r"));
    seq.push_back(Symbol::integer(60));
  }
  EXPECT_EQ(markovEntropy(seq, 1), 0.0);
  EXPECT_NEAR(shannonEntropy(seq), 1.0, kTolerance);
}

// ---------------------------------------------------------------------------
// maxEntropy / redundancy / predictabilityIndex
// ---------------------------------------------------------------------------

TEST(MaxEntropyTest, ZeroAndNegativeAlphabetIsZero) {
  EXPECT_EQ(maxEntropy(0), 0.0);
  EXPECT_EQ(maxEntropy(-4), 0.0);
}

TEST(MaxEntropyTest, Log2OfAlphabetSize) {
  EXPECT_EQ(maxEntropy(1), 0.0);
  EXPECT_NEAR(maxEntropy(2), 1.0, kTolerance);
  EXPECT_NEAR(maxEntropy(8), 3.0, kTolerance);
  EXPECT_NEAR(maxEntropy(12), std::log2(12.0), kTolerance);
}

TEST(RedundancyTest, DifferenceWhenPositive) {
  EXPECT_NEAR(redundancy(3.0, 1.25), 1.75, kTolerance);
}

TEST(RedundancyTest, NeverNegative) {
  EXPECT_EQ(redundancy(1.0, 2.5), 0.0);
  EXPECT_EQ(redundancy(0.0, 0.0), 0.0);
  for (double h_max = -2.0; h_max <= 4.0; h_max += 0.5) {
    for (double h_star = -2.0; h_star <= 4.0; h_star += 0.5) {
      EXPECT_GE(redundancy(h_max, h_star), 0.0);
    }
  }
}

TEST(PredictabilityIndexTest, ZeroWhenMaxEntropyNotPositive) {
  EXPECT_EQ(predictabilityIndex(0.5, 0.0), 0.0);
  EXPECT_EQ(predictabilityIndex(0.5, -1.0), 0.0);
}

TEST(PredictabilityIndexTest, RatioInsideRange) {
  EXPECT_NEAR(predictabilityIndex(1.0, 4.0), 0.75, kTolerance);
  EXPECT_NEAR(predictabilityIndex(0.0, 2.0), 1.0, kTolerance);
}

TEST(PredictabilityIndexTest, ClampedToUnitInterval) {
  EXPECT_EQ(predictabilityIndex(5.0, 2.0), 0.0);
  EXPECT_EQ(predictabilityIndex(-1.0, 2.0), 1.0);
  for (double h_star = -3.0; h_star <= 6.0; h_star += 0.25) {
    for (double h_max = -1.0; h_max <= 5.0; h_max += 0.5) {
      double index = predictabilityIndex(h_star, h_max);
      EXPECT_GE(index, 0.0);
      EXPECT_LE(index, 1.0);
    }
  }
}

TEST(AlphabetSizeTest, CountsDistinctSymbols) {
  std::vector<Symbol> seq = {Symbol::integer(60), Symbol::integer(62), Symbol::integer(60),
                             Symbol::text("X1"), Symbol::text("60")};
  EXPECT_EQ(alphabetSize(seq), 4);
  EXPECT_EQ(alphabetSize({}), 0);
}

// ---------------------------------------------------------------------------
// slidingWindowEntropies
// ---------------------------------------------------------------------------

TEST(SlidingWindowTest, RejectsNonPositiveWindowOrStep) {
  std::vector<Symbol> seq = symbolsFromInts({1, 2, 3, 4});
  EXPECT_THROW(slidingWindowEntropies(seq, 0, 1), std::invalid_argument);
  EXPECT_THROW(slidingWindowEntropies(seq, 4, -1), std::invalid_argument);
  EXPECT_THROW(slidingWindowEntropies(seq, -2, 2), std::invalid_argument);
  EXPECT_THROW(slidingWindowEntropies(seq, 4, 0), std::invalid_argument);
  EXPECT_THROW(slidingWindowEntropies({}, 0, 0), std::invalid_argument);
}

TEST(SlidingWindowTest, EmptySequenceYieldsNoWindows) {
  EXPECT_TRUE(slidingWindowEntropies({}, 4, 2).empty());
}

TEST(SlidingWindowTest, WindowsStartEveryStepAndKeepShortTail) {
  std::vector<Symbol> seq = symbolsFromInts({0, 1, 2, 3, 0, 1, 2, 3, 4, 5});
  auto windows = slidingWindowEntropies(seq, 4, 3, 1);
  // Starts 0, 3, 6, 9; the last window holds a single symbol.
  ASSERT_EQ(windows.size(), 4u);
  EXPECT_NEAR(windows[0].h0, 2.0, kTolerance);
  EXPECT_NEAR(windows[1].h0, 2.0, kTolerance);
  EXPECT_NEAR(windows[2].h0, 2.0, kTolerance);
  EXPECT_EQ(windows[3].h0, 0.0);
  for (const auto& window : windows) {
    EXPECT_EQ(window.hk, 0.0);
  }
}

TEST(SlidingWindowTest, MatchesPerWindowEntropies) {
  std::vector<Symbol> seq = symbolsFromInts({60, 62, 60, 64, 62, 60, 67, 67, 65, 64, 62});
  auto windows = slidingWindowEntropies(seq, 5, 2, 2);
  ASSERT_EQ(windows.size(), 6u);
  for (size_t idx = 0; idx < windows.size(); ++idx) {
    size_t start = idx * 2;
    size_t end = std::min(seq.size(), start + 5);
    std::vector<Symbol> window(seq.begin() + static_cast<std::ptrdiff_t>(start),
                               seq.begin() + static_cast<std::ptrdiff_t>(end));
    EXPECT_EQ(windows[idx].h0, shannonEntropy(window));
    EXPECT_EQ(windows[idx].hk, markovEntropy(window, 2));
  }
}

TEST(SlidingWindowTest, WindowLargerThanSequenceGivesWholeSequence) {
  std::vector<Symbol> seq = symbolsFromInts({1, 2, 1, 2});
  auto windows = slidingWindowEntropies(seq, 100, 100);
  ASSERT_EQ(windows.size(), 1u);
  EXPECT_NEAR(windows[0].h0, 1.0, kTolerance);
  EXPECT_EQ(windows[0].hk, 0.0);
}

TEST(SlidingWindowTest, DefaultOrderIsOne) {
  std::vector<Symbol> seq = symbolsFromInts({0, 0, 1, 0, 0, 1, 1, 1});
  auto windows = slidingWindowEntropies(seq, 8, 8);
  ASSERT_EQ(windows.size(), 1u);
  EXPECT_NEAR(windows[0].hk, markovEntropy(seq, 1), kTolerance);
}

}  // namespace
}  // namespace musent
