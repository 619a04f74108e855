// Tests for metrics/complexity.h -- LZ76 phrase count and normalization.

#include "metrics/complexity.h"

#include <gtest/gtest.h>

#include <cmath>
#include <random>
#include <vector>

#include "test_helpers.h"

namespace musent {
namespace {

using test_helpers::repeat;

// ---------------------------------------------------------------------------
// lempelZivComplexity
// ---------------------------------------------------------------------------

TEST(LempelZivComplexityTest, EmptyIsZero) {
  EXPECT_EQ(lempelZivComplexity({}), 0);
}

TEST(LempelZivComplexityTest, SingleValueIsOne) {
  EXPECT_EQ(lempelZivComplexity({0}), 1);
  EXPECT_EQ(lempelZivComplexity({1}), 1);
  EXPECT_EQ(lempelZivComplexity({7}), 1);
  EXPECT_EQ(lempelZivComplexity({-3}), 1);
}

TEST(LempelZivComplexityTest, ShortSequences) {
  EXPECT_EQ(lempelZivComplexity({0, 1}), 2);
  EXPECT_EQ(lempelZivComplexity({1, 0}), 2);
  EXPECT_EQ(lempelZivComplexity({0, 0}), 2);
  EXPECT_EQ(lempelZivComplexity({0, 1, 1}), 3);
}

TEST(LempelZivComplexityTest, ConstantSequenceIsLow) {
  EXPECT_LE(lempelZivComplexity(std::vector<int>(32, 0)), 2);
  EXPECT_EQ(lempelZivComplexity(std::vector<int>(32, 0)), 2);
  EXPECT_EQ(lempelZivComplexity(std::vector<int>(32, 1)), 2);
}

TEST(LempelZivComplexityTest, IrregularExceedsPeriodic) {
  auto periodic = repeat<int>({0, 1}, 16);
  auto irregular = repeat<int>({0, 1, 1, 0, 1, 0, 0, 1}, 4);
  ASSERT_EQ(periodic.size(), irregular.size());
  EXPECT_EQ(lempelZivComplexity(periodic), 3);
  EXPECT_EQ(lempelZivComplexity(irregular), 5);
  EXPECT_GT(lempelZivComplexity(irregular), lempelZivComplexity(periodic));
}

TEST(LempelZivComplexityTest, ValuesAreBinarized) {
  // Anything > 0 is a 1, anything else a 0.
  std::vector<int> raw = {0, 3, 9, -2, 5, 0, 0, 2};
  std::vector<int> binary = {0, 1, 1, 0, 1, 0, 0, 1};
  EXPECT_EQ(lempelZivComplexity(raw), lempelZivComplexity(binary));
}

TEST(LempelZivComplexityTest, KnownMixedSequences) {
  EXPECT_EQ(lempelZivComplexity({1, 0, 0, 1, 1, 0, 1, 0}), 4);
  EXPECT_EQ(lempelZivComplexity({0, 0, 0, 1, 1, 0, 1, 0, 1, 1, 1, 1, 0}), 4);
}

TEST(LempelZivComplexityTest, NonNegativeAndBoundedByLength) {
  std::mt19937 rng(7);
  std::bernoulli_distribution coin(0.5);
  for (int length = 1; length <= 64; ++length) {
    std::vector<int> seq(static_cast<size_t>(length));
    for (auto& cell : seq) cell = coin(rng) ? 1 : 0;
    int count = lempelZivComplexity(seq);
    EXPECT_GE(count, 1);
    EXPECT_LE(count, length) << "length " << length;
  }
}

TEST(LempelZivComplexityTest, DoesNotModifyInput) {
  std::vector<int> seq = {0, 2, 0, 5};
  std::vector<int> copy = seq;
  lempelZivComplexity(seq);
  normalizedLzc(seq);
  EXPECT_EQ(seq, copy);
}

// ---------------------------------------------------------------------------
// normalizedLzc
// ---------------------------------------------------------------------------

TEST(NormalizedLzcTest, EmptyIsZero) {
  EXPECT_EQ(normalizedLzc({}), 0.0);
}

TEST(NormalizedLzcTest, SingleValueIsZero) {
  // c = 1, log2(1) = 0.
  EXPECT_EQ(normalizedLzc({1}), 0.0);
}

TEST(NormalizedLzcTest, ConstantSequenceIsLow) {
  double norm = normalizedLzc(std::vector<int>(32, 0));
  EXPECT_LT(norm, 0.4);
  EXPECT_DOUBLE_EQ(norm, 2.0 * 5.0 / 32.0);
}

TEST(NormalizedLzcTest, CappedAtOne) {
  EXPECT_EQ(normalizedLzc({0, 1}), 1.0);
  EXPECT_EQ(normalizedLzc({1, 0, 0, 1, 1, 0, 1, 0}), 1.0);
}

TEST(NormalizedLzcTest, AlwaysInUnitInterval) {
  std::mt19937 rng(11);
  std::bernoulli_distribution coin(0.3);
  for (int length = 1; length <= 200; length += 7) {
    std::vector<int> seq(static_cast<size_t>(length));
    for (auto& cell : seq) cell = coin(rng) ? 1 : 0;
    double norm = normalizedLzc(seq);
    EXPECT_GE(norm, 0.0);
    EXPECT_LE(norm, 1.0);
  }
}

TEST(NormalizedLzcTest, MatchesFormulaBelowCap) {
  auto periodic = repeat<int>({0, 1}, 16);
  double expected = 3.0 * std::log2(32.0) / 32.0;
  EXPECT_DOUBLE_EQ(normalizedLzc(periodic), expected);
}

}  // namespace
}  // namespace musent
