#include "core/moment_accumulator.hpp"
#include "core/reference_moments.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <random>
#include <vector>

using stats::StreamingMomentAccumulator;

// Adding a large constant to every observation must not change the variance
class ShiftInvarianceTest : public ::testing::TestWithParam<double> {
protected:
  void SetUp() override {
    std::mt19937 gen(42);
    std::normal_distribution<> dist(0.0, 1.0);
    for (int i = 0; i < 10000; ++i)
      base_.push_back(dist(gen));
  }

  std::vector<double> shifted(double offset) const {
    std::vector<double> out;
    out.reserve(base_.size());
    for (double x : base_)
      out.push_back(x + offset);
    return out;
  }

  std::vector<double> base_;
};

TEST_P(ShiftInvarianceTest, WelfordVarianceIgnoresOffset) {
  const double offset = GetParam();

  StreamingMomentAccumulator plain;
  for (double x : base_)
    plain.observe(x);

  StreamingMomentAccumulator offset_acc;
  for (double x : shifted(offset))
    offset_acc.observe(x);

  for (uint32_t ddof : {0u, 1u}) {
    double expected = plain.variance(ddof);
    EXPECT_NEAR(offset_acc.variance(ddof), expected, 1e-6 * expected)
        << "offset " << offset << ", ddof " << ddof;
  }
  EXPECT_NEAR(offset_acc.mean() - offset, plain.mean(), 1e-4);
}

INSTANTIATE_TEST_SUITE_P(LargeOffsets, ShiftInvarianceTest,
                         ::testing::Values(1.0, 1e3, 1e6, 1e9, -1e9));

TEST(NumericalStabilityTest, SemiNaiveFormulaBreaksUnderLargeOffset) {
  std::mt19937 gen(42);
  std::normal_distribution<> dist(0.0, 1.0);
  std::vector<double> base;
  std::vector<double> offset;
  for (int i = 0; i < 1000; ++i) {
    double x = dist(gen);
    base.push_back(x);
    offset.push_back(x + 1e9);
  }

  double expected = stats::two_pass_moments(base).variance;

  StreamingMomentAccumulator acc;
  for (double x : offset)
    acc.observe(x);
  EXPECT_LT(stats::relative_difference(acc.variance(), expected), 1e-6);

  // E[X^2] - E[X]^2 loses every significant digit at this offset
  double semi_naive = stats::semi_naive_moments(offset).variance;
  EXPECT_GT(stats::relative_difference(semi_naive, expected), 1e-3);
}

TEST(NumericalStabilityTest, TinySpreadOnHugeMean) {
  // Knuth's example family: mean 1e9, values 4, 7, 13, 16 above it
  StreamingMomentAccumulator acc;
  for (double x : {4.0, 7.0, 13.0, 16.0})
    acc.observe(1e9 + x);
  EXPECT_DOUBLE_EQ(acc.mean(), 1e9 + 10.0);
  EXPECT_NEAR(acc.variance(1), 30.0, 1e-6);
  EXPECT_NEAR(acc.variance(0), 22.5, 1e-6);
}
