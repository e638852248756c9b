#include "core/moment_accumulator.hpp"
#include "core/moment_reduction.hpp"
#include "core/stats_errors.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <random>
#include <string>
#include <vector>

using stats::StreamingMomentAccumulator;

namespace {

StreamingMomentAccumulator accumulate(const std::vector<double> &values) {
  StreamingMomentAccumulator acc;
  for (double v : values)
    acc.observe(v);
  return acc;
}

void expect_same_moments(const StreamingMomentAccumulator &actual,
                         const StreamingMomentAccumulator &expected) {
  ASSERT_EQ(actual.count(), expected.count());
  EXPECT_NEAR(actual.mean(), expected.mean(),
              1e-9 * std::fabs(expected.mean()) + 1e-12);
  EXPECT_NEAR(actual.variance(), expected.variance(),
              1e-9 * expected.variance() + 1e-12);
}

std::vector<double> sample(size_t n, unsigned seed) {
  std::mt19937 gen(seed);
  std::normal_distribution<> dist(100.0, 15.0);
  std::vector<double> values(n);
  for (auto &v : values)
    v = dist(gen);
  return values;
}

} // namespace

TEST(MomentMergeTest, AnySplitMatchesSequentialInBothOrders) {
  const auto values = sample(300, 99);

  for (size_t split : {size_t{1}, size_t{2}, size_t{17}, size_t{150},
                       size_t{299}}) {
    std::vector<double> a(values.begin(), values.begin() + split);
    std::vector<double> b(values.begin() + split, values.end());

    std::vector<double> a_then_b = a;
    a_then_b.insert(a_then_b.end(), b.begin(), b.end());
    std::vector<double> b_then_a = b;
    b_then_a.insert(b_then_a.end(), a.begin(), a.end());

    auto acc_a = accumulate(a);
    auto acc_b = accumulate(b);

    SCOPED_TRACE("split at " + std::to_string(split));
    expect_same_moments(acc_a.merge(acc_b), accumulate(a_then_b));
    expect_same_moments(acc_a.merge(acc_b), accumulate(b_then_a));
    expect_same_moments(acc_b.merge(acc_a), accumulate(a_then_b));
  }
}

TEST(MomentMergeTest, InterleavedPartitionMatchesSequential) {
  const auto values = sample(500, 5);
  std::vector<double> evens;
  std::vector<double> odds;
  for (size_t i = 0; i < values.size(); ++i)
    (i % 2 == 0 ? evens : odds).push_back(values[i]);

  auto merged = accumulate(evens).merge(accumulate(odds));
  expect_same_moments(merged, accumulate(values));
  EXPECT_NEAR(merged.variance(1), accumulate(values).variance(1),
              1e-9 * accumulate(values).variance(1));
}

TEST(MomentMergeTest, MergeIsAssociative) {
  auto a = accumulate(sample(40, 1));
  auto b = accumulate(sample(75, 2));
  auto c = accumulate(sample(13, 3));

  expect_same_moments(a.merge(b).merge(c), a.merge(b.merge(c)));
  expect_same_moments(a.merge(c).merge(b), c.merge(b).merge(a));
}

TEST(MomentMergeTest, EmptyOperands) {
  StreamingMomentAccumulator empty;
  auto filled = accumulate({1.0, 2.0, 3.0});

  EXPECT_THROW(empty.merge(StreamingMomentAccumulator{}),
               stats::EmptyAccumulatorError);

  auto left = empty.merge(filled);
  auto right = filled.merge(empty);
  EXPECT_EQ(left.count(), 3u);
  EXPECT_DOUBLE_EQ(left.mean(), 2.0);
  EXPECT_DOUBLE_EQ(left.variance(1), 1.0);
  EXPECT_EQ(right.count(), 3u);
  EXPECT_DOUBLE_EQ(right.sum_sq_dev(), filled.sum_sq_dev());
}

TEST(MomentMergeTest, MergeLeavesOperandsUnchanged) {
  auto a = accumulate({1.0, 2.0});
  auto b = accumulate({10.0});
  auto merged = a.merge(b);
  EXPECT_EQ(merged.count(), 3u);
  EXPECT_EQ(a.count(), 2u);
  EXPECT_DOUBLE_EQ(a.mean(), 1.5);
  EXPECT_EQ(b.count(), 1u);
}

TEST(MomentMergeTest, MergeInPlace) {
  auto acc = accumulate({1.0});
  acc.merge_in(accumulate({2.0, 3.0}));
  EXPECT_EQ(acc.count(), 3u);
  EXPECT_DOUBLE_EQ(acc.mean(), 2.0);

  acc.merge_in(StreamingMomentAccumulator{});
  EXPECT_EQ(acc.count(), 3u);

  StreamingMomentAccumulator empty;
  EXPECT_THROW(empty.merge_in(StreamingMomentAccumulator{}),
               stats::EmptyAccumulatorError);
  empty.merge_in(acc);
  EXPECT_EQ(empty.count(), 3u);
}

TEST(MomentReductionTest, MergeAllMatchesSequential) {
  const auto values = sample(1001, 11);
  std::vector<StreamingMomentAccumulator> shards(7);
  for (size_t i = 0; i < values.size(); ++i)
    shards[(i * 31) % shards.size()].observe(values[i]);

  expect_same_moments(stats::merge_all(shards), accumulate(values));
}

TEST(MomentReductionTest, MergeAllSkipsEmptyShards) {
  std::vector<StreamingMomentAccumulator> shards(5);
  shards[1].observe(4.0);
  shards[3].observe(8.0);

  auto merged = stats::merge_all(shards);
  EXPECT_EQ(merged.count(), 2u);
  EXPECT_DOUBLE_EQ(merged.mean(), 6.0);
  EXPECT_DOUBLE_EQ(merged.variance(), 4.0);
}

TEST(MomentReductionTest, MergeAllOfNothingThrows) {
  EXPECT_THROW(stats::merge_all({}), stats::EmptyAccumulatorError);
  std::vector<StreamingMomentAccumulator> empties(3);
  EXPECT_THROW(stats::merge_all(empties), stats::EmptyAccumulatorError);
}

TEST(MomentReductionTest, SingleShardIsReturnedAsIs) {
  std::vector<StreamingMomentAccumulator> shards(1);
  shards[0] = accumulate({2.0, 4.0, 9.0});
  auto merged = stats::merge_all(shards);
  EXPECT_EQ(merged.count(), 3u);
  EXPECT_EQ(merged.sum_sq_dev(), shards[0].sum_sq_dev());
}
