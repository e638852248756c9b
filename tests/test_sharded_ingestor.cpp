#include "core/moment_accumulator.hpp"
#include "core/stats_errors.hpp"
#include "ingest/sharded_ingestor.hpp"
#include "io/value_readers/stream_value_reader.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct GeneratedInput {
  std::string text;
  stats::StreamingMomentAccumulator expected;
};

GeneratedInput generate_input(int n, double offset) {
  std::mt19937 gen(2024);
  std::normal_distribution<> dist(0.0, 3.0);
  std::ostringstream out;
  out.precision(17);

  GeneratedInput input;
  for (int i = 0; i < n; ++i) {
    double x = offset + dist(gen);
    out << x << "\n";
    input.expected.observe(x);
  }
  input.text = out.str();
  return input;
}

// Fails after a fixed number of batches, as a broken source would
class FailingReader : public IValueReader {
public:
  ValueBatch get_next_batch() override {
    if (++calls_ > 2)
      throw std::runtime_error("source went away");
    ValueBatch batch;
    batch.values = {1.0, 2.0, 3.0};
    return batch;
  }
  bool exhausted() const override { return false; }

private:
  int calls_ = 0;
};

} // namespace

class ShardedIngestorTest : public ::testing::TestWithParam<uint32_t> {};

TEST_P(ShardedIngestorTest, MatchesSequentialAccumulation) {
  auto input = generate_input(20000, 1e6);
  std::istringstream stream(input.text);
  Config::ReaderConfig options;
  options.batch_size = 257;
  StreamValueReader reader(stream, options);

  ingest::ShardedIngestor ingestor(GetParam(), 4);
  auto result = ingestor.run(reader);

  const auto &acc = result.accumulator;
  ASSERT_EQ(acc.count(), input.expected.count());
  EXPECT_EQ(result.rejected, 0u);
  EXPECT_EQ(result.batches, (20000u + 256u) / 257u);
  EXPECT_NEAR(acc.mean(), input.expected.mean(), 1e-9 * 1e6);
  EXPECT_NEAR(acc.variance(1), input.expected.variance(1),
              1e-6 * input.expected.variance(1));
}

INSTANTIATE_TEST_SUITE_P(WorkerCounts, ShardedIngestorTest,
                         ::testing::Values(1u, 2u, 4u, 8u));

TEST(ShardedIngestorEdgeTest, EmptyInputGivesEmptyAccumulator) {
  std::istringstream stream("# nothing here\n\n");
  StreamValueReader reader(stream, Config::ReaderConfig{});
  ingest::ShardedIngestor ingestor(3);

  auto result = ingestor.run(reader);
  EXPECT_TRUE(result.accumulator.empty());
  EXPECT_EQ(result.batches, 0u);
  EXPECT_THROW(result.accumulator.mean(), stats::EmptyAccumulatorError);
}

TEST(ShardedIngestorEdgeTest, CountsRejectedLines) {
  std::istringstream stream("1\nfoo\n2\nnan\n3\n");
  StreamValueReader reader(stream, Config::ReaderConfig{});
  ingest::ShardedIngestor ingestor(2);

  auto result = ingestor.run(reader);
  EXPECT_EQ(result.accumulator.count(), 3u);
  EXPECT_EQ(result.rejected, 2u);
  EXPECT_DOUBLE_EQ(result.accumulator.mean(), 2.0);
  EXPECT_DOUBLE_EQ(result.accumulator.variance(1), 1.0);
}

TEST(ShardedIngestorEdgeTest, ReaderErrorsPropagate) {
  FailingReader reader;
  ingest::ShardedIngestor ingestor(2, 1);
  EXPECT_THROW(ingestor.run(reader), std::runtime_error);
}

TEST(ShardedIngestorEdgeTest, StrictReaderErrorsPropagate) {
  std::istringstream stream("1\n2\noops\n");
  Config::ReaderConfig options;
  options.strict = true;
  StreamValueReader reader(stream, options);
  ingest::ShardedIngestor ingestor(2);
  EXPECT_THROW(ingestor.run(reader), stats::InvalidInputError);
}

TEST(ShardedIngestorEdgeTest, RejectsZeroWorkersOrCapacity) {
  EXPECT_THROW(ingest::ShardedIngestor(0), std::invalid_argument);
  EXPECT_THROW(ingest::ShardedIngestor(1, 0), std::invalid_argument);
}
