#ifndef SHARDED_INGESTOR_HPP
#define SHARDED_INGESTOR_HPP

#include "core/moment_accumulator.hpp"
#include "io/value_readers/base_value_reader.hpp"

#include <cstddef>
#include <cstdint>

namespace ingest {

struct IngestResult {
  stats::StreamingMomentAccumulator accumulator;
  uint64_t rejected = 0;
  uint64_t batches = 0;
};

/**
 * Drains a value reader into N worker threads. Each worker folds batches
 * into its own accumulator; the per-worker results are combined with
 * stats::merge_all once the reader is exhausted.
 */
class ShardedIngestor {
public:
  /**
   * @param worker_count Number of worker threads, at least 1
   * @param queue_capacity Maximum number of batches waiting for a worker
   */
  explicit ShardedIngestor(uint32_t worker_count, size_t queue_capacity = 64);

  /**
   * Reads until the reader is exhausted. The producer side runs on the
   * calling thread. An exception thrown by the reader or by a worker is
   * rethrown here after all threads have been joined.
   */
  IngestResult run(IValueReader &reader);

private:
  uint32_t worker_count_;
  size_t queue_capacity_;
};

} // namespace ingest

#endif // SHARDED_INGESTOR_HPP
