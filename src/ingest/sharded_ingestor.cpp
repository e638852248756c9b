#include "sharded_ingestor.hpp"
#include "core/logger.hpp"
#include "core/moment_reduction.hpp"
#include "utils/thread_safe_queue.hpp"

#include <exception>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace ingest {

namespace {

void worker_thread(uint32_t worker_id, ThreadSafeQueue<std::vector<double>> &queue,
                   stats::StreamingMomentAccumulator &accumulator) {
  LOG(LogLevel::DEBUG, LogComponent::INGEST,
      "Worker thread " << worker_id << " started.");

  uint64_t batches = 0;
  while (auto batch = queue.wait_and_pop()) {
    for (double value : *batch)
      accumulator.observe(value);
    batches++;
  }

  LOG(LogLevel::DEBUG, LogComponent::INGEST,
      "Worker " << worker_id << " shutting down after " << batches
                << " batches, " << accumulator.count() << " observations.");
}

} // namespace

ShardedIngestor::ShardedIngestor(uint32_t worker_count, size_t queue_capacity)
    : worker_count_(worker_count), queue_capacity_(queue_capacity) {
  if (worker_count_ == 0) {
    throw std::invalid_argument("Worker count must be greater than 0");
  }
  if (queue_capacity_ == 0) {
    throw std::invalid_argument("Queue capacity must be greater than 0");
  }
}

IngestResult ShardedIngestor::run(IValueReader &reader) {
  ThreadSafeQueue<std::vector<double>> queue(queue_capacity_);
  std::vector<stats::StreamingMomentAccumulator> partials(worker_count_);

  std::exception_ptr failure;
  std::mutex failure_mutex;

  std::vector<std::thread> workers;
  workers.reserve(worker_count_);
  for (uint32_t i = 0; i < worker_count_; ++i) {
    workers.emplace_back([&, i] {
      try {
        worker_thread(i, queue, partials[i]);
      } catch (const std::exception &e) {
        LOG(LogLevel::ERROR, LogComponent::INGEST,
            "Worker " << i << " failed: " << e.what());
        {
          std::lock_guard<std::mutex> lock(failure_mutex);
          if (!failure)
            failure = std::current_exception();
        }
        queue.shutdown();
      }
    });
  }

  LOG(LogLevel::INFO, LogComponent::INGEST,
      "Ingesting with " << worker_count_ << " worker(s).");

  IngestResult result;
  try {
    while (!reader.exhausted()) {
      ValueBatch batch = reader.get_next_batch();
      result.rejected += batch.rejected;
      if (batch.values.empty())
        continue;
      result.batches++;
      // A failed push means a worker aborted the run
      if (!queue.push(std::move(batch.values)))
        break;
    }
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::INGEST,
        "Value source failed: " << e.what());
    std::lock_guard<std::mutex> lock(failure_mutex);
    if (!failure)
      failure = std::current_exception();
  }

  queue.shutdown();
  for (auto &worker : workers)
    worker.join();

  if (failure)
    std::rethrow_exception(failure);

  bool any_observed = false;
  for (const auto &partial : partials)
    any_observed = any_observed || !partial.empty();
  if (any_observed)
    result.accumulator = stats::merge_all(partials);

  LOG(LogLevel::INFO, LogComponent::INGEST,
      "Ingested " << result.accumulator.count() << " observations in "
                  << result.batches << " batches, " << result.rejected
                  << " rejected.");
  return result;
}

} // namespace ingest
