#include "moment_accumulator.hpp"
#include "stats_errors.hpp"

#include <cmath>
#include <string>

namespace stats {

void StreamingMomentAccumulator::observe(double value) {
  if (!std::isfinite(value)) {
    throw InvalidInputError("Observation must be finite, got " +
                            std::to_string(value));
  }

  count_++;
  double delta = value - mean_;
  mean_ += delta / static_cast<double>(count_);
  // Deviation from the updated mean, not the old one
  double delta2 = value - mean_;
  sum_sq_dev_ += delta * delta2;
}

double StreamingMomentAccumulator::mean() const {
  if (count_ == 0) {
    throw EmptyAccumulatorError("Mean is undefined for an empty accumulator");
  }
  return mean_;
}

double StreamingMomentAccumulator::variance(uint32_t ddof) const {
  if (count_ == 0) {
    throw EmptyAccumulatorError(
        "Variance is undefined for an empty accumulator");
  }
  if (ddof >= count_) {
    throw InsufficientSamplesError(
        "Variance with ddof=" + std::to_string(ddof) + " needs more than " +
        std::to_string(ddof) + " observations, have " +
        std::to_string(count_));
  }
  return sum_sq_dev_ / static_cast<double>(count_ - ddof);
}

double StreamingMomentAccumulator::std_dev(uint32_t ddof) const {
  return std::sqrt(variance(ddof));
}

StreamingMomentAccumulator
StreamingMomentAccumulator::merge(const StreamingMomentAccumulator &other) const {
  if (count_ == 0 && other.count_ == 0) {
    throw EmptyAccumulatorError("Cannot merge two empty accumulators");
  }
  if (other.count_ == 0)
    return *this;
  if (count_ == 0)
    return other;

  const uint64_t total = count_ + other.count_;
  const double n_a = static_cast<double>(count_);
  const double n_b = static_cast<double>(other.count_);
  const double n = static_cast<double>(total);

  const double delta = other.mean_ - mean_;
  const double merged_mean = mean_ + delta * (n_b / n);
  const double merged_m2 =
      sum_sq_dev_ + other.sum_sq_dev_ + delta * delta * (n_a * n_b / n);

  return StreamingMomentAccumulator(total, merged_mean, merged_m2);
}

void StreamingMomentAccumulator::merge_in(
    const StreamingMomentAccumulator &other) {
  if (other.count_ == 0 && count_ != 0)
    return;
  *this = merge(other);
}

void StreamingMomentAccumulator::reset() {
  count_ = 0;
  mean_ = 0.0;
  sum_sq_dev_ = 0.0;
}

} // namespace stats
