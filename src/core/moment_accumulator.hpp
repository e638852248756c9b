#ifndef MOMENT_ACCUMULATOR_HPP
#define MOMENT_ACCUMULATOR_HPP

#include <cstdint>

namespace stats {

/**
 * Running count, mean and variance of a stream of finite doubles.
 *
 * Uses Welford's one-pass update, so the variance stays accurate when every
 * observation carries a large common offset. Not safe for concurrent
 * mutation; give each producer its own accumulator and combine them with
 * merge().
 */
class StreamingMomentAccumulator {
public:
  StreamingMomentAccumulator() = default;

  /**
   * Fold one observation into the running moments
   * @param value Must be finite
   * @throws InvalidInputError if value is NaN or infinite. State is unchanged.
   */
  void observe(double value);

  /**
   * @throws EmptyAccumulatorError if nothing has been observed
   */
  double mean() const;

  /**
   * Variance with divisor (count - ddof)
   * @param ddof 0 for population variance, 1 for sample variance
   * @throws EmptyAccumulatorError if nothing has been observed
   * @throws InsufficientSamplesError if ddof >= count
   */
  double variance(uint32_t ddof = 0) const;

  // sqrt(variance(ddof)), same failure modes
  double std_dev(uint32_t ddof = 0) const;

  uint64_t count() const { return count_; }
  bool empty() const { return count_ == 0; }

  // Running sum of squared deviations from the mean (M2)
  double sum_sq_dev() const { return sum_sq_dev_; }

  /**
   * Combine with another accumulator as if both streams had been observed
   * by a single one. Commutative and associative.
   * @throws EmptyAccumulatorError if both operands are empty
   */
  StreamingMomentAccumulator merge(const StreamingMomentAccumulator &other) const;

  // In-place merge. Throws EmptyAccumulatorError only when both are empty.
  void merge_in(const StreamingMomentAccumulator &other);

  void reset();

private:
  StreamingMomentAccumulator(uint64_t count, double mean, double sum_sq_dev)
      : count_(count), mean_(mean), sum_sq_dev_(sum_sq_dev) {}

  uint64_t count_ = 0;
  double mean_ = 0.0;
  double sum_sq_dev_ = 0.0;
};

} // namespace stats

#endif // MOMENT_ACCUMULATOR_HPP
