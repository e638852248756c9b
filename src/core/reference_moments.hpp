#ifndef REFERENCE_MOMENTS_HPP
#define REFERENCE_MOMENTS_HPP

#include <cstdint>
#include <vector>

namespace stats {

struct BatchMoments {
  uint64_t count = 0;
  double mean = 0.0;
  double variance = 0.0;
};

/**
 * Mean and variance over a fully materialized sequence, scanning it twice:
 * once for the mean, once for the squared deviations.
 * @throws EmptyAccumulatorError, InsufficientSamplesError, InvalidInputError
 */
BatchMoments two_pass_moments(const std::vector<double> &values,
                              uint32_t ddof = 0);

/**
 * E[X^2] - E[X]^2 in a single pass. Numerically unstable: with a large
 * common offset the two terms cancel and the result can be wildly wrong or
 * even negative. Only for demonstrating that failure mode.
 */
BatchMoments semi_naive_moments(const std::vector<double> &values,
                                uint32_t ddof = 0);

// |a - b| / max(|a|, |b|), 0 when both are 0
double relative_difference(double a, double b);

} // namespace stats

#endif // REFERENCE_MOMENTS_HPP
