#include "reference_moments.hpp"
#include "stats_errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace stats {

namespace {

void check_batch(const std::vector<double> &values, uint32_t ddof) {
  if (values.empty()) {
    throw EmptyAccumulatorError("Moments are undefined for an empty sequence");
  }
  if (ddof >= values.size()) {
    throw InsufficientSamplesError("Variance with ddof=" +
                                   std::to_string(ddof) + " needs more than " +
                                   std::to_string(ddof) + " values, have " +
                                   std::to_string(values.size()));
  }
  for (size_t i = 0; i < values.size(); ++i) {
    if (!std::isfinite(values[i])) {
      throw InvalidInputError("Non-finite value at index " +
                              std::to_string(i));
    }
  }
}

} // namespace

BatchMoments two_pass_moments(const std::vector<double> &values,
                              uint32_t ddof) {
  check_batch(values, ddof);

  const double n = static_cast<double>(values.size());
  double sum = 0.0;
  for (double v : values)
    sum += v;
  const double mean = sum / n;

  double sum_sq = 0.0;
  for (double v : values) {
    double d = v - mean;
    sum_sq += d * d;
  }

  BatchMoments result;
  result.count = values.size();
  result.mean = mean;
  result.variance = sum_sq / (n - static_cast<double>(ddof));
  return result;
}

BatchMoments semi_naive_moments(const std::vector<double> &values,
                                uint32_t ddof) {
  check_batch(values, ddof);

  const double n = static_cast<double>(values.size());
  double sum = 0.0;
  double sum_of_squares = 0.0;
  for (double v : values) {
    sum += v;
    sum_of_squares += v * v;
  }
  const double mean = sum / n;

  BatchMoments result;
  result.count = values.size();
  result.mean = mean;
  result.variance = (sum_of_squares - n * mean * mean) /
                    (n - static_cast<double>(ddof));
  return result;
}

double relative_difference(double a, double b) {
  double scale = std::max(std::fabs(a), std::fabs(b));
  if (scale == 0.0)
    return 0.0;
  return std::fabs(a - b) / scale;
}

} // namespace stats
