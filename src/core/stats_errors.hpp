#ifndef STATS_ERRORS_HPP
#define STATS_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace stats {

// Base class for every error raised by the moment accumulators
class StatsError : public std::runtime_error {
public:
  explicit StatsError(const std::string &message)
      : std::runtime_error(message) {}
};

// A non-finite observation (NaN, +/-inf) was offered
class InvalidInputError : public StatsError {
public:
  explicit InvalidInputError(const std::string &message)
      : StatsError(message) {}
};

// A moment was queried, or two operands merged, with no observations
class EmptyAccumulatorError : public StatsError {
public:
  explicit EmptyAccumulatorError(const std::string &message)
      : StatsError(message) {}
};

// The requested ddof leaves a non-positive variance divisor
class InsufficientSamplesError : public StatsError {
public:
  explicit InsufficientSamplesError(const std::string &message)
      : StatsError(message) {}
};

} // namespace stats

#endif // STATS_ERRORS_HPP
