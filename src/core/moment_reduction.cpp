#include "moment_reduction.hpp"
#include "logger.hpp"
#include "stats_errors.hpp"

#include <string>

namespace stats {

StreamingMomentAccumulator
merge_all(const std::vector<StreamingMomentAccumulator> &accumulators) {
  std::vector<StreamingMomentAccumulator> level;
  level.reserve(accumulators.size());
  for (const auto &acc : accumulators) {
    if (!acc.empty())
      level.push_back(acc);
  }

  if (level.empty()) {
    throw EmptyAccumulatorError("No non-empty accumulator to reduce (" +
                                std::to_string(accumulators.size()) +
                                " operands given)");
  }

  LOG(LogLevel::DEBUG, LogComponent::STATS_REDUCTION,
      "Reducing " << level.size() << " of " << accumulators.size()
                  << " accumulators");

  // Pairwise rounds keep operands of similar size together
  while (level.size() > 1) {
    std::vector<StreamingMomentAccumulator> next;
    next.reserve((level.size() + 1) / 2);
    for (size_t i = 0; i + 1 < level.size(); i += 2)
      next.push_back(level[i].merge(level[i + 1]));
    if (level.size() % 2 == 1)
      next.push_back(level.back());
    level.swap(next);
  }

  LOG(LogLevel::DEBUG, LogComponent::STATS_REDUCTION,
      "Reduced to " << level.front().count() << " observations");
  return level.front();
}

} // namespace stats
