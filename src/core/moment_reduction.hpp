#ifndef MOMENT_REDUCTION_HPP
#define MOMENT_REDUCTION_HPP

#include "moment_accumulator.hpp"

#include <vector>

namespace stats {

/**
 * Combine independently filled accumulators with a pairwise tree of merges.
 * Empty operands are skipped.
 * @throws EmptyAccumulatorError if every operand is empty or none is given
 */
StreamingMomentAccumulator
merge_all(const std::vector<StreamingMomentAccumulator> &accumulators);

} // namespace stats

#endif // MOMENT_REDUCTION_HPP
