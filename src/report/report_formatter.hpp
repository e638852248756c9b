#ifndef REPORT_FORMATTER_HPP
#define REPORT_FORMATTER_HPP

#include "core/moment_accumulator.hpp"
#include "core/reference_moments.hpp"
#include "nlohmann/json.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace report {

struct ReferenceComparison {
  double two_pass_variance = 0.0;
  double semi_naive_variance = 0.0;
  double two_pass_relative_error = 0.0;
  double semi_naive_relative_error = 0.0;
};

// Point-in-time view of a stream's moments. Moments that are undefined for
// the current count are left empty.
struct MomentSummary {
  std::string stream_name;
  uint64_t count = 0;
  uint32_t ddof = 0;
  uint64_t rejected = 0;
  std::optional<double> mean;
  std::optional<double> variance;
  std::optional<double> std_dev;
  std::optional<ReferenceComparison> comparison;
};

MomentSummary summarize(const std::string &stream_name,
                        const stats::StreamingMomentAccumulator &acc,
                        uint32_t ddof, uint64_t rejected = 0);

// Recomputes the variance over the retained values with the batch formulas.
// Leaves summary.comparison empty when the accumulator variance is undefined.
void attach_reference_comparison(MomentSummary &summary,
                                 const std::vector<double> &values);

nlohmann::json summary_to_json_object(const MomentSummary &summary);

std::string format_text(const MomentSummary &summary);
std::string format_json(const MomentSummary &summary);
std::string format_prometheus(const MomentSummary &summary);

// Dispatches on "text", "json" or "prometheus"; throws std::invalid_argument
// for anything else
std::string format_summary(const MomentSummary &summary,
                           const std::string &format);

} // namespace report

#endif // REPORT_FORMATTER_HPP
