#include "report_formatter.hpp"
#include "core/logger.hpp"

#include <iomanip>
#include <map>
#include <memory>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>
#include <prometheus/text_serializer.h>
#include <sstream>
#include <stdexcept>

namespace report {

MomentSummary summarize(const std::string &stream_name,
                        const stats::StreamingMomentAccumulator &acc,
                        uint32_t ddof, uint64_t rejected) {
  MomentSummary summary;
  summary.stream_name = stream_name;
  summary.count = acc.count();
  summary.ddof = ddof;
  summary.rejected = rejected;

  if (acc.empty())
    return summary;

  summary.mean = acc.mean();
  if (ddof < acc.count()) {
    summary.variance = acc.variance(ddof);
    summary.std_dev = acc.std_dev(ddof);
  } else {
    LOG(LogLevel::WARN, LogComponent::REPORT,
        "Variance with ddof=" << ddof << " is undefined for "
                              << acc.count() << " observation(s)");
  }
  return summary;
}

void attach_reference_comparison(MomentSummary &summary,
                                 const std::vector<double> &values) {
  if (!summary.variance)
    return;

  auto two_pass = stats::two_pass_moments(values, summary.ddof);
  auto semi_naive = stats::semi_naive_moments(values, summary.ddof);

  ReferenceComparison comparison;
  comparison.two_pass_variance = two_pass.variance;
  comparison.semi_naive_variance = semi_naive.variance;
  comparison.two_pass_relative_error =
      stats::relative_difference(*summary.variance, two_pass.variance);
  comparison.semi_naive_relative_error =
      stats::relative_difference(semi_naive.variance, two_pass.variance);
  summary.comparison = comparison;

  LOG(LogLevel::DEBUG, LogComponent::REPORT,
      "Reference comparison: streaming vs two-pass rel. error "
          << comparison.two_pass_relative_error
          << ", semi-naive vs two-pass rel. error "
          << comparison.semi_naive_relative_error);
}

nlohmann::json summary_to_json_object(const MomentSummary &summary) {
  nlohmann::json j;

  auto opt_to_json = [](const std::optional<double> &opt) -> nlohmann::json {
    if (opt)
      return *opt;
    return nullptr;
  };

  j["stream"] = summary.stream_name;
  j["count"] = summary.count;
  j["ddof"] = summary.ddof;
  j["rejected"] = summary.rejected;
  j["mean"] = opt_to_json(summary.mean);
  j["variance"] = opt_to_json(summary.variance);
  j["std_dev"] = opt_to_json(summary.std_dev);

  if (summary.comparison) {
    const auto &c = *summary.comparison;
    j["reference"] = {
        {"two_pass_variance", c.two_pass_variance},
        {"semi_naive_variance", c.semi_naive_variance},
        {"two_pass_relative_error", c.two_pass_relative_error},
        {"semi_naive_relative_error", c.semi_naive_relative_error}};
  }
  return j;
}

std::string format_text(const MomentSummary &summary) {
  std::ostringstream out;
  out << std::setprecision(12);

  auto print_opt = [&out](const char *label, const std::optional<double> &opt) {
    out << std::left << std::setw(10) << label;
    if (opt)
      out << *opt;
    else
      out << "undefined";
    out << '\n';
  };

  out << "stream    " << summary.stream_name << '\n';
  out << "count     " << summary.count << '\n';
  out << "rejected  " << summary.rejected << '\n';
  out << "ddof      " << summary.ddof << '\n';
  print_opt("mean", summary.mean);
  print_opt("variance", summary.variance);
  print_opt("std_dev", summary.std_dev);

  if (summary.comparison) {
    const auto &c = *summary.comparison;
    out << "two-pass variance    " << c.two_pass_variance << " (rel. error "
        << c.two_pass_relative_error << ")\n";
    out << "semi-naive variance  " << c.semi_naive_variance << " (rel. error "
        << c.semi_naive_relative_error << ")\n";
  }
  return out.str();
}

std::string format_json(const MomentSummary &summary) {
  return summary_to_json_object(summary).dump(2);
}

std::string format_prometheus(const MomentSummary &summary) {
  auto registry = std::make_shared<prometheus::Registry>();
  const std::map<std::string, std::string> labels = {
      {"stream", summary.stream_name}};

  auto add_gauge = [&](const std::string &name, const std::string &help,
                       double value) {
    auto &family =
        prometheus::BuildGauge().Name(name).Help(help).Register(*registry);
    family.Add(labels).Set(value);
  };

  add_gauge("streamstat_observations",
            "Number of observations folded into the stream",
            static_cast<double>(summary.count));
  add_gauge("streamstat_rejected_values",
            "Input values that were not finite numbers",
            static_cast<double>(summary.rejected));
  if (summary.mean)
    add_gauge("streamstat_mean", "Running mean of the stream", *summary.mean);
  if (summary.variance)
    add_gauge("streamstat_variance",
              "Running variance of the stream (divisor count - ddof)",
              *summary.variance);
  if (summary.std_dev)
    add_gauge("streamstat_std_dev", "Running standard deviation of the stream",
              *summary.std_dev);

  prometheus::TextSerializer serializer;
  return serializer.Serialize(registry->Collect());
}

std::string format_summary(const MomentSummary &summary,
                           const std::string &format) {
  if (format == "text")
    return format_text(summary);
  if (format == "json")
    return format_json(summary);
  if (format == "prometheus")
    return format_prometheus(summary);
  throw std::invalid_argument("Unknown report format: " + format);
}

} // namespace report
