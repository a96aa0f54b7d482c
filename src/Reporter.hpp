#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "AuditRunner.hpp"
#include "Optimizer.hpp"

// One metric compared across the two audits.
struct MetricDelta {
  std::string metric;  // e.g. "largest_contentful_paint_ms"
  std::string label;   // e.g. "Largest Contentful Paint"
  bool higher_is_better{false};
  std::optional<double> original;
  std::optional<double> optimized;
  // optimized - original; absent when either side is a placeholder or did
  // not report the metric
  std::optional<double> delta;

  // "improved", "regressed", "unchanged" or "n/a"
  std::string Verdict() const;
};

struct ComparisonReport {
  std::string url;
  MetricsDocument original;
  MetricsDocument optimized;
  std::vector<MetricDelta> deltas;
  std::vector<OptimizationAction> actions;
  std::size_t actions_applied{0};
  bool partial{false};
  std::vector<std::string> notes;

  nlohmann::json ToJson() const;
};

class ComparisonReporter {
 public:
  static constexpr const char* kSignConvention =
    "Delta = optimized - original. A positive Performance Score delta is an "
    "improvement; positive time and layout-shift deltas are regressions.";

  static ComparisonReport Build(const std::string& url,
                                const MetricsDocument& original,
                                const MetricsDocument& optimized,
                                const std::vector<OptimizationAction>& actions,
                                bool partial,
                                std::vector<std::string> notes = {});

  static std::string Markdown(const ComparisonReport& report);
  static std::string Html(const ComparisonReport& report);
  static std::string Json(const ComparisonReport& report);
};
