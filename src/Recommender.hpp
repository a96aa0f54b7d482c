#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "AuditRunner.hpp"

// An analyzer audit scoring below the pass threshold.
struct AuditIssue {
  std::string id;
  std::string title;
  std::string description;
  double score{0};
};

struct Recommendation {
  std::string issue_id;
  std::string issue;       // audit title
  std::string importance;  // "high" below 0.5, else "medium"
  std::vector<std::string> steps;
  nlohmann::json code_changes = nlohmann::json::array();

  nlohmann::json ToJson() const;
};

// Analysis-only mode: turns one analyzer report into a prioritized list of
// remediation steps and a rough estimate of the reachable score.
class Recommender {
 public:
  static constexpr double kPassScore = 0.9;

  // Audits with a score below kPassScore and a details section, lowest
  // score first.
  static std::vector<AuditIssue> Issues(const nlohmann::json& report);

  static Recommendation For(const AuditIssue& issue);

  // {current_score, potential_score, percentage_improvement}; the potential
  // score never exceeds 100.
  static nlohmann::json Estimate(double current_score,
                                 const std::vector<AuditIssue>& issues);

  // The pagespeed_optimization_report.json document.
  static nlohmann::json Report(const std::string& url,
                               const MetricsDocument& metrics,
                               const nlohmann::json& raw_report,
                               const std::optional<std::string>& critical_css);
};
