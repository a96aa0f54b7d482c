#include <gtest/gtest.h>
#include "Recommender.hpp"

namespace {

nlohmann::json Audit(const std::string& title, nlohmann::json score,
                     bool details = true) {
  nlohmann::json a{{"title", title},
                   {"description", title + " description"},
                   {"score", score}};
  if (details)
    a["details"] = {{"type", "opportunity"}, {"items", nlohmann::json::array()}};
  return a;
}

nlohmann::json Report() {
  return nlohmann::json{
    {"categories", {{"performance", {{"score", 0.6}}}}},
    {"audits",
     {{"offscreen-images", Audit("Defer offscreen images", 0.6)},
      {"render-blocking-resources",
       Audit("Eliminate render-blocking resources", 0.3)},
      {"unminified-css", Audit("Minify CSS", 0.8)},
      {"uses-optimized-images", Audit("Efficiently encode images", 0.4)},
      {"speed-index", Audit("Speed Index", 0.95)},
      {"first-meaningful-paint", Audit("First Meaningful Paint", 0.1, false)},
      {"diagnostics", Audit("Diagnostics", nullptr)}}}};
}
}  // namespace

TEST(RecommenderTest, FailingAuditsWithDetails) {
  SCOPED_TRACE("Selects audits that fail and carry details.");
  RecordProperty("description",
                 "Audits scoring below 0.9 with a details section are issues, "
                 "lowest score first; passing, detail-less and unscored "
                 "audits are ignored.");

  auto issues = Recommender::Issues(Report());
  ASSERT_EQ(issues.size(), 4u);
  EXPECT_EQ(issues[0].id, "render-blocking-resources");
  EXPECT_EQ(issues[1].id, "uses-optimized-images");
  EXPECT_EQ(issues[2].id, "offscreen-images");
  EXPECT_EQ(issues[3].id, "unminified-css");
  EXPECT_EQ(issues[0].title, "Eliminate render-blocking resources");
  EXPECT_DOUBLE_EQ(issues[0].score, 0.3);

  EXPECT_TRUE(Recommender::Issues(nlohmann::json::object()).empty());
}

TEST(RecommenderTest, RemediationByAuditId) {
  SCOPED_TRACE("Each known audit maps to concrete steps.");
  RecordProperty("description",
                 "Importance is high below 0.5; known ids carry steps and "
                 "code examples; unknown ids get a generic step.");

  Recommendation blocking =
    Recommender::For(AuditIssue{"render-blocking-resources", "Blocking", "", 0.2});
  EXPECT_EQ(blocking.importance, "high");
  ASSERT_EQ(blocking.steps.size(), 2u);
  EXPECT_EQ(blocking.steps[0], "Add defer attribute to non-critical JavaScript");
  ASSERT_EQ(blocking.code_changes.size(), 1u);
  EXPECT_EQ(blocking.code_changes[0]["file_type"], "html");

  Recommendation lazy =
    Recommender::For(AuditIssue{"offscreen-images", "Offscreen", "", 0.7});
  EXPECT_EQ(lazy.importance, "medium");
  EXPECT_NE(lazy.code_changes[0]["example"].get<std::string>().find(
              "loading=\"lazy\""),
            std::string::npos);

  Recommendation js =
    Recommender::For(AuditIssue{"unminified-javascript", "Minify JS", "", 0.5});
  EXPECT_EQ(js.importance, "medium");
  EXPECT_EQ(js.steps[0], "Minify JAVASCRIPT files");

  Recommendation other =
    Recommender::For(AuditIssue{"font-display", "Ensure text remains visible",
                                "", 0.4});
  ASSERT_EQ(other.steps.size(), 2u);
  EXPECT_EQ(other.steps[0], "Address Ensure text remains visible");
  EXPECT_TRUE(other.code_changes.empty());
  EXPECT_EQ(other.ToJson()["issue_id"], "font-display");
}

TEST(RecommenderTest, ScoreEstimate) {
  SCOPED_TRACE("Estimates the reachable score from the issue gaps.");
  RecordProperty("description",
                 "Severe gaps count five times, others twice; the potential "
                 "score never passes 100.");

  auto issues = Recommender::Issues(Report());
  nlohmann::json est = Recommender::Estimate(60, issues);
  EXPECT_DOUBLE_EQ(est["current_score"].get<double>(), 60);
  EXPECT_NEAR(est["potential_score"].get<double>(), 66.3, 1e-9);
  EXPECT_EQ(est["percentage_improvement"], "6.3%");

  nlohmann::json capped = Recommender::Estimate(99, issues);
  EXPECT_DOUBLE_EQ(capped["potential_score"].get<double>(), 100);
  EXPECT_EQ(capped["percentage_improvement"], "1.0%");

  EXPECT_EQ(Recommender::Estimate(75, {})["percentage_improvement"], "0.0%");
}

TEST(RecommenderTest, OptimizationReport) {
  SCOPED_TRACE("Builds the analysis report document.");
  RecordProperty("description",
                 "The report lists issues, recommendations, tasks with high "
                 "importance first, automation opportunities and the "
                 "critical CSS text.");

  MetricsDocument metrics;
  metrics.source = "https://example.com/";
  metrics.performance_score = 60;
  nlohmann::json report = Recommender::Report(
    "https://example.com/", metrics, Report(), std::string{"h1{color:red}\n"});

  EXPECT_EQ(report["url"], "https://example.com/");
  EXPECT_DOUBLE_EQ(report["analysis"]["performance_score"].get<double>(), 60);
  EXPECT_EQ(report["analysis"]["critical_issues"].size(), 4u);
  EXPECT_EQ(report["recommendations"].size(), 4u);
  EXPECT_FALSE(report["analysis"].contains("diagnostic"));

  const auto& guide = report["implementation_guide"];
  EXPECT_EQ(guide["summary"], "Found 4 issues to address");
  EXPECT_EQ(guide["critical_css"], "h1{color:red}\n");

  const auto& tasks = guide["prioritized_tasks"];
  ASSERT_EQ(tasks.size(), 4u);
  EXPECT_EQ(tasks[0]["priority"], 1);
  EXPECT_EQ(tasks[0]["task"], "Eliminate render-blocking resources");
  EXPECT_EQ(tasks[1]["task"], "Efficiently encode images");
  EXPECT_EQ(tasks[2]["task"], "Defer offscreen images");

  const auto& automation = guide["automation_opportunities"];
  ASSERT_EQ(automation.size(), 2u);
  EXPECT_EQ(automation[0]["task"], "Image optimization");
  EXPECT_EQ(automation[1]["task"], "Asset minification");
}

TEST(RecommenderTest, DegradedAuditReport) {
  SCOPED_TRACE("A failed audit still yields a report.");
  RecordProperty("description",
                 "With synthetic metrics no issues are listed, the diagnostic "
                 "is included and critical CSS is null when not requested.");

  MetricsDocument metrics = AuditRunner::Placeholder(
    "https://example.com/", "audit unavailable: no Brave or Chrome");
  nlohmann::json report = Recommender::Report("https://example.com/", metrics,
                                              Report(), std::nullopt);

  EXPECT_TRUE(report["analysis"]["critical_issues"].empty());
  EXPECT_EQ(report["analysis"]["diagnostic"],
            "audit unavailable: no Brave or Chrome");
  EXPECT_TRUE(report["implementation_guide"]["critical_css"].is_null());
  EXPECT_EQ(report["implementation_guide"]["summary"],
            "Found 0 issues to address");
}
