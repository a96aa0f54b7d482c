#include <gtest/gtest.h>
#include "Reporter.hpp"

namespace {

MetricsDocument Metrics(const std::string& source, double score, double lcp,
                        double cls, double tbt, double tti, double fcp) {
  MetricsDocument m;
  m.source = source;
  m.performance_score = score;
  m.largest_contentful_paint_ms = lcp;
  m.cumulative_layout_shift = cls;
  m.total_blocking_time_ms = tbt;
  m.time_to_interactive_ms = tti;
  m.first_contentful_paint_ms = fcp;
  return m;
}

const MetricDelta& DeltaOf(const ComparisonReport& r, const std::string& m) {
  for (const auto& d : r.deltas) {
    if (d.metric == m)
      return d;
  }
  throw std::runtime_error("no delta for " + m);
}

std::vector<OptimizationAction> Actions() {
  OptimizationAction applied;
  applied.target = URL("https://example.com/js/app.js");
  applied.kind = ActionKind::Defer;
  applied.before = "blocking";
  applied.after = "defer";
  OptimizationAction skipped;
  skipped.target = URL("https://example.com/img/a.gif");
  skipped.kind = ActionKind::Compress;
  skipped.applied = false;
  skipped.note = "no re-encoder for gif";
  return {applied, skipped};
}
}  // namespace

TEST(ReporterTest, DeltaSignConvention) {
  SCOPED_TRACE("Delta is optimized minus original for every metric.");
  RecordProperty("description",
                 "A higher score is an improvement; higher times and layout "
                 "shift are regressions; equal values are unchanged.");

  auto original = Metrics("https://example.com/", 70, 3000, 0.2, 500, 5000, 1500);
  auto optimized =
    Metrics("file:///tmp/optimized.html", 85, 2000, 0.25, 500, 4000, 1500);
  ComparisonReport r = ComparisonReporter::Build(
    "https://example.com/", original, optimized, Actions(), false);

  ASSERT_EQ(r.deltas.size(), 6u);
  EXPECT_EQ(r.deltas.front().metric, "performance_score");

  const auto& score = DeltaOf(r, "performance_score");
  ASSERT_TRUE(score.delta.has_value());
  EXPECT_DOUBLE_EQ(*score.delta, 15);
  EXPECT_EQ(score.Verdict(), "improved");

  const auto& lcp = DeltaOf(r, "largest_contentful_paint_ms");
  EXPECT_DOUBLE_EQ(*lcp.delta, -1000);
  EXPECT_EQ(lcp.Verdict(), "improved");

  const auto& cls = DeltaOf(r, "cumulative_layout_shift");
  EXPECT_NEAR(*cls.delta, 0.05, 1e-12);
  EXPECT_EQ(cls.Verdict(), "regressed");

  EXPECT_EQ(DeltaOf(r, "total_blocking_time_ms").Verdict(), "unchanged");
  EXPECT_EQ(r.actions_applied, 1u);
  EXPECT_TRUE(r.notes.empty());
}

TEST(ReporterTest, SyntheticSideHasNoDeltas) {
  SCOPED_TRACE("A placeholder audit is never compared.");
  RecordProperty("description",
                 "When one side is synthetic every delta is absent, the "
                 "verdict is n/a and a note names the failed side.");

  auto original = Metrics("https://example.com/", 70, 3000, 0.2, 500, 5000, 1500);
  MetricsDocument optimized = AuditRunner::Placeholder(
    "file:///tmp/optimized.html", "audit unavailable: browser crashed");
  ComparisonReport r = ComparisonReporter::Build(
    "https://example.com/", original, optimized, Actions(), true);

  for (const auto& d : r.deltas) {
    EXPECT_FALSE(d.delta.has_value()) << d.metric;
    EXPECT_EQ(d.Verdict(), "n/a");
  }
  ASSERT_EQ(r.notes.size(), 1u);
  EXPECT_EQ(r.notes[0],
            "optimized audit is synthetic: audit unavailable: browser crashed");

  nlohmann::json j = r.ToJson();
  EXPECT_TRUE(j["per_metric_delta"]["performance_score"].is_null());
  EXPECT_EQ(j["optimized_metrics"]["degraded"], true);
  EXPECT_EQ(j["partial"], true);

  const std::string md = ComparisonReporter::Markdown(r);
  EXPECT_NE(md.find("| Performance Score | 70 | synthetic | n/a | n/a |"),
            std::string::npos);
  EXPECT_NE(md.find("**Partial run**"), std::string::npos);
}

TEST(ReporterTest, MissingFirstContentfulPaintHasNoDelta) {
  SCOPED_TRACE("A metric one side did not report is not compared.");
  RecordProperty("description",
                 "Without FCP on the optimized side the other five deltas "
                 "are computed, FCP is n/a in JSON and Markdown and the run "
                 "is not treated as degraded.");

  auto original = Metrics("https://example.com/", 70, 3000, 0.2, 500, 5000, 1500);
  auto optimized =
    Metrics("file:///tmp/optimized.html", 85, 2000, 0.2, 400, 4000, 1500);
  optimized.first_contentful_paint_ms.reset();
  ComparisonReport r = ComparisonReporter::Build(
    "https://example.com/", original, optimized, Actions(), false);

  ASSERT_EQ(r.deltas.size(), 6u);
  const auto& fcp = DeltaOf(r, "first_contentful_paint_ms");
  EXPECT_FALSE(fcp.delta.has_value());
  EXPECT_EQ(fcp.Verdict(), "n/a");
  ASSERT_TRUE(DeltaOf(r, "total_blocking_time_ms").delta.has_value());
  EXPECT_DOUBLE_EQ(*DeltaOf(r, "total_blocking_time_ms").delta, -100);
  EXPECT_TRUE(r.notes.empty());

  nlohmann::json j = r.ToJson();
  EXPECT_TRUE(j["per_metric_delta"]["first_contentful_paint_ms"].is_null());
  EXPECT_TRUE(j["optimized_metrics"]["first_contentful_paint_ms"].is_null());
  EXPECT_NE(ComparisonReporter::Markdown(r).find(
              "| First Contentful Paint (ms) | 1500 | n/a | n/a | n/a |"),
            std::string::npos);
}

TEST(ReporterTest, RenderedFormats) {
  SCOPED_TRACE("Markdown, HTML and JSON carry the same comparison.");
  RecordProperty("description",
                 "Every format states the sign convention; Markdown shows "
                 "signed deltas, HTML escapes text and JSON lists actions.");

  auto original = Metrics("https://example.com/?a=1&b=<2>", 70, 3000, 0.2, 500,
                          5000, 1500);
  auto optimized =
    Metrics("file:///tmp/optimized.html", 85, 2000, 0.25, 500, 4000, 1500);
  ComparisonReport r = ComparisonReporter::Build(
    "https://example.com/?a=1&b=<2>", original, optimized, Actions(), false,
    {"1 referenced resource(s) could not be fetched"});

  const std::string md = ComparisonReporter::Markdown(r);
  EXPECT_NE(md.find(ComparisonReporter::kSignConvention), std::string::npos);
  EXPECT_NE(md.find("| Performance Score | 70 | 85 | +15 | improved |"),
            std::string::npos);
  EXPECT_NE(md.find("| Cumulative Layout Shift | 0.200 | 0.250 | +0.050 | "
                    "regressed |"),
            std::string::npos);
  EXPECT_NE(md.find("(1 of 2 applied)"), std::string::npos);
  EXPECT_NE(md.find("could not be fetched"), std::string::npos);

  const std::string html = ComparisonReporter::Html(r);
  EXPECT_NE(html.find("a=1&amp;b=&lt;2&gt;"), std::string::npos);
  EXPECT_EQ(html.find("b=<2>"), std::string::npos);
  EXPECT_NE(html.find("Delta = optimized - original."), std::string::npos);

  auto j = nlohmann::json::parse(ComparisonReporter::Json(r));
  EXPECT_EQ(j["sign_convention"], ComparisonReporter::kSignConvention);
  EXPECT_EQ(j["actions_applied"], 1);
  ASSERT_EQ(j["actions"].size(), 2u);
  EXPECT_EQ(j["actions"][1]["note"], "no re-encoder for gif");
  EXPECT_DOUBLE_EQ(j["per_metric_delta"]["largest_contentful_paint_ms"]
                     .get<double>(),
                   -1000);
}
