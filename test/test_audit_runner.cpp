#include <gtest/gtest.h>
#include "AuditRunner.hpp"
#include "Errors.hpp"
#include "TestSupport.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>

TEST(AuditRunnerTest, NormalizesLighthouseReport) {
  SCOPED_TRACE("Reads the performance score and core metrics.");
  RecordProperty("description",
                 "The 0-1 category score is scaled to 0-100 and each metric "
                 "comes from its audit's numericValue.");

  FakeAnalyzer analyzer;
  analyzer.ThenReport(LighthouseReport(0.87, 2500, 0.12, 340, 4100, 1200));
  AuditRunner runner(analyzer);

  MetricsDocument m = runner.Run("https://example.com/");
  EXPECT_DOUBLE_EQ(m.performance_score, 87);
  EXPECT_DOUBLE_EQ(m.largest_contentful_paint_ms, 2500);
  EXPECT_DOUBLE_EQ(m.cumulative_layout_shift, 0.12);
  EXPECT_DOUBLE_EQ(m.total_blocking_time_ms, 340);
  EXPECT_DOUBLE_EQ(m.time_to_interactive_ms, 4100);
  ASSERT_TRUE(m.first_contentful_paint_ms.has_value());
  EXPECT_DOUBLE_EQ(*m.first_contentful_paint_ms, 1200);
  EXPECT_FALSE(m.degraded);
  EXPECT_EQ(m.source, "https://example.com/");

  ASSERT_TRUE(runner.LastReport().is_object());
  EXPECT_TRUE(runner.LastReport().contains("audits"));
  ASSERT_EQ(analyzer.Targets().size(), 1u);
  EXPECT_EQ(analyzer.Targets()[0], "https://example.com/");

  nlohmann::json j = m.ToJson();
  EXPECT_EQ(j["degraded"], false);
  EXPECT_FALSE(j.contains("diagnostic"));
}

TEST(AuditRunnerTest, MissingFieldsAreUnavailable) {
  SCOPED_TRACE("Reports without the required fields are rejected.");
  RecordProperty("description",
                 "A missing score, a missing audit or a missing numericValue "
                 "raises AuditUnavailableError naming the field.");

  nlohmann::json no_score = LighthouseReport(0.5, 1, 0, 1, 1, 1);
  no_score["categories"]["performance"].erase("score");
  try {
    AuditRunner::Normalize(no_score, "x");
    FAIL() << "expected AuditUnavailableError";
  } catch (const AuditUnavailableError& e) {
    EXPECT_NE(std::string{e.what()}.find("performance score missing"),
              std::string::npos);
  }

  nlohmann::json no_audit = LighthouseReport(0.5, 1, 0, 1, 1, 1);
  no_audit["audits"].erase("interactive");
  try {
    AuditRunner::Normalize(no_audit, "x");
    FAIL() << "expected AuditUnavailableError";
  } catch (const AuditUnavailableError& e) {
    EXPECT_NE(std::string{e.what()}.find("missing audit interactive"),
              std::string::npos);
  }

  nlohmann::json no_value = LighthouseReport(0.5, 1, 0, 1, 1, 1);
  no_value["audits"]["total-blocking-time"].erase("numericValue");
  EXPECT_THROW(AuditRunner::Normalize(no_value, "x"), AuditUnavailableError);

  EXPECT_THROW(AuditRunner::Normalize(nlohmann::json::array(), "x"),
               AuditUnavailableError);
}

TEST(AuditRunnerTest, FirstContentfulPaintIsOptional) {
  SCOPED_TRACE("Five metrics are enough.");
  RecordProperty("description",
                 "A report without first-contentful-paint still normalizes; "
                 "the field is absent and serializes as null.");

  nlohmann::json report = LighthouseReport(0.7, 2100, 0.05, 150, 3300, 900);
  report["audits"].erase("first-contentful-paint");

  MetricsDocument m = AuditRunner::Normalize(report, "https://example.com/");
  EXPECT_FALSE(m.degraded);
  EXPECT_DOUBLE_EQ(m.performance_score, 70);
  EXPECT_DOUBLE_EQ(m.time_to_interactive_ms, 3300);
  EXPECT_FALSE(m.first_contentful_paint_ms.has_value());
  EXPECT_TRUE(m.ToJson()["first_contentful_paint_ms"].is_null());
}

TEST(AuditRunnerTest, FallbackIsDegraded) {
  SCOPED_TRACE("Analyzer failures become synthetic placeholders.");
  RecordProperty("description",
                 "RunWithFallback returns a degraded document carrying the "
                 "failure, and the last good report is kept.");

  FakeAnalyzer analyzer;
  analyzer.ThenReport(LighthouseReport(0.9, 1000, 0, 0, 2000, 800));
  analyzer.ThenUnavailable("browser crashed");
  analyzer.Then([](const std::string& target) -> nlohmann::json {
    throw AuditTimeoutError(target);
  });
  AuditRunner runner(analyzer);

  MetricsDocument good = runner.RunWithFallback("https://example.com/");
  EXPECT_FALSE(good.degraded);

  MetricsDocument crashed = runner.RunWithFallback("file:///tmp/o.html");
  EXPECT_TRUE(crashed.degraded);
  EXPECT_EQ(crashed.source, "file:///tmp/o.html");
  EXPECT_EQ(crashed.diagnostic, "audit unavailable: browser crashed");
  EXPECT_DOUBLE_EQ(crashed.performance_score, 0);
  EXPECT_EQ(crashed.ToJson()["diagnostic"],
            "audit unavailable: browser crashed");

  MetricsDocument slow = runner.RunWithFallback("file:///tmp/o.html");
  EXPECT_TRUE(slow.degraded);
  EXPECT_EQ(slow.diagnostic, "audit timed out: file:///tmp/o.html");

  EXPECT_DOUBLE_EQ(
    runner.LastReport()["categories"]["performance"]["score"].get<double>(),
    0.9);

  EXPECT_THROW(runner.Run("https://example.com/"), AuditUnavailableError);
}

TEST(LighthouseAnalyzerTest, CommandLine) {
  SCOPED_TRACE("Builds the lighthouse invocation.");
  RecordProperty("description",
                 "JSON output to the given path, headless browser flags, "
                 "performance category only and an explicit browser path.");

  RunConfig conf;
  conf.lighthouse_bin = "/opt/lh/bin/lighthouse";
  LighthouseAnalyzer analyzer(conf);

  auto argv = analyzer.Command("https://example.com/", "/usr/bin/chromium",
                               "/tmp/out.json");
  std::vector<std::string> expected = {
    "/opt/lh/bin/lighthouse",
    "https://example.com/",
    "--output=json",
    "--output-path=/tmp/out.json",
    "--chrome-flags=--headless --no-sandbox --disable-gpu",
    "--only-categories=performance",
    "--chrome-path=/usr/bin/chromium"};
  EXPECT_EQ(argv, expected);
}

TEST(LighthouseAnalyzerTest, MissingToolIsUnavailable) {
  SCOPED_TRACE("An analyzer that cannot run is reported, not fatal.");
  RecordProperty("description",
                 "A lighthouse binary that does not exist (or no browser) "
                 "raises AuditUnavailableError.");

  RunConfig conf;
  conf.lighthouse_bin = "/nonexistent/pagelift-lighthouse";
  conf.audit_timeout = std::chrono::seconds{10};
  LighthouseAnalyzer analyzer(conf);
  EXPECT_THROW(analyzer.Analyze("https://example.com/"), AuditUnavailableError);
}

TEST(LighthouseAnalyzerTest, HungAnalyzerTimesOut) {
  SCOPED_TRACE("An analyzer that never finishes is killed at the limit.");
  RecordProperty("description",
                 "With a one-second audit timeout a child that sleeps for "
                 "30 seconds raises AuditTimeoutError within a few seconds "
                 "and CHROME_PATH selects the browser.");

  TempDir tmp;
  const auto script = tmp.path() / "hang.sh";
  {
    std::ofstream(script) << "sleep 30\n";
  }
  ::setenv("CHROME_PATH", "/bin/sh", 1);
  auto browser = LighthouseAnalyzer::FindBrowser(Browser::Brave);
  ASSERT_TRUE(browser.has_value());
  EXPECT_EQ(*browser, "/bin/sh");

  // the shell stands in for lighthouse and runs the target as a script
  RunConfig conf;
  conf.lighthouse_bin = "/bin/sh";
  conf.audit_timeout = std::chrono::seconds{1};
  LighthouseAnalyzer analyzer(conf);

  const auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(analyzer.Analyze(script.string()), AuditTimeoutError);
  const auto elapsed = std::chrono::steady_clock::now() - start;
  ::unsetenv("CHROME_PATH");

  EXPECT_GE(elapsed, std::chrono::milliseconds{900});
  EXPECT_LT(elapsed, std::chrono::seconds{10});
}
