#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "AuditRunner.hpp"
#include "Config.hpp"
#include "CriticalCss.hpp"
#include "HtmlDocument.hpp"
#include "HttpTransport.hpp"
#include "LayoutProvider.hpp"
#include "MirrorStore.hpp"
#include "Reporter.hpp"
#include "Resource.hpp"
#include "SiteScript.hpp"

enum ExitCode : int {
  kExitOk = 0,
  kExitUsage = 1,
  kExitFetchFailed = 2,
  kExitAuditsFailed = 3,
  kExitCancelled = 130,
};

struct RunOutcome {
  int exit_code{kExitOk};
  bool partial{false};
  std::filesystem::path dir;  // where the artifacts went
  std::vector<std::filesystem::path> artifacts;
  std::optional<ComparisonReport> report;
};

// One run for one site. The collaborators are owned by the caller so tests
// can substitute the network, the analyzer and the layout.
class Pipeline {
 public:
  Pipeline(const RunConfig& conf, HttpTransport& transport,
           Analyzer& analyzer, LayoutProvider& layout,
           const std::atomic<bool>* cancelled = nullptr);

  // --optimize-and-test runs the full comparison; otherwise the page is
  // audited once and a recommendation report is written.
  RunOutcome Run();

 private:
  // Fetched page with everything derived from it before optimization.
  struct Site {
    ResourceGraph graph;
    std::optional<HtmlDocument> doc;
    SiteHints hints;
    std::optional<LayoutData> layout;
    CriticalCssSet critical;
    std::vector<std::string> notes;
  };

  RunOutcome OptimizeAndTest();
  RunOutcome Analyze();

  // Throws FetchError when the root document cannot be retrieved.
  Site Acquire(MirrorStore& mirror);

  bool Cancelled() const;
  bool PastDeadline() const;
  // Audit `target` unless the run was cancelled or is out of time.
  MetricsDocument Audit(AuditRunner& runner, const std::string& target);

  const RunConfig& conf_;
  HttpTransport& transport_;
  Analyzer& analyzer_;
  LayoutProvider& layout_;
  const std::atomic<bool>* cancelled_;
  std::chrono::steady_clock::time_point deadline_;
};
