#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <sys/types.h>
#include <string>
#include <vector>

#include "Config.hpp"

// Normalized analyzer output for one page load.
struct MetricsDocument {
  double performance_score{0};  // 0-100
  double largest_contentful_paint_ms{0};
  double cumulative_layout_shift{0};
  double total_blocking_time_ms{0};
  double time_to_interactive_ms{0};
  // not every analyzer version reports it
  std::optional<double> first_contentful_paint_ms;
  // synthetic placeholder; the numbers above carry no measurement
  bool degraded{false};
  std::string source;      // audited URL
  std::string diagnostic;  // why the placeholder was substituted

  nlohmann::json ToJson() const;
};

// Black-box page analyzer. Implementations return the raw report or throw
// AuditUnavailableError / AuditTimeoutError.
class Analyzer {
 public:
  virtual ~Analyzer() = default;
  virtual nlohmann::json Analyze(const std::string& target) = 0;
};

// Runs the lighthouse CLI in its own process group against a headless
// Brave or Chrome. Every call gets a fresh process and output file.
class LighthouseAnalyzer : public Analyzer {
 public:
  LighthouseAnalyzer(const RunConfig& conf,
                     const std::atomic<bool>* cancelled = nullptr);

  nlohmann::json Analyze(const std::string& target) override;

  // $CHROME_PATH when it names an executable, else Brave first when
  // preferred, then Chrome/Chromium install paths.
  static std::optional<std::filesystem::path> FindBrowser(Browser preferred);

  // argv for one audit, without the trailing null.
  std::vector<std::string> Command(const std::string& target,
                                   const std::filesystem::path& browser,
                                   const std::filesystem::path& output) const;

 private:
  // Exit status of the child; throws on timeout or cancellation.
  int Wait(pid_t pid, const std::string& target) const;

  std::string lighthouse_bin_;
  Browser browser_;
  std::chrono::seconds timeout_;
  const std::atomic<bool>* cancelled_;
};

class AuditRunner {
 public:
  explicit AuditRunner(Analyzer& analyzer);

  // Throws AuditError subclasses.
  MetricsDocument Run(const std::string& target);
  // Never throws for analyzer failures; returns a degraded placeholder.
  MetricsDocument RunWithFallback(const std::string& target);

  // Raw report of the most recent successful run; null before one.
  const nlohmann::json& LastReport() const;

  // Throws AuditUnavailableError when a required field is missing.
  static MetricsDocument Normalize(const nlohmann::json& report,
                                   const std::string& source);
  static MetricsDocument Placeholder(const std::string& source,
                                     const std::string& diagnostic);

 private:
  Analyzer& analyzer_;
  nlohmann::json last_report_;
};
