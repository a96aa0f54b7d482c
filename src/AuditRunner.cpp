#include "AuditRunner.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <thread>

namespace {

const char* kChromeFlags = "--headless --no-sandbox --disable-gpu";

// Removes the analyzer's output file however the audit ends.
struct TempFile {
  std::filesystem::path path;
  ~TempFile() {
    if (path.empty())
      return;
    std::error_code ec;
    std::filesystem::remove(path, ec);
  }
};

std::filesystem::path MakeTempOutput() {
  std::string pattern =
    (std::filesystem::temp_directory_path() / "pagelift-lh-XXXXXX.json")
      .string();
  int fd = ::mkstemps(pattern.data(), 5);
  if (fd < 0) {
    throw AuditUnavailableError(std::string{"cannot create output file: "} +
                                std::strerror(errno));
  }
  ::close(fd);
  return pattern;
}

double RequireNumber(const nlohmann::json& report, const char* audit_id) {
  const auto audits = report.find("audits");
  if (audits == report.end() || !audits->is_object())
    throw AuditUnavailableError("report has no audits");
  const auto audit = audits->find(audit_id);
  if (audit == audits->end() || !audit->is_object())
    throw AuditUnavailableError(std::string{"missing audit "} + audit_id);
  const auto value = audit->find("numericValue");
  if (value == audit->end() || !value->is_number())
    throw AuditUnavailableError(std::string{"no numericValue for "} +
                                audit_id);
  return value->get<double>();
}

std::optional<double> OptionalNumber(const nlohmann::json& report,
                                     const char* audit_id) {
  const auto audits = report.find("audits");
  if (audits == report.end() || !audits->is_object())
    return std::nullopt;
  const auto audit = audits->find(audit_id);
  if (audit == audits->end() || !audit->is_object())
    return std::nullopt;
  const auto value = audit->find("numericValue");
  if (value == audit->end() || !value->is_number())
    return std::nullopt;
  return value->get<double>();
}
}  // namespace

nlohmann::json MetricsDocument::ToJson() const {
  nlohmann::json j{{"performance_score", performance_score},
                   {"largest_contentful_paint_ms", largest_contentful_paint_ms},
                   {"cumulative_layout_shift", cumulative_layout_shift},
                   {"total_blocking_time_ms", total_blocking_time_ms},
                   {"time_to_interactive_ms", time_to_interactive_ms},
                   {"first_contentful_paint_ms",
                    first_contentful_paint_ms
                      ? nlohmann::json(*first_contentful_paint_ms)
                      : nlohmann::json(nullptr)},
                   {"degraded", degraded},
                   {"source", source}};
  if (degraded)
    j["diagnostic"] = diagnostic;
  return j;
}

LighthouseAnalyzer::LighthouseAnalyzer(const RunConfig& conf,
                                       const std::atomic<bool>* cancelled)
    : lighthouse_bin_{conf.lighthouse_bin},
      browser_{conf.browser},
      timeout_{conf.audit_timeout},
      cancelled_{cancelled} {
}

std::optional<std::filesystem::path> LighthouseAnalyzer::FindBrowser(
  Browser preferred) {
  // same override chrome-launcher honours
  if (const char* env = std::getenv("CHROME_PATH")) {
    if (*env != '\0' && ::access(env, X_OK) == 0)
      return std::filesystem::path{env};
  }
  std::vector<const char*> candidates;
  if (preferred == Browser::Brave)
    candidates.push_back("/usr/bin/brave-browser");
  for (const char* p : {"/usr/bin/google-chrome", "/usr/bin/chromium-browser",
                        "/usr/bin/chromium"})
    candidates.push_back(p);

  for (const char* p : candidates) {
    if (::access(p, X_OK) == 0)
      return std::filesystem::path{p};
  }
  return std::nullopt;
}

std::vector<std::string> LighthouseAnalyzer::Command(
  const std::string& target, const std::filesystem::path& browser,
  const std::filesystem::path& output) const {
  return {lighthouse_bin_,
          target,
          "--output=json",
          "--output-path=" + output.string(),
          std::string{"--chrome-flags="} + kChromeFlags,
          "--only-categories=performance",
          "--chrome-path=" + browser.string()};
}

nlohmann::json LighthouseAnalyzer::Analyze(const std::string& target) {
  auto browser = FindBrowser(browser_);
  if (!browser.has_value())
    throw AuditUnavailableError("no Brave or Chrome installation found");
  if (browser_ == Browser::Brave &&
      browser->filename().string().find("brave") == std::string::npos) {
    logr::warning << "[Audit] Brave not found; using " << *browser;
  }

  TempFile output{MakeTempOutput()};
  std::vector<std::string> args = Command(target, *browser, output.path);
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (auto& a : args)
    argv.push_back(a.data());
  argv.push_back(nullptr);

  logr::info << "[Audit] " << lighthouse_bin_ << " " << target << " ("
             << BrowserName(browser_) << " at " << *browser << ")";

  bool quiet = true;
  IF_DEBUG {
    quiet = false;
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    throw AuditUnavailableError(std::string{"fork failed: "} +
                                std::strerror(errno));
  }
  if (pid == 0) {
    ::setpgid(0, 0);
    if (quiet) {
      int devnull = ::open("/dev/null", O_WRONLY);
      if (devnull >= 0) {
        ::dup2(devnull, STDOUT_FILENO);
        ::dup2(devnull, STDERR_FILENO);
        ::close(devnull);
      }
    }
    ::execvp(argv[0], argv.data());
    std::_Exit(127);
  }
  // both sides set the group so killpg works whichever runs first
  ::setpgid(pid, pid);

  const int status = Wait(pid, target);
  if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
    throw AuditUnavailableError("cannot execute " + lighthouse_bin_);
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    throw AuditUnavailableError(
      lighthouse_bin_ + " exited with status " +
      std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : -1));
  }

  std::ifstream in(output.path);
  if (!in || in.peek() == std::ifstream::traits_type::eof())
    throw AuditUnavailableError("no report written for " + target);
  nlohmann::json report = nlohmann::json::parse(in, nullptr, false);
  if (report.is_discarded() || !report.is_object())
    throw AuditUnavailableError("malformed report for " + target);
  return report;
}

int LighthouseAnalyzer::Wait(pid_t pid, const std::string& target) const {
  using namespace std::chrono_literals;
  const auto deadline = std::chrono::steady_clock::now() + timeout_;
  for (;;) {
    int status = 0;
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid)
      return status;
    if (r < 0 && errno != EINTR) {
      throw AuditUnavailableError(std::string{"waitpid: "} +
                                  std::strerror(errno));
    }

    const bool cancelled = cancelled_ != nullptr && cancelled_->load();
    if (cancelled || std::chrono::steady_clock::now() >= deadline) {
      ::killpg(pid, SIGKILL);
      while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
      }
      if (cancelled)
        throw AuditUnavailableError("cancelled while auditing " + target);
      throw AuditTimeoutError(target + " after " +
                              std::to_string(timeout_.count()) + "s");
    }
    std::this_thread::sleep_for(250ms);
  }
}

AuditRunner::AuditRunner(Analyzer& analyzer) : analyzer_{analyzer} {
}

MetricsDocument AuditRunner::Run(const std::string& target) {
  nlohmann::json report = analyzer_.Analyze(target);
  MetricsDocument metrics = Normalize(report, target);
  last_report_ = std::move(report);
  logr::info << "[Audit] " << target << ": score " << metrics.performance_score;
  return metrics;
}

MetricsDocument AuditRunner::RunWithFallback(const std::string& target) {
  try {
    return Run(target);
  } catch (const AuditError& e) {
    logr::error << "[Audit] " << e.what();
    return Placeholder(target, e.what());
  }
}

const nlohmann::json& AuditRunner::LastReport() const {
  return last_report_;
}

MetricsDocument AuditRunner::Normalize(const nlohmann::json& report,
                                       const std::string& source) {
  if (!report.is_object())
    throw AuditUnavailableError("report is not an object");

  const auto categories = report.find("categories");
  if (categories == report.end() || !categories->contains("performance"))
    throw AuditUnavailableError("report has no performance category");
  const auto& perf = categories->at("performance");
  const auto score = perf.find("score");
  if (score == perf.end() || !score->is_number())
    throw AuditUnavailableError("performance score missing");

  MetricsDocument m;
  m.source = source;
  m.performance_score = score->get<double>() * 100.0;
  m.largest_contentful_paint_ms =
    RequireNumber(report, "largest-contentful-paint");
  m.cumulative_layout_shift = RequireNumber(report, "cumulative-layout-shift");
  m.total_blocking_time_ms = RequireNumber(report, "total-blocking-time");
  m.time_to_interactive_ms = RequireNumber(report, "interactive");
  m.first_contentful_paint_ms =
    OptionalNumber(report, "first-contentful-paint");
  if (!m.first_contentful_paint_ms)
    logr::debug << "[Audit] " << source << ": no first-contentful-paint";
  return m;
}

MetricsDocument AuditRunner::Placeholder(const std::string& source,
                                         const std::string& diagnostic) {
  MetricsDocument m;
  m.degraded = true;
  m.source = source;
  m.diagnostic = diagnostic;
  return m;
}
