#include <curl/curl.h>
#include <libxml/parser.h>
#include <signal.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "AuditRunner.hpp"
#include "Config.hpp"
#include "FlowLayout.hpp"
#include "HttpTransport.hpp"
#include "Logger.hpp"
#include "Pipeline.hpp"

namespace {

std::atomic<bool> g_cancelled{false};

void OnSigint(int) {
  g_cancelled.store(true);
}

struct Options {
  std::string url{"https://example.com"};
  std::optional<Browser> browser;
  bool extract_critical_css{false};
  bool optimize_and_test{false};
  std::optional<std::string> output_dir;
  std::optional<std::string> config_file;
  std::optional<long> timeout_s;
};

void Usage(std::ostream& os) {
  os << "usage: pagelift [url] [--use-brave|--use-chrome] "
        "[--extract-critical-css]\n"
        "                [--optimize-and-test] [--output-dir DIR] "
        "[--config FILE] [--timeout SECS]\n";
}

// Returns nothing after printing a diagnostic for bad arguments.
std::optional<Options> ParseArgs(int argc, char* argv[]) {
  Options opts;
  bool have_url = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto value = [&]() -> std::optional<std::string> {
      if (i + 1 >= argc) {
        std::cerr << "pagelift: " << arg << " needs a value\n";
        return std::nullopt;
      }
      return std::string{argv[++i]};
    };

    if (arg == "--use-brave") {
      opts.browser = Browser::Brave;
    } else if (arg == "--use-chrome") {
      opts.browser = Browser::Chrome;
    } else if (arg == "--extract-critical-css") {
      opts.extract_critical_css = true;
    } else if (arg == "--optimize-and-test") {
      opts.optimize_and_test = true;
    } else if (arg == "--output-dir") {
      if (!(opts.output_dir = value()))
        return std::nullopt;
    } else if (arg == "--config") {
      if (!(opts.config_file = value()))
        return std::nullopt;
    } else if (arg == "--timeout") {
      auto v = value();
      if (!v)
        return std::nullopt;
      try {
        size_t used = 0;
        long secs = std::stol(*v, &used);
        if (used != v->size() || secs <= 0)
          throw std::invalid_argument("not a positive number");
        opts.timeout_s = secs;
      } catch (const std::exception&) {
        std::cerr << "pagelift: bad --timeout value: " << *v << "\n";
        return std::nullopt;
      }
    } else if (arg == "-h" || arg == "--help") {
      Usage(std::cout);
      std::exit(kExitOk);
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "pagelift: unknown option " << arg << "\n";
      return std::nullopt;
    } else if (!have_url) {
      opts.url = arg;
      have_url = true;
    } else {
      std::cerr << "pagelift: more than one URL given\n";
      return std::nullopt;
    }
  }
  return opts;
}

// Process-wide library state for the lifetime of main().
struct Libraries {
  Libraries() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    xmlInitParser();
  }
  ~Libraries() {
    xmlCleanupParser();
    curl_global_cleanup();
  }
};
}  // namespace

int main(int argc, char* argv[]) {
  auto opts = ParseArgs(argc, argv);
  if (!opts.has_value()) {
    Usage(std::cerr);
    return kExitUsage;
  }

  std::string target = opts->url;
  if (target.find("://") == std::string::npos)
    target = "https://" + target;
  URL url(target);
  if (!url.IsValid() || !url.IsHttp()) {
    logr::error << "Not an http(s) URL: " << opts->url;
    return kExitUsage;
  }

  std::optional<Config> conf;
  try {
    if (opts->config_file.has_value())
      conf.emplace(std::filesystem::path{*opts->config_file});
    else
      conf.emplace();
  } catch (const std::exception& e) {
    logr::error << "Configuration error: " << e.what();
    return kExitUsage;
  }

  RunConfig rc = RunConfig::FromConfig(*conf, url);
  if (opts->browser.has_value())
    rc.browser = *opts->browser;
  rc.extract_critical_css = opts->extract_critical_css;
  rc.optimize_and_test = opts->optimize_and_test;
  if (opts->output_dir.has_value())
    rc.output_dir = std::filesystem::path{*opts->output_dir};
  if (opts->timeout_s.has_value())
    rc.run_timeout = std::chrono::seconds{*opts->timeout_s};

  logr::info << "  config: "
             << (conf->GetConfigFile().empty() ? std::string{"(defaults)"}
                                               : conf->GetConfigFile().string());
  logr::info << "work dir: " << rc.work_dir;
  logr::info << " reports: " << rc.reports_dir;
  logr::info << " scripts: " << rc.script_dir;

  struct sigaction sa {};
  sa.sa_handler = OnSigint;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);

  Libraries libs;
  CurlTransport transport(rc);
  LighthouseAnalyzer analyzer(rc, &g_cancelled);
  FlowLayout layout;

  Pipeline pipeline(rc, transport, analyzer, layout, &g_cancelled);
  RunOutcome outcome;
  try {
    outcome = pipeline.Run();
  } catch (const std::exception& e) {
    logr::error << "pagelift failed: " << e.what();
    return kExitUsage;
  }

  if (outcome.report.has_value()) {
    for (const auto& d : outcome.report->deltas) {
      logr::info << "  " << d.label << ": "
                 << (d.delta ? std::to_string(*d.delta) : std::string{"n/a"})
                 << " (" << d.Verdict() << ")";
    }
  }
  for (const auto& p : outcome.artifacts)
    logr::info << "wrote " << p.string();
  return outcome.exit_code;
}
