#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "URL.hpp"

enum class Browser { Brave, Chrome };

const char* BrowserName(Browser b);

struct Viewport {
  int width{1280};
  int height{800};
};

// Settings file, conf.json:
// {
//   "work_dir": "./implementation-tests",
//   "reports_dir": "./reports",
//   "script_dir": "/etc/pagelift/scripts",
//   "user_agent_list": "/etc/pagelift/user_agent.list",
//   "fetch_concurrency": 6,
//   "fetch_timeout_ms": 15000,
//   "connect_timeout_ms": 10000,
//   "run_timeout_s": 600,
//   "audit_timeout_s": 180,
//   "viewport": { "width": 1280, "height": 800 },
//   "lighthouse_bin": "lighthouse",
//   "browser": "brave"
// }
// Every key is optional.
class Config {
 public:
  static constexpr std::size_t kDefaultConcurrency = 6;
  static constexpr std::chrono::milliseconds kDefaultFetchTimeout{15000};
  static constexpr std::chrono::milliseconds kDefaultConnectTimeout{10000};
  static constexpr std::chrono::seconds kDefaultRunTimeout{600};
  static constexpr std::chrono::seconds kDefaultAuditTimeout{180};

  // Searches $HOME/.config/pagelift, ./pagelift and /etc/pagelift for
  // conf.json; built-in defaults when none exists.
  Config();
  // Explicit file; throws std::runtime_error if missing or malformed.
  explicit Config(const std::filesystem::path& conf_file);

  Config(const Config& conf) = default;

  const std::filesystem::path& GetConfigFile() const;
  std::filesystem::path GetWorkDir() const;
  std::filesystem::path GetReportsDir() const;
  std::filesystem::path GetScriptDir() const;
  std::filesystem::path GetUserAgentList() const;
  std::size_t GetFetchConcurrency() const;
  std::chrono::milliseconds GetFetchTimeout() const;
  std::chrono::milliseconds GetConnectTimeout() const;
  std::chrono::seconds GetRunTimeout() const;
  std::chrono::seconds GetAuditTimeout() const;
  Viewport GetViewport() const;
  std::string GetLighthouseBin() const;
  Browser GetBrowser() const;

 private:
  void Load();

  std::filesystem::path config_file_;
  std::filesystem::path work_dir_{"implementation-tests"};
  std::filesystem::path reports_dir_{"reports"};
  std::filesystem::path script_dir_;
  std::filesystem::path user_agent_list_;
  std::size_t fetch_concurrency_{kDefaultConcurrency};
  std::chrono::milliseconds fetch_timeout_{kDefaultFetchTimeout};
  std::chrono::milliseconds connect_timeout_{kDefaultConnectTimeout};
  std::chrono::seconds run_timeout_{kDefaultRunTimeout};
  std::chrono::seconds audit_timeout_{kDefaultAuditTimeout};
  Viewport viewport_{};
  std::string lighthouse_bin_{"lighthouse"};
  Browser browser_{Browser::Brave};
};

// Everything one run needs, frozen before the pipeline starts and passed by
// const reference to every stage.
struct RunConfig {
  URL target;
  Browser browser{Browser::Brave};
  bool extract_critical_css{false};
  bool optimize_and_test{false};
  // <output_dir> replaces <work_dir>/<domain> when set
  std::optional<std::filesystem::path> output_dir;
  std::filesystem::path work_dir;
  std::filesystem::path reports_dir;
  std::filesystem::path script_dir;
  std::filesystem::path user_agent_list;
  std::size_t fetch_concurrency{Config::kDefaultConcurrency};
  std::chrono::milliseconds fetch_timeout{Config::kDefaultFetchTimeout};
  std::chrono::milliseconds connect_timeout{Config::kDefaultConnectTimeout};
  std::chrono::seconds run_timeout{Config::kDefaultRunTimeout};
  std::chrono::seconds audit_timeout{Config::kDefaultAuditTimeout};
  Viewport viewport{};
  std::string lighthouse_bin{"lighthouse"};
  // stylesheet nesting followed for url()/@import discovery
  int max_css_depth{1};

  static RunConfig FromConfig(const Config& conf, const URL& target);

  // Directory holding the mirror and artifacts for this run's site.
  std::filesystem::path SiteDir() const;
  // Host of the target, "example-com" when it has none.
  std::string SiteKey() const;
};
