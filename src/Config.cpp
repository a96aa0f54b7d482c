#include "Config.hpp"
#include "Logger.hpp"

#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <vector>

using json = nlohmann::json;

const char* BrowserName(Browser b) {
  switch (b) {
    case Browser::Brave:
      return "brave";
    case Browser::Chrome:
      return "chrome";
  }
  return "unknown";
}

Config::Config()
    : config_file_([]() {
        std::vector<std::filesystem::path> dirs;
        if (const char* h = std::getenv("HOME")) {
          dirs.push_back(std::filesystem::path{h} / ".config" / "pagelift");
        }
        dirs.push_back(std::filesystem::current_path() / "pagelift");
        dirs.push_back(std::filesystem::path{"/etc"} / "pagelift");

        std::error_code ec;
        for (auto const& dir : dirs) {
          if (std::filesystem::exists(dir / "conf.json", ec)) {
            return dir / "conf.json";
          }
        }
        return std::filesystem::path{};
      }()) {
  if (config_file_.empty()) {
    logr::debug << "[Config] no conf.json found; using defaults";
    return;
  }
  Load();
}

Config::Config(const std::filesystem::path& conf_file)
    : config_file_{conf_file} {
  if (config_file_.empty() || !std::filesystem::exists(config_file_)) {
    throw std::runtime_error("pagelift config not found: " +
                             config_file_.string());
  }
  Load();
}

void Config::Load() {
  std::ifstream in{config_file_};
  if (!in.is_open()) {
    throw std::runtime_error("Failed to open " + config_file_.string());
  }

  try {
    json j;
    in >> j;

    work_dir_ = j.value("work_dir", work_dir_.string());
    reports_dir_ = j.value("reports_dir", reports_dir_.string());
    script_dir_ = j.value("script_dir", script_dir_.string());
    user_agent_list_ = j.value("user_agent_list", user_agent_list_.string());
    lighthouse_bin_ = j.value("lighthouse_bin", lighthouse_bin_);

    auto concurrency = j.value("fetch_concurrency", 0LL);
    if (concurrency > 0)
      fetch_concurrency_ = static_cast<std::size_t>(concurrency);

    auto positive_ms = [&j](const char* key, std::chrono::milliseconds dflt) {
      long long v = j.value(key, 0LL);
      return v > 0 ? std::chrono::milliseconds{v} : dflt;
    };
    auto positive_s = [&j](const char* key, std::chrono::seconds dflt) {
      long long v = j.value(key, 0LL);
      return v > 0 ? std::chrono::seconds{v} : dflt;
    };
    fetch_timeout_ = positive_ms("fetch_timeout_ms", fetch_timeout_);
    connect_timeout_ = positive_ms("connect_timeout_ms", connect_timeout_);
    run_timeout_ = positive_s("run_timeout_s", run_timeout_);
    audit_timeout_ = positive_s("audit_timeout_s", audit_timeout_);

    if (auto it = j.find("viewport"); it != j.end() && it->is_object()) {
      int w = it->value("width", viewport_.width);
      int h = it->value("height", viewport_.height);
      if (w > 0 && h > 0)
        viewport_ = Viewport{w, h};
    }

    std::string browser = j.value("browser", std::string{"brave"});
    if (browser == "chrome" || browser == "chromium") {
      browser_ = Browser::Chrome;
    } else if (browser != "brave") {
      logr::warning << "[Config] unknown browser '" << browser
                    << "', using brave";
    }
  } catch (const std::exception& ex) {
    throw std::runtime_error("Error parsing " + config_file_.string() + ": " +
                             ex.what());
  }
  logr::debug << "[Config] loaded " << config_file_;
}

const std::filesystem::path& Config::GetConfigFile() const {
  return config_file_;
}

std::filesystem::path Config::GetWorkDir() const {
  return work_dir_;
}

std::filesystem::path Config::GetReportsDir() const {
  return reports_dir_;
}

std::filesystem::path Config::GetScriptDir() const {
  return script_dir_;
}

std::filesystem::path Config::GetUserAgentList() const {
  return user_agent_list_;
}

std::size_t Config::GetFetchConcurrency() const {
  return fetch_concurrency_;
}

std::chrono::milliseconds Config::GetFetchTimeout() const {
  return fetch_timeout_;
}

std::chrono::milliseconds Config::GetConnectTimeout() const {
  return connect_timeout_;
}

std::chrono::seconds Config::GetRunTimeout() const {
  return run_timeout_;
}

std::chrono::seconds Config::GetAuditTimeout() const {
  return audit_timeout_;
}

Viewport Config::GetViewport() const {
  return viewport_;
}

std::string Config::GetLighthouseBin() const {
  return lighthouse_bin_;
}

Browser Config::GetBrowser() const {
  return browser_;
}

RunConfig RunConfig::FromConfig(const Config& conf, const URL& target) {
  RunConfig rc;
  rc.target = target;
  rc.browser = conf.GetBrowser();
  rc.work_dir = conf.GetWorkDir();
  rc.reports_dir = conf.GetReportsDir();
  rc.script_dir = conf.GetScriptDir();
  rc.user_agent_list = conf.GetUserAgentList();
  rc.fetch_concurrency = conf.GetFetchConcurrency();
  rc.fetch_timeout = conf.GetFetchTimeout();
  rc.connect_timeout = conf.GetConnectTimeout();
  rc.run_timeout = conf.GetRunTimeout();
  rc.audit_timeout = conf.GetAuditTimeout();
  rc.viewport = conf.GetViewport();
  rc.lighthouse_bin = conf.GetLighthouseBin();
  return rc;
}

std::string RunConfig::SiteKey() const {
  std::string host = target.GetHost();
  if (host.empty())
    return "example-com";
  if (target.GetPort() != 80 && target.GetPort() != 443)
    host += "_" + std::to_string(target.GetPort());
  return host;
}

std::filesystem::path RunConfig::SiteDir() const {
  if (output_dir.has_value())
    return *output_dir;
  return work_dir / SiteKey();
}
