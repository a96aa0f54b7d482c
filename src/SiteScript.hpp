#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <sol/sol.hpp>
#include <string>
#include <vector>

#include "URL.hpp"

// Per-site overrides returned by a site script.
struct SiteHints {
  std::vector<std::string> critical_selectors;  // always kept in critical CSS
  std::vector<std::string> skip_lazyload;       // img classes never lazy-loaded
  std::vector<std::string> keep_scripts;        // src substrings left as-is

  bool Empty() const {
    return critical_selectors.empty() && skip_lazyload.empty() &&
           keep_scripts.empty();
  }
};

// Optional <scripts_dir>/<host>/init.lua defining
//
//   function process(html, url)
//     return { critical_selectors = { ".hero" }, skip_lazyload = { "logo" },
//              keep_scripts = { "analytics.js" } }
//   end
class SiteScript {
 public:
  SiteScript(const std::filesystem::path& scripts_dir, const URL& site);

  bool HasScript() const;

  /// Raw result table of `process`, nullopt without a script or on error.
  std::optional<nlohmann::json> Process(const URL& url,
                                        const std::string& html) const;

  /// Hints from Process(); empty when there is nothing usable.
  SiteHints Hints(const URL& url, const std::string& html) const;

 private:
  void InitLua();
  std::optional<std::filesystem::path> FindScript() const;
  bool LoadScript();
  static nlohmann::json LuaTableToJson(const sol::table& obj);
  static nlohmann::json LuaTableToJson(const sol::object& obj);

  std::filesystem::path scripts_dir_;
  std::string host_;
  sol::state lua_;
  sol::environment env_;
  sol::protected_function func_;
};
