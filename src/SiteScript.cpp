#include "SiteScript.hpp"
#include "Logger.hpp"

namespace {

bool IsArrayLike(const sol::table& tbl) {
  std::size_t i = 1;
  for (auto& pair : tbl) {
    if (!pair.first.is<int>() || pair.first.as<int>() != static_cast<int>(i)) {
      return false;
    }
    ++i;
  }
  return true;
}

std::vector<std::string> StringList(const nlohmann::json& j, const char* key) {
  std::vector<std::string> out;
  auto it = j.find(key);
  if (it == j.end())
    return out;
  if (it->is_string()) {
    out.push_back(it->get<std::string>());
  } else if (it->is_array()) {
    for (const auto& v : *it) {
      if (v.is_string() && !v.get<std::string>().empty())
        out.push_back(v.get<std::string>());
    }
  } else {
    logr::warning << "[SiteScript] '" << key << "' is not a list of strings";
  }
  return out;
}
}  // namespace

SiteScript::SiteScript(const std::filesystem::path& scripts_dir,
                       const URL& site)
    : scripts_dir_{scripts_dir}, host_{site.GetHost()} {
  InitLua();
  LoadScript();
}

void SiteScript::InitLua() {
  // only open what we need
  lua_.open_libraries(sol::lib::base, sol::lib::package, sol::lib::string,
                      sol::lib::table, sol::lib::math);
  IF_DEBUG {
    lua_["DEBUG"] = true;
  }
}

std::optional<std::filesystem::path> SiteScript::FindScript() const {
  if (scripts_dir_.empty() || host_.empty())
    return std::nullopt;
  std::filesystem::path entry = scripts_dir_ / host_ / "init.lua";
  std::error_code ec;
  if (std::filesystem::exists(entry, ec)) {
    return {entry};
  }
  logr::debug << "[SiteScript] No such file: " << host_ << "/init.lua";
  return std::nullopt;
}

bool SiteScript::LoadScript() {
  auto init_script = FindScript();
  if (!init_script.has_value())
    return false;

  logr::debug << "[SiteScript] Loading " << *init_script;

  sol::environment env(lua_, sol::create, lua_.globals());
  auto loaded = lua_.safe_script_file(init_script->string(), env,
                                      sol::script_pass_on_error);
  if (!loaded.valid()) {
    sol::error err = loaded;
    logr::warning << "[SiteScript] " << *init_script
                  << " failed to load: " << err.what();
    return false;
  }

  sol::protected_function func = env["process"];
  if (!func.valid()) {
    logr::warning << "[SiteScript] " << *init_script << " defines no process()";
    return false;
  }

  env_ = std::move(env);
  func_ = std::move(func);
  return true;
}

bool SiteScript::HasScript() const {
  return func_.valid();
}

std::optional<nlohmann::json> SiteScript::Process(
  const URL& url, const std::string& html) const {
  if (!HasScript())
    return std::nullopt;

  sol::protected_function_result result = func_(html, url.ToString());

  if (!result.valid()) {
    sol::error err = result;
    logr::warning << "[SiteScript] error: " << err.what();
    return std::nullopt;
  }

  if (result.return_count() < 1) {
    logr::warning << "[SiteScript] 'process' returned no results";
    return std::nullopt;
  }

  if (result.get_type() != sol::type::table) {
    logr::warning << "[SiteScript] 'process' did not return a table";
    IF_WARNING {
      auto t = result.get_type();
      using UT = std::underlying_type_t<sol::type>;
      logr::warning << "Lua returned type: " << static_cast<UT>(t);
    }
    return std::nullopt;
  }

  nlohmann::json result_j = LuaTableToJson(sol::table{result});

  IF_DEBUG {
    logr::debug << result_j.dump(2);
  }

  return {result_j};
}

SiteHints SiteScript::Hints(const URL& url, const std::string& html) const {
  SiteHints hints;
  auto result = Process(url, html);
  if (!result.has_value() || !result->is_object())
    return hints;
  hints.critical_selectors = StringList(*result, "critical_selectors");
  hints.skip_lazyload = StringList(*result, "skip_lazyload");
  hints.keep_scripts = StringList(*result, "keep_scripts");
  logr::info << "[SiteScript] hints for " << host_ << ": "
             << hints.critical_selectors.size() << " selector(s), "
             << hints.skip_lazyload.size() << " lazyload exclusion(s), "
             << hints.keep_scripts.size() << " pinned script(s)";
  return hints;
}

nlohmann::json SiteScript::LuaTableToJson(const sol::table& tbl) {
  nlohmann::json tbl_j;

  if (IsArrayLike(tbl)) {
    tbl_j = nlohmann::json::array();
    for (std::size_t i = 1; i <= tbl.size(); ++i) {
      tbl_j.push_back(LuaTableToJson(sol::object(tbl[i])));
    }
  } else {
    for (auto& pair : tbl) {
      const sol::object& key = pair.first;
      const sol::object& val = pair.second;

      std::string key_s;
      if (key.is<std::string>()) {
        key_s = key.as<std::string>();
      } else if (key.is<int>()) {
        key_s = std::to_string(key.as<int>());
      } else {
        key_s = "<unsupported key>";
      }

      tbl_j[key_s] = LuaTableToJson(val);
    }
  }

  return tbl_j;
}

nlohmann::json SiteScript::LuaTableToJson(const sol::object& obj) {
  switch (obj.get_type()) {
    case sol::type::nil:
      return nullptr;
    case sol::type::boolean:
      return obj.as<bool>();
    case sol::type::number:
      return obj.as<double>();
    case sol::type::string:
      return obj.as<std::string>();
    case sol::type::table:
      return LuaTableToJson(obj.as<sol::table>());
    default:
      return "<unsupported value>";
  }
}
