#include <gtest/gtest.h>
#include "SiteScript.hpp"
#include "TestSupport.hpp"

#include <fstream>

namespace fs = std::filesystem;

class SiteScriptTest : public ::testing::Test {
 protected:
  TempDir scripts_;

  void WriteScript(const std::string& host, const std::string& lua) {
    fs::create_directories(scripts_.path() / host);
    std::ofstream out(scripts_.path() / host / "init.lua");
    out << lua;
  }
};

TEST_F(SiteScriptTest, HintsFromProcess) {
  SCOPED_TRACE("Reads per-site hints from the host's init.lua.");
  RecordProperty("description",
                 "process(html, url) receives the page and its URL; the "
                 "returned lists become critical selectors, lazy-load "
                 "exclusions and pinned scripts.");

  WriteScript("example.com", R"lua(
function process(html, url)
  local hints = {
    critical_selectors = { ".hero", "#nav" },
    skip_lazyload = "logo",
    keep_scripts = {},
    seen_url = url,
  }
  if string.find(html, "carousel", 1, true) then
    table.insert(hints.critical_selectors, ".carousel")
  end
  return hints
end
)lua");

  SiteScript script(scripts_.path(), URL("https://example.com/"));
  ASSERT_TRUE(script.HasScript());

  const URL page("https://example.com/shop");
  auto raw = script.Process(page, "<div class='carousel'></div>");
  ASSERT_TRUE(raw.has_value());
  EXPECT_EQ((*raw)["seen_url"], page.ToString());

  SiteHints hints = script.Hints(page, "<div class='carousel'></div>");
  std::vector<std::string> selectors = {".hero", "#nav", ".carousel"};
  EXPECT_EQ(hints.critical_selectors, selectors);
  ASSERT_EQ(hints.skip_lazyload.size(), 1u);
  EXPECT_EQ(hints.skip_lazyload[0], "logo");
  EXPECT_TRUE(hints.keep_scripts.empty());
  EXPECT_FALSE(hints.Empty());
}

TEST_F(SiteScriptTest, MissingScriptMeansNoHints) {
  SCOPED_TRACE("Sites without a script get empty hints.");
  RecordProperty("description",
                 "No init.lua for the host, or no scripts directory at all, "
                 "yields no script and empty hints.");

  WriteScript("other.org", "function process(html, url) return {} end");

  SiteScript script(scripts_.path(), URL("https://example.com/"));
  EXPECT_FALSE(script.HasScript());
  EXPECT_FALSE(script.Process(URL("https://example.com/"), "").has_value());
  EXPECT_TRUE(script.Hints(URL("https://example.com/"), "").Empty());

  SiteScript none("", URL("https://example.com/"));
  EXPECT_FALSE(none.HasScript());
}

TEST_F(SiteScriptTest, BrokenScriptsAreIgnored) {
  SCOPED_TRACE("Script errors never abort a run.");
  RecordProperty("description",
                 "A syntax error, a missing process() or a runtime error all "
                 "degrade to empty hints.");

  WriteScript("syntax.example", "function process(html, url return {} end");
  SiteScript syntax(scripts_.path(), URL("https://syntax.example/"));
  EXPECT_FALSE(syntax.HasScript());

  WriteScript("noproc.example", "local x = 1");
  SiteScript noproc(scripts_.path(), URL("https://noproc.example/"));
  EXPECT_FALSE(noproc.HasScript());

  WriteScript("runtime.example",
              "function process(html, url) error('boom') end");
  SiteScript runtime(scripts_.path(), URL("https://runtime.example/"));
  ASSERT_TRUE(runtime.HasScript());
  EXPECT_FALSE(runtime.Process(URL("https://runtime.example/"), "").has_value());
  EXPECT_TRUE(runtime.Hints(URL("https://runtime.example/"), "").Empty());

  WriteScript("string.example", "function process(html, url) return 'x' end");
  SiteScript string_result(scripts_.path(), URL("https://string.example/"));
  EXPECT_TRUE(
    string_result.Hints(URL("https://string.example/"), "").Empty());
}
