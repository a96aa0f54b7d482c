#include <gtest/gtest.h>
#include "URL.hpp"

#include <unordered_set>

TEST(URLTest, BasicParsing) {
  SCOPED_TRACE(
    "Parses scheme, host, path, and query components from a basic HTTP URL.");
  RecordProperty("description",
                 "Validates that GetScheme/GetHost/GetPath/GetQuery extract "
                 "the correct parts from 'http://example.com/path?foo=bar'.");

  URL url("http://example.com/path?foo=bar#top");

  EXPECT_TRUE(url.IsValid());
  EXPECT_TRUE(url.IsHttp());
  EXPECT_EQ(url.GetScheme(), "http");
  EXPECT_EQ(url.GetHost(), "example.com");
  EXPECT_EQ(url.GetPath(), "/path");
  EXPECT_EQ(url.GetQuery(), "?foo=bar");
  EXPECT_EQ(url.GetFragment(), "top");
  EXPECT_EQ(url.GetPort(), 80);
}

TEST(URLTest, MissingPathAndQuery) {
  SCOPED_TRACE("Handles URLs with no path and no query string.");
  RecordProperty("description",
                 "Confirms that path and query are empty when the input is "
                 "just a scheme and host.");

  URL url("https://anotherdomain.org");

  EXPECT_EQ(url.GetScheme(), "https");
  EXPECT_EQ(url.GetHost(), "anotherdomain.org");
  EXPECT_EQ(url.GetPath(), "");
  EXPECT_EQ(url.GetQuery(), "");
  EXPECT_EQ(url.GetPort(), 443);
}

TEST(URLTest, RelativeResolution) {
  SCOPED_TRACE("Resolves the reference forms found in markup and CSS.");
  RecordProperty("description",
                 "Relative, parent-relative, absolute-path, protocol-relative "
                 "and absolute references resolve against a page URL.");

  URL base("https://example.com/blog/post/index.html?x=1");

  EXPECT_EQ(base.Resolve("style.css").ToString(),
            "https://example.com/blog/post/style.css");
  EXPECT_EQ(base.Resolve("../img/a.png").ToString(),
            "https://example.com/blog/img/a.png");
  EXPECT_EQ(base.Resolve("/static/app.js").ToString(),
            "https://example.com/static/app.js");
  EXPECT_EQ(base.Resolve("//cdn.example.net/lib.js").ToString(),
            "https://cdn.example.net/lib.js");
  EXPECT_EQ(base.Resolve("http://other.org/x").ToString(),
            "http://other.org/x");
  EXPECT_EQ(base.Resolve("  ./a.css  ").ToString(),
            "https://example.com/blog/post/a.css");
}

TEST(URLTest, CanonicalForm) {
  SCOPED_TRACE("Canonicalizes case, default ports, dot segments, fragments.");
  RecordProperty("description",
                 "Two spellings of the same resource share one canonical URL "
                 "and one hash identity.");

  URL a("HTTPS://Example.COM:443/a/./b/../c.css#frag");
  URL b("https://example.com/a/c.css");

  EXPECT_EQ(a.Canonical().ToString(), "https://example.com/a/c.css");
  EXPECT_EQ(a.Canonical(), b.Canonical());
  EXPECT_EQ(a.Canonical().GetID(), b.Canonical().GetID());
  EXPECT_EQ(URL("https://example.com").Canonical().ToString(),
            "https://example.com/");

  std::unordered_set<URL> set;
  set.insert(a.Canonical());
  set.insert(b.Canonical());
  EXPECT_EQ(set.size(), 1u);
}

TEST(URLTest, OriginComparison) {
  SCOPED_TRACE("Same origin requires scheme, host and effective port.");
  RecordProperty("description",
                 "GetOrigin omits default ports; SameOrigin distinguishes "
                 "scheme, host and port.");

  URL page("https://example.com/index.html");

  EXPECT_EQ(page.GetOrigin(), "https://example.com");
  EXPECT_EQ(URL("http://example.com:8080/x").GetOrigin(),
            "http://example.com:8080");
  EXPECT_TRUE(page.SameOrigin(URL("https://example.com:443/a.css")));
  EXPECT_FALSE(page.SameOrigin(URL("http://example.com/a.css")));
  EXPECT_FALSE(page.SameOrigin(URL("https://cdn.example.com/a.css")));
}

TEST(URLTest, InvalidInput) {
  SCOPED_TRACE("Rejects strings that are not absolute URLs.");
  RecordProperty("description",
                 "Bare words and non-http schemes are not fetchable.");

  EXPECT_FALSE(URL("not a url").IsValid());
  EXPECT_FALSE(URL("").IsValid());
  EXPECT_FALSE(URL("ftp://example.com/file").IsHttp());
}

TEST(URLTest, Sha256IsStable) {
  SCOPED_TRACE("SHA-256 identity is hex encoded and deterministic.");
  RecordProperty("description",
                 "GetSha256 returns 64 hex digits, identical for equal URLs.");

  URL a("https://example.com/a.png?v=1");
  URL b("https://example.com/a.png?v=1");

  EXPECT_EQ(a.GetSha256().size(), 64u);
  EXPECT_EQ(a.GetSha256(), b.GetSha256());
  EXPECT_NE(a.GetSha256(), URL("https://example.com/a.png?v=2").GetSha256());
}
