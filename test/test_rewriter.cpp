#include <gtest/gtest.h>
#include "DocumentRewriter.hpp"
#include "SiteFetcher.hpp"
#include "TestSupport.hpp"

namespace {

const char* kPage =
  "<html><head><title>T</title>"
  "<link rel='stylesheet' href='css/site.css' media='screen'>"
  "<style>.a{background:url(/img/bg.png)}</style>"
  "</head><body>"
  "<h1>Hi</h1>"
  "<img id='logo' src='img/logo.png'>"
  "<img id='remote' src='https://cdn.example.net/missing.png'>"
  "<picture><source id='src' srcset='img/logo.png 1x, img/logo@2x.png 2x'>"
  "</picture>"
  "<div id='banner' style=\"background:url('/img/bg.png')\">x</div>"
  "</body></html>";

xmlNodePtr ById(const HtmlDocument& doc, const std::string& id) {
  for (xmlNodePtr node : doc.Elements()) {
    if (HtmlDocument::Attr(node, "id") == id)
      return node;
  }
  return nullptr;
}

xmlNodePtr FirstElementChild(xmlNodePtr parent) {
  for (xmlNodePtr c = parent->children; c != nullptr; c = c->next) {
    if (c->type == XML_ELEMENT_NODE)
      return c;
  }
  return nullptr;
}

struct Site {
  TempDir tmp;
  RunConfig conf;
  FakeTransport transport;
  std::unique_ptr<MirrorStore> mirror;
  ResourceGraph graph;
  OptimizationResult optimized;

  Site() {
    transport.Serve("https://example.com/", kPage, "text/html");
    transport.Serve("https://example.com/css/site.css",
                    "body{background:url(../img/bg.png)}", "text/css");
    transport.Serve("https://example.com/img/bg.png", MakePng(8, 8),
                    "image/png");
    transport.Serve("https://example.com/img/logo.png", MakePng(32, 32),
                    "image/png");

    mirror =
      std::make_unique<MirrorStore>(tmp.path(), URL("https://example.com/"));
    SiteFetcher fetcher(conf, transport, *mirror);
    FetchControl ctl;
    graph = fetcher.Fetch(URL("https://example.com/"), ctl);

    optimized.images.push_back(
      OptimizedImage{URL("https://example.com/img/logo.png").Canonical(),
                     "img/logo.opt.png", "png"});
  }

  HtmlDocument Working() const {
    return HtmlDocument::Parse(graph.Root().bytes, "https://example.com/");
  }
};

CriticalCssSet Critical() {
  CriticalCssSet critical;
  critical.rules = {"h1{background:url(https://example.com/img/bg.png)}"};
  return critical;
}
}  // namespace

TEST(RewriterTest, InlinesCriticalCssAndDefersStylesheets) {
  SCOPED_TRACE("Critical CSS leads <head>; stylesheets load asynchronously.");
  RecordProperty("description",
                 "The critical <style> is the first child of <head>, each "
                 "stylesheet link becomes a preload with an onload swap and "
                 "a <noscript> fallback keeps the original link.");

  Site site;
  HtmlDocument working = site.Working();
  DocumentRewriter rewriter(site.graph, site.optimized);
  const std::string html = rewriter.Rewrite(working, Critical());

  auto out = HtmlDocument::Parse(html, "file:///optimized.html");
  xmlNodePtr first = FirstElementChild(out.Head());
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(HtmlDocument::Name(first), "style");
  EXPECT_NE(HtmlDocument::Text(first).find("h1{background:url(img/bg.png)}"),
            std::string::npos);

  xmlNodePtr preload = nullptr;
  xmlNodePtr fallback = nullptr;
  for (xmlNodePtr link : out.ElementsByTag("link")) {
    if (HtmlDocument::Attr(link, "rel") == "preload")
      preload = link;
    else if (HtmlDocument::Attr(link, "rel") == "stylesheet")
      fallback = link;
  }
  ASSERT_NE(preload, nullptr);
  EXPECT_EQ(HtmlDocument::Attr(preload, "as"), "style");
  EXPECT_EQ(HtmlDocument::Attr(preload, "href"), "css/site.css");
  EXPECT_EQ(HtmlDocument::Attr(preload, "onload"),
            DocumentRewriter::kPreloadSwap);

  ASSERT_NE(fallback, nullptr);
  ASSERT_NE(fallback->parent, nullptr);
  EXPECT_EQ(HtmlDocument::Name(fallback->parent), "noscript");
  EXPECT_EQ(HtmlDocument::Attr(fallback, "href"), "css/site.css");
  EXPECT_EQ(HtmlDocument::Attr(fallback, "media"), "screen");
}

TEST(RewriterTest, MapsReferencesToTheMirror) {
  SCOPED_TRACE("Resolved references point at local copies.");
  RecordProperty("description",
                 "Re-encoded variants win over originals, srcset keeps its "
                 "other candidates, CSS in <style> and style attributes is "
                 "mapped, and unresolved references become absolute URLs.");

  Site site;
  HtmlDocument working = site.Working();
  DocumentRewriter rewriter(site.graph, site.optimized);
  auto out = HtmlDocument::Parse(rewriter.Rewrite(working, Critical()),
                                 "file:///optimized.html");

  EXPECT_EQ(HtmlDocument::Attr(ById(out, "logo"), "src"), "img/logo.opt.png");
  EXPECT_EQ(HtmlDocument::Attr(ById(out, "remote"), "src"),
            "https://cdn.example.net/missing.png");
  EXPECT_EQ(HtmlDocument::Attr(ById(out, "src"), "srcset"),
            "img/logo.opt.png 1x, img/logo@2x.png 2x");
  EXPECT_EQ(HtmlDocument::Attr(ById(out, "banner"), "style"),
            "background:url('img/bg.png')");

  bool mapped_style = false;
  for (xmlNodePtr style : out.ElementsByTag("style")) {
    if (HtmlDocument::Text(style) == ".a{background:url(img/bg.png)}")
      mapped_style = true;
  }
  EXPECT_TRUE(mapped_style);

  EXPECT_EQ(rewriter.LocalTarget(URL("https://example.com/css/site.css")),
            "css/site.css");
  EXPECT_FALSE(
    rewriter.LocalTarget(URL("https://cdn.example.net/missing.png")).has_value());
}

TEST(RewriterTest, WebpVariantIsOfferedThroughPicture) {
  SCOPED_TRACE("Browsers that decode WebP pick the smaller variant.");
  RecordProperty("description",
                 "A plain <img> with a WebP variant is wrapped in <picture> "
                 "with a type=image/webp <source> first, the <img> keeps "
                 "its fallback src and images without a variant are left "
                 "alone.");

  Site site;
  OptimizedImage webp{URL("https://example.com/img/logo.png").Canonical(),
                      "img/logo.png.webp", "RIFF"};
  webp.webp = true;
  site.optimized.images.push_back(webp);

  HtmlDocument working = site.Working();
  DocumentRewriter rewriter(site.graph, site.optimized);
  auto out = HtmlDocument::Parse(rewriter.Rewrite(working, Critical()),
                                 "file:///optimized.html");

  xmlNodePtr logo = ById(out, "logo");
  ASSERT_NE(logo, nullptr);
  EXPECT_EQ(HtmlDocument::Attr(logo, "src"), "img/logo.opt.png");
  ASSERT_NE(logo->parent, nullptr);
  ASSERT_EQ(HtmlDocument::Name(logo->parent), "picture");
  xmlNodePtr source = FirstElementChild(logo->parent);
  ASSERT_NE(source, nullptr);
  EXPECT_EQ(HtmlDocument::Name(source), "source");
  EXPECT_EQ(HtmlDocument::Attr(source, "type"), "image/webp");
  EXPECT_EQ(HtmlDocument::Attr(source, "srcset"), "img/logo.png.webp");

  xmlNodePtr remote = ById(out, "remote");
  ASSERT_NE(remote, nullptr);
  EXPECT_NE(HtmlDocument::Name(remote->parent), "picture");
  EXPECT_EQ(out.ElementsByTag("picture").size(), 2u);
}

TEST(RewriterTest, EmptyCriticalCssKeepsStylesheetsBlocking) {
  SCOPED_TRACE("Without critical CSS nothing is made asynchronous.");
  RecordProperty("description",
                 "No <style> is inserted and stylesheet links keep "
                 "rel=stylesheet when the critical set is empty.");

  Site site;
  HtmlDocument working = site.Working();
  DocumentRewriter rewriter(site.graph, site.optimized);
  auto out = HtmlDocument::Parse(rewriter.Rewrite(working, CriticalCssSet{}),
                                 "file:///optimized.html");

  EXPECT_TRUE(out.ElementsByTag("noscript").empty());
  auto links = out.ElementsByTag("link");
  ASSERT_EQ(links.size(), 1u);
  EXPECT_EQ(HtmlDocument::Attr(links[0], "rel"), "stylesheet");
  EXPECT_EQ(HtmlDocument::Attr(links[0], "href"), "css/site.css");
}

TEST(RewriterTest, OutputIsDeterministic) {
  SCOPED_TRACE("Same inputs, same bytes.");
  RecordProperty("description",
                 "Rewriting two copies of the same document produces "
                 "identical output.");

  Site site;
  DocumentRewriter rewriter(site.graph, site.optimized);
  HtmlDocument a = site.Working();
  HtmlDocument b = site.Working().Clone();
  EXPECT_EQ(rewriter.Rewrite(a, Critical()), rewriter.Rewrite(b, Critical()));
}
