#include <gtest/gtest.h>
#include "Errors.hpp"
#include "FlowLayout.hpp"
#include "TestSupport.hpp"

namespace {

int IndexById(const HtmlDocument& doc, const std::string& id) {
  for (xmlNodePtr node : doc.Elements()) {
    if (HtmlDocument::Attr(node, "id") == id)
      return doc.IndexOf(node);
  }
  return -1;
}

ResourceGraph GraphWithImage(const std::string& url, const std::string& png) {
  auto root = std::make_shared<Resource>();
  root->url = URL("https://example.com/");
  root->kind = ResourceKind::Html;
  ResourceGraph graph(root);

  auto img = std::make_shared<Resource>();
  img->url = URL(url).Canonical();
  img->kind = ResourceKind::Image;
  img->bytes = png;
  graph.Resolve(img->url, img);
  return graph;
}
}  // namespace

TEST(FlowLayoutTest, FoldClassification) {
  SCOPED_TRACE("Stacks blocks vertically and classifies them by the fold.");
  RecordProperty("description",
                 "Content at the top intersects the viewport; content after "
                 "a tall image starts below the fold.");

  auto doc = HtmlDocument::Parse(
    "<html><body>"
    "<h1 id='title'>Title</h1>"
    "<img id='spacer' src='spacer.gif' width='600' height='2000'>"
    "<p id='footer'>Footer text</p>"
    "<div id='hidden' style='display: none'><p>x</p></div>"
    "</body></html>",
    "https://example.com/");

  FlowLayout flow;
  ResourceGraph graph;
  LayoutData layout = flow.Layout(doc, graph, Viewport{1280, 800});

  const int title = IndexById(doc, "title");
  const int spacer = IndexById(doc, "spacer");
  const int footer = IndexById(doc, "footer");

  auto title_box = layout.BoxOf(title);
  ASSERT_TRUE(title_box.has_value());
  EXPECT_DOUBLE_EQ(title_box->x, FlowLayout::kBodyMargin);
  EXPECT_DOUBLE_EQ(title_box->y, FlowLayout::kBodyMargin);
  EXPECT_DOUBLE_EQ(title_box->width, 1280 - 2 * FlowLayout::kBodyMargin);

  EXPECT_TRUE(layout.InViewport(title));
  EXPECT_FALSE(layout.BelowFold(title));
  EXPECT_TRUE(layout.InViewport(spacer));
  EXPECT_DOUBLE_EQ(layout.BoxOf(spacer)->height, 2000);
  EXPECT_FALSE(layout.InViewport(footer));
  EXPECT_TRUE(layout.BelowFold(footer));

  EXPECT_FALSE(layout.BoxOf(IndexById(doc, "hidden")).has_value());
  EXPECT_FALSE(layout.BelowFold(9999));
}

TEST(FlowLayoutTest, ImageSizes) {
  SCOPED_TRACE("Replaced elements use attribute or intrinsic size.");
  RecordProperty("description",
                 "Missing dimensions come from the fetched image, one given "
                 "dimension keeps the aspect ratio, and wide images are "
                 "clamped to the container.");

  auto doc = HtmlDocument::Parse(
    "<html><body>"
    "<img id='natural' src='img/hero.png'>"
    "<img id='scaled' src='img/hero.png' width='320'>"
    "<img id='wide' src='other.png' width='2000' height='100'>"
    "<img id='unknown' src='missing.png'>"
    "</body></html>",
    "https://example.com/");

  ResourceGraph graph =
    GraphWithImage("https://example.com/img/hero.png", MakePng(640, 320));
  FlowLayout flow;
  LayoutData layout = flow.Layout(doc, graph, Viewport{1280, 800});

  auto natural = layout.BoxOf(IndexById(doc, "natural"));
  ASSERT_TRUE(natural.has_value());
  EXPECT_DOUBLE_EQ(natural->width, 640);
  EXPECT_DOUBLE_EQ(natural->height, 320);

  auto scaled = layout.BoxOf(IndexById(doc, "scaled"));
  ASSERT_TRUE(scaled.has_value());
  EXPECT_DOUBLE_EQ(scaled->width, 320);
  EXPECT_DOUBLE_EQ(scaled->height, 160);
  EXPECT_DOUBLE_EQ(scaled->y, natural->y + natural->height);

  auto wide = layout.BoxOf(IndexById(doc, "wide"));
  ASSERT_TRUE(wide.has_value());
  EXPECT_DOUBLE_EQ(wide->width, 1264);
  EXPECT_NEAR(wide->height, 63.2, 1e-9);

  auto unknown = layout.BoxOf(IndexById(doc, "unknown"));
  ASSERT_TRUE(unknown.has_value());
  EXPECT_DOUBLE_EQ(unknown->width, 300);
  EXPECT_DOUBLE_EQ(unknown->height, 150);
}

TEST(FlowLayoutTest, EmptyBodyHasNoViewportData) {
  SCOPED_TRACE("A page with nothing rendered yields no geometry.");
  RecordProperty("description",
                 "An empty <body> raises NoViewportDataError rather than "
                 "returning a layout without content.");

  auto doc = HtmlDocument::Parse("<html><body></body></html>",
                                 "https://example.com/");
  FlowLayout flow;
  ResourceGraph graph;
  EXPECT_THROW(flow.Layout(doc, graph, Viewport{}), NoViewportDataError);
}
