#include "DocumentRewriter.hpp"
#include "CssParser.hpp"
#include "Logger.hpp"
#include "SiteFetcher.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

std::string Trim(const std::string& s) {
  const char* ws = " \t\r\n\f";
  size_t b = s.find_first_not_of(ws);
  if (b == std::string::npos)
    return "";
  return s.substr(b, s.find_last_not_of(ws) - b + 1);
}

bool RelHas(const xmlNode* node, const std::string& token) {
  auto rel = HtmlDocument::Attr(node, "rel").value_or("");
  std::transform(rel.begin(), rel.end(), rel.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  std::istringstream in(rel);
  std::string t;
  while (in >> t) {
    if (t == token)
      return true;
  }
  return false;
}

bool Inside(const xmlNode* node, const char* tag) {
  for (const xmlNode* p = node->parent; p != nullptr; p = p->parent) {
    if (p->type == XML_ELEMENT_NODE && HtmlDocument::Name(p) == tag)
      return true;
  }
  return false;
}

bool InsideNoscript(const xmlNode* node) {
  return Inside(node, "noscript");
}

// <img> -> <picture><source type=image/webp srcset=...><img></picture>
void WrapInPicture(HtmlDocument& working, xmlNodePtr img,
                   const std::string& srcset) {
  xmlNodePtr picture = working.NewElement("picture");
  HtmlDocument::InsertBefore(img, picture);
  xmlUnlinkNode(img);
  xmlNodePtr source = working.NewElement("source");
  HtmlDocument::SetAttr(source, "type", "image/webp");
  HtmlDocument::SetAttr(source, "srcset", srcset);
  xmlAddChild(picture, source);
  xmlAddChild(picture, img);
}

void Remove(xmlNodePtr node) {
  xmlUnlinkNode(node);
  xmlFreeNode(node);
}
}  // namespace

DocumentRewriter::DocumentRewriter(const ResourceGraph& graph,
                                   const OptimizationResult& optimized)
    : graph_{graph}, optimized_{optimized} {
}

std::optional<std::string> DocumentRewriter::LocalTarget(const URL& url) const {
  const URL canonical = url.Canonical();
  if (const OptimizedImage* img = optimized_.ImageFor(canonical))
    return img->local_path.generic_string();
  const Resource* res = graph_.Find(canonical);
  if (res == nullptr || res->local_path.empty())
    return std::nullopt;
  return res->local_path.generic_string();
}

std::string DocumentRewriter::MapCss(const std::string& css,
                                     const URL& base) const {
  return RewriteCssUrls(css, [&](const std::string& target) {
    const URL abs = base.Resolve(target);
    if (!abs.IsValid() || !abs.IsHttp())
      return std::string{};
    return LocalTarget(abs).value_or("");
  });
}

std::string DocumentRewriter::Rewrite(HtmlDocument& working,
                                      const CriticalCssSet& critical) const {
  const URL base = SiteFetcher::DocumentBase(working, graph_.Root().url);

  // looked up before src is rewritten to a mirror path
  const std::vector<WebpSource> webp = WebpSources(working, base);
  MapReferences(working, base);
  for (const auto& w : webp)
    WrapInPicture(working, w.first, w.second);
  if (!webp.empty())
    logr::debug << "[Rewriter] " << webp.size() << " image(s) offered as WebP";
  if (!critical.Empty()) {
    DeferStylesheets(working);
    xmlNodePtr style = working.NewElement("style");
    HtmlDocument::SetText(style,
                          "\n" + MapCss(critical.Text(), graph_.Root().url));
    HtmlDocument::InsertFirst(working.EnsureHead(), style);
  } else {
    logr::info << "[Rewriter] no critical CSS; stylesheets stay blocking";
  }
  return working.Serialize();
}

std::vector<DocumentRewriter::WebpSource> DocumentRewriter::WebpSources(
  const HtmlDocument& working, const URL& base) const {
  std::vector<WebpSource> out;
  for (xmlNodePtr img : working.ElementsByTag("img")) {
    if (HtmlDocument::HasAttr(img, "srcset") || Inside(img, "picture") ||
        InsideNoscript(img))
      continue;
    auto src = HtmlDocument::Attr(img, "src");
    if (!src.has_value() || Trim(*src).empty())
      continue;
    const URL abs = base.Resolve(Trim(*src));
    if (!abs.IsValid() || !abs.IsHttp())
      continue;
    if (const OptimizedImage* variant = optimized_.WebpFor(abs.Canonical()))
      out.emplace_back(img, variant->local_path.generic_string());
  }
  return out;
}

void DocumentRewriter::MapReferences(HtmlDocument& working,
                                     const URL& base) const {
  size_t mapped = 0, absolute = 0;
  for (const auto& d : SiteFetcher::ScanDocument(working, base)) {
    auto current = HtmlDocument::Attr(d.node, d.attr);
    if (!current.has_value())
      continue;
    auto local = LocalTarget(d.ref.url);
    // unresolved references keep reaching the origin
    const std::string value = local ? *local : d.ref.url.ToString();
    if (local)
      ++mapped;
    else
      ++absolute;

    if (Trim(*current) == d.ref.raw) {
      HtmlDocument::SetAttr(d.node, d.attr, value);
      continue;
    }
    // srcset: only the first candidate is a tracked reference
    std::string text = *current;
    const size_t at = text.find(d.ref.raw);
    if (at != std::string::npos) {
      text.replace(at, d.ref.raw.size(), value);
      HtmlDocument::SetAttr(d.node, d.attr, text);
    }
  }

  for (xmlNodePtr node : working.Elements()) {
    if (HtmlDocument::Name(node) == "style") {
      HtmlDocument::SetText(node, MapCss(HtmlDocument::Text(node), base));
    } else if (auto style = HtmlDocument::Attr(node, "style")) {
      if (style->find("url(") != std::string::npos)
        HtmlDocument::SetAttr(node, "style", MapCss(*style, base));
    }
  }

  // mirror paths are relative to the page, not to the remote base
  for (xmlNodePtr node : working.ElementsByTag("base"))
    Remove(node);

  logr::debug << "[Rewriter] " << mapped << " reference(s) mapped to the mirror, "
              << absolute << " left absolute";
}

void DocumentRewriter::DeferStylesheets(HtmlDocument& working) const {
  size_t deferred = 0;
  for (xmlNodePtr node : working.ElementsByTag("link")) {
    if (InsideNoscript(node) || !RelHas(node, "stylesheet"))
      continue;
    auto href = HtmlDocument::Attr(node, "href");
    if (!href.has_value())
      continue;

    xmlNodePtr noscript = working.NewElement("noscript");
    xmlNodePtr fallback = working.NewElement("link");
    HtmlDocument::SetAttr(fallback, "rel", "stylesheet");
    HtmlDocument::SetAttr(fallback, "href", *href);
    if (auto media = HtmlDocument::Attr(node, "media"))
      HtmlDocument::SetAttr(fallback, "media", *media);
    xmlAddChild(noscript, fallback);

    HtmlDocument::SetAttr(node, "rel", "preload");
    HtmlDocument::SetAttr(node, "as", "style");
    HtmlDocument::SetAttr(node, "onload", kPreloadSwap);
    HtmlDocument::InsertAfter(node, noscript);
    ++deferred;
  }
  logr::debug << "[Rewriter] " << deferred << " stylesheet(s) loaded async";
}
