#include "Optimizer.hpp"
#include "ImageCodec.hpp"
#include "Logger.hpp"
#include "SiteFetcher.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <set>
#include <unordered_set>

namespace {

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string Trim(const std::string& s) {
  const char* ws = " \t\r\n\f";
  size_t b = s.find_first_not_of(ws);
  if (b == std::string::npos)
    return "";
  return s.substr(b, s.find_last_not_of(ws) - b + 1);
}

std::optional<double> ParsePx(const std::optional<std::string>& attr) {
  if (!attr.has_value())
    return std::nullopt;
  const std::string v = Trim(*attr);
  char* end = nullptr;
  double d = std::strtod(v.c_str(), &end);
  if (v.empty() || end == v.c_str() || d <= 0)
    return std::nullopt;
  std::string rest = Trim(end);
  if (!rest.empty() && rest != "px")
    return std::nullopt;
  return d;
}

OptimizationAction Skipped(const URL& target, ActionKind kind,
                           std::string note) {
  OptimizationAction a;
  a.target = target;
  a.kind = kind;
  a.applied = false;
  a.note = std::move(note);
  return a;
}

OptimizationAction Applied(const URL& target, ActionKind kind,
                           std::string before, std::string after,
                           std::string note = {}) {
  OptimizationAction a;
  a.target = target;
  a.kind = kind;
  a.before = std::move(before);
  a.after = std::move(after);
  a.applied = true;
  a.note = std::move(note);
  return a;
}

std::string RefError(const ResourceGraph& graph, const URL& url) {
  for (const auto& ref : graph.Refs()) {
    if (ref.url == url && !ref.error.empty())
      return ref.error;
  }
  return "not fetched";
}

bool IsInside(const xmlNode* node, const xmlNode* ancestor) {
  for (const xmlNode* p = node; p != nullptr; p = p->parent) {
    if (p == ancestor)
      return true;
  }
  return false;
}

bool NonRendering(const xmlNode* node) {
  static const std::unordered_set<std::string> kTags = {
    "script", "style", "noscript", "template", "head", "title"};
  for (const xmlNode* p = node; p != nullptr && p->type == XML_ELEMENT_NODE;
       p = p->parent) {
    if (kTags.count(HtmlDocument::Name(p)) != 0 ||
        HtmlDocument::HasAttr(p, "hidden"))
      return true;
  }
  return false;
}

bool HasVisibleText(const xmlNode* node) {
  for (const xmlNode* c = node->children; c != nullptr; c = c->next) {
    if (c->type != XML_TEXT_NODE || c->content == nullptr)
      continue;
    for (const xmlChar* p = c->content; *p != 0; ++p) {
      if (!std::isspace(*p))
        return true;
    }
  }
  return false;
}

// Index of the first element in <body> that paints something: visible text
// or an image. -1 when the body has none.
int FirstContentIndex(const std::vector<xmlNodePtr>& elements,
                      const xmlNode* body) {
  static const std::unordered_set<std::string> kMedia = {
    "img", "svg", "video", "canvas", "picture"};
  if (body == nullptr)
    return -1;
  for (size_t i = 0; i < elements.size(); ++i) {
    const xmlNode* node = elements[i];
    if (node == body || !IsInside(node, body) || NonRendering(node))
      continue;
    if (kMedia.count(HtmlDocument::Name(node)) != 0 || HasVisibleText(node))
      return static_cast<int>(i);
  }
  return -1;
}

bool IsJavaScriptType(const std::string& type) {
  return type.empty() || type == "text/javascript" ||
         type == "application/javascript" || type == "text/ecmascript" ||
         type == "application/ecmascript" || type == "application/x-javascript";
}

xmlNodePtr HintAnchor(xmlNodePtr head) {
  for (xmlNodePtr c = head->children; c != nullptr; c = c->next) {
    if (c->type != XML_ELEMENT_NODE)
      continue;
    const std::string tag = HtmlDocument::Name(c);
    if (tag != "meta" && tag != "title" && tag != "base")
      return c;
  }
  return nullptr;
}

void InsertHint(xmlNodePtr head, xmlNodePtr link) {
  if (xmlNodePtr anchor = HintAnchor(head))
    HtmlDocument::InsertBefore(anchor, link);
  else
    xmlAddChild(head, link);
}
}  // namespace

const char* ActionKindName(ActionKind k) {
  switch (k) {
    case ActionKind::ConvertFormat:
      return "ConvertFormat";
    case ActionKind::Compress:
      return "Compress";
    case ActionKind::AddDimensions:
      return "AddDimensions";
    case ActionKind::AddLazyLoad:
      return "AddLazyLoad";
    case ActionKind::Defer:
      return "Defer";
    case ActionKind::Async:
      return "Async";
    case ActionKind::AddResourceHint:
      return "AddResourceHint";
    case ActionKind::SetCacheHeader:
      return "SetCacheHeader";
  }
  return "Unknown";
}

nlohmann::json OptimizationAction::ToJson() const {
  return nlohmann::json{{"target", target.ToString()},
                        {"kind", ActionKindName(kind)},
                        {"before", before},
                        {"after", after},
                        {"applied", applied},
                        {"note", note}};
}

std::size_t OptimizationResult::AppliedCount() const {
  return static_cast<std::size_t>(
    std::count_if(actions.begin(), actions.end(),
                  [](const OptimizationAction& a) { return a.applied; }));
}

const OptimizedImage* OptimizationResult::ImageFor(const URL& url) const {
  for (const auto& img : images) {
    if (img.url == url && !img.webp)
      return &img;
  }
  return nullptr;
}

const OptimizedImage* OptimizationResult::WebpFor(const URL& url) const {
  for (const auto& img : images) {
    if (img.url == url && img.webp)
      return &img;
  }
  return nullptr;
}

ResourceOptimizer::ResourceOptimizer(SiteHints hints)
    : hints_{std::move(hints)} {
}

std::filesystem::path ResourceOptimizer::VariantPath(
  const std::filesystem::path& p) {
  std::filesystem::path out = p;
  out.replace_filename(p.stem().string() + ".opt" + p.extension().string());
  return out;
}

std::filesystem::path ResourceOptimizer::WebpPath(
  const std::filesystem::path& p) {
  std::filesystem::path out = p;
  out.replace_filename(p.filename().string() + ".webp");
  return out;
}

OptimizationResult ResourceOptimizer::Optimize(const ResourceGraph& graph,
                                               HtmlDocument& working,
                                               const CriticalCssSet& critical,
                                               const LayoutData* layout) const {
  OptimizationResult result;
  // element indices refer to the tree before any insertion
  const std::vector<xmlNodePtr> elements = working.Elements();

  ReencodeImages(graph, result);
  ImageElements(graph, working, elements, layout, result);
  Scripts(graph, working, elements, result);
  ResourceHints(graph, working, critical, result);
  CachePolicy(graph, result);

  logr::info << "[Optimizer] " << result.AppliedCount() << " of "
             << result.actions.size() << " action(s) applied";
  return result;
}

void ResourceOptimizer::ReencodeImages(const ResourceGraph& graph,
                                       OptimizationResult& result) const {
  for (const auto& res : graph.Resources()) {
    if (res->kind != ResourceKind::Image)
      continue;
    auto info = SniffImage(res->bytes);
    if (!info.has_value() || (info->format != "png" && info->format != "jpeg")) {
      result.actions.push_back(Skipped(
        res->url, ActionKind::Compress,
        "no re-encoder for " + (info ? info->format : std::string{"this format"})));
      continue;
    }
    if (res->local_path.empty()) {
      result.actions.push_back(
        Skipped(res->url, ActionKind::Compress, "no mirror copy"));
      continue;
    }
    if (info->format == "png")
      RecompressPng(*res, result);
    ConvertToWebp(*res, info->format, result);
  }
}

void ResourceOptimizer::RecompressPng(const Resource& res,
                                      OptimizationResult& result) const {
  try {
    ReencodedImage out = ReencodePng(res.bytes);
    const ActionKind kind =
      out.format_changed ? ActionKind::ConvertFormat : ActionKind::Compress;
    const std::string before = std::to_string(res.bytes.size()) + " bytes";
    const std::string after = std::to_string(out.bytes.size()) + " bytes";
    if (out.bytes.size() >= res.bytes.size()) {
      result.actions.push_back(
        Skipped(res.url, kind, "re-encoded PNG not smaller (" + after + ")"));
      return;
    }
    logr::debug << "[Optimizer] " << res.url << ": " << before << " -> "
                << after;
    result.actions.push_back(Applied(res.url, kind, before, after, out.detail));
    result.images.push_back(OptimizedImage{
      res.url, VariantPath(res.local_path), std::move(out.bytes)});
  } catch (const std::exception& e) {
    // bad_alloc included: one image never fails the run
    logr::warning << "[Optimizer] " << res.url << ": " << e.what();
    result.actions.push_back(Skipped(res.url, ActionKind::Compress, e.what()));
  }
}

void ResourceOptimizer::ConvertToWebp(const Resource& res,
                                      const std::string& format,
                                      OptimizationResult& result) const {
  try {
    std::string webp = EncodeWebp(res.bytes);
    const std::string before =
      format + ", " + std::to_string(res.bytes.size()) + " bytes";
    const std::string after =
      "webp, " + std::to_string(webp.size()) + " bytes";
    if (webp.size() >= res.bytes.size()) {
      result.actions.push_back(Skipped(res.url, ActionKind::ConvertFormat,
                                       "WebP not smaller (" + after + ")"));
      return;
    }
    logr::debug << "[Optimizer] " << res.url << ": " << before << " -> "
                << after;
    result.actions.push_back(Applied(res.url, ActionKind::ConvertFormat,
                                     before, after, "served through <picture>"));
    OptimizedImage variant{res.url, WebpPath(res.local_path), std::move(webp)};
    variant.webp = true;
    result.images.push_back(std::move(variant));
  } catch (const std::exception& e) {
    logr::warning << "[Optimizer] " << res.url << ": " << e.what();
    result.actions.push_back(
      Skipped(res.url, ActionKind::ConvertFormat, e.what()));
  }
}

void ResourceOptimizer::ImageElements(const ResourceGraph& graph,
                                      HtmlDocument& working,
                                      const std::vector<xmlNodePtr>& elements,
                                      const LayoutData* layout,
                                      OptimizationResult& result) const {
  const URL& root = graph.Root().url;
  const URL base = SiteFetcher::DocumentBase(working, root);
  bool first_above = true;

  for (size_t i = 0; i < elements.size(); ++i) {
    xmlNodePtr node = elements[i];
    if (HtmlDocument::Name(node) != "img")
      continue;

    auto src = HtmlDocument::Attr(node, "src");
    const bool has_src = src.has_value() && !Trim(*src).empty();
    const URL target = has_src ? base.Resolve(Trim(*src)).Canonical() : root;
    const Resource* res = has_src ? graph.Find(target) : nullptr;

    // width/height
    const bool has_w = HtmlDocument::HasAttr(node, "width");
    const bool has_h = HtmlDocument::HasAttr(node, "height");
    if (!has_w || !has_h) {
      std::optional<ImageInfo> info;
      if (res != nullptr)
        info = SniffImage(res->bytes);
      if (info.has_value() && info->width > 0 && info->height > 0) {
        double w = info->width, h = info->height;
        bool usable = true;
        if (has_w) {
          auto px = ParsePx(HtmlDocument::Attr(node, "width"));
          usable = px.has_value();
          if (usable) {
            h = std::round(*px * info->height / info->width);
            w = *px;
          }
        } else if (has_h) {
          auto px = ParsePx(HtmlDocument::Attr(node, "height"));
          usable = px.has_value();
          if (usable) {
            w = std::round(*px * info->width / info->height);
            h = *px;
          }
        }
        if (usable) {
          std::string before = has_w   ? "width only"
                               : has_h ? "height only"
                                       : "none";
          const auto wi = static_cast<long>(w), hi = static_cast<long>(h);
          if (!has_w)
            HtmlDocument::SetAttr(node, "width", std::to_string(wi));
          if (!has_h)
            HtmlDocument::SetAttr(node, "height", std::to_string(hi));
          result.actions.push_back(Applied(
            target, ActionKind::AddDimensions, before,
            "width=" + std::to_string(wi) + " height=" + std::to_string(hi)));
        } else {
          result.actions.push_back(Skipped(target, ActionKind::AddDimensions,
                                           "existing size is not in pixels"));
        }
      } else {
        result.actions.push_back(Skipped(
          target, ActionKind::AddDimensions,
          res == nullptr ? (has_src ? "fetch failed: " + RefError(graph, target)
                                    : std::string{"no src"})
                         : "intrinsic size not readable"));
      }
    }

    // loading / fetchpriority
    if (layout == nullptr) {
      result.actions.push_back(
        Skipped(target, ActionKind::AddLazyLoad, "no viewport data"));
      continue;
    }
    const int index = static_cast<int>(i);
    const std::string loading =
      Lower(Trim(HtmlDocument::Attr(node, "loading").value_or("")));

    if (layout->InViewport(index)) {
      if (loading == "lazy") {
        HtmlDocument::RemoveAttr(node, "loading");
        result.actions.push_back(Applied(target, ActionKind::AddResourceHint,
                                         "loading=lazy", "loading removed",
                                         "image is above the fold"));
      }
      if (first_above) {
        first_above = false;
        if (!HtmlDocument::HasAttr(node, "fetchpriority")) {
          HtmlDocument::SetAttr(node, "fetchpriority", "high");
          result.actions.push_back(
            Applied(target, ActionKind::AddResourceHint, "",
                    "fetchpriority=high", "first above-the-fold image"));
        }
      }
      continue;
    }
    if (!layout->BelowFold(index))
      continue;

    auto classes = HtmlDocument::Classes(node);
    const bool excluded =
      std::any_of(classes.begin(), classes.end(), [&](const std::string& c) {
        return std::find(hints_.skip_lazyload.begin(),
                         hints_.skip_lazyload.end(),
                         c) != hints_.skip_lazyload.end();
      });
    if (excluded) {
      result.actions.push_back(
        Skipped(target, ActionKind::AddLazyLoad, "excluded by site hints"));
    } else if (loading == "lazy") {
      continue;
    } else if (!loading.empty()) {
      result.actions.push_back(Skipped(target, ActionKind::AddLazyLoad,
                                       "loading=" + loading + " kept"));
    } else {
      HtmlDocument::SetAttr(node, "loading", "lazy");
      result.actions.push_back(
        Applied(target, ActionKind::AddLazyLoad, "", "loading=lazy",
                res == nullptr && has_src ? "below the fold; fetch failed"
                                          : "below the fold"));
    }
  }
}

void ResourceOptimizer::Scripts(const ResourceGraph& graph,
                                HtmlDocument& working,
                                const std::vector<xmlNodePtr>& elements,
                                OptimizationResult& result) const {
  const URL& root = graph.Root().url;
  const URL base = SiteFetcher::DocumentBase(working, root);
  const int first_content = FirstContentIndex(elements, working.Body());

  for (size_t i = 0; i < elements.size(); ++i) {
    xmlNodePtr node = elements[i];
    if (HtmlDocument::Name(node) != "script")
      continue;

    auto src = HtmlDocument::Attr(node, "src");
    if (!src.has_value() || Trim(*src).empty()) {
      result.actions.push_back(
        Skipped(root, ActionKind::Defer, "inline script"));
      continue;
    }
    const URL target = base.Resolve(Trim(*src)).Canonical();
    const std::string type =
      Lower(Trim(HtmlDocument::Attr(node, "type").value_or("")));
    if (type == "module") {
      result.actions.push_back(Skipped(target, ActionKind::Defer,
                                       "module script; deferred by default"));
      continue;
    }
    if (!IsJavaScriptType(type))
      continue;
    if (HtmlDocument::HasAttr(node, "defer") ||
        HtmlDocument::HasAttr(node, "async"))
      continue;

    const bool same_origin = target.SameOrigin(root);
    const ActionKind kind = same_origin ? ActionKind::Defer : ActionKind::Async;

    const std::string& s = target.ToString();
    const bool pinned = std::any_of(
      hints_.keep_scripts.begin(), hints_.keep_scripts.end(),
      [&](const std::string& k) { return s.find(k) != std::string::npos; });
    if (pinned) {
      result.actions.push_back(Skipped(target, kind, "pinned by site hints"));
      continue;
    }
    if (first_content < 0 || static_cast<int>(i) < first_content) {
      result.actions.push_back(
        Skipped(target, kind, "render-blocking before first content"));
      continue;
    }

    HtmlDocument::SetFlag(node, same_origin ? "defer" : "async");
    result.actions.push_back(Applied(target, kind, "blocking",
                                     same_origin ? "defer" : "async",
                                     same_origin ? "same origin"
                                                 : "third-party origin"));
  }
}

void ResourceOptimizer::ResourceHints(const ResourceGraph& graph,
                                      HtmlDocument& working,
                                      const CriticalCssSet& critical,
                                      OptimizationResult& result) const {
  const URL& root = graph.Root().url;
  xmlNodePtr head = working.EnsureHead();

  std::set<std::string> hinted;
  std::set<std::string> preloaded;
  for (xmlNodePtr node : working.ElementsByTag("link")) {
    const std::string rel = Lower(HtmlDocument::Attr(node, "rel").value_or(""));
    auto href = HtmlDocument::Attr(node, "href");
    if (!href.has_value())
      continue;
    const URL url = root.Resolve(Trim(*href));
    if (rel == "preconnect")
      hinted.insert(url.GetOrigin());
    else if (rel == "preload")
      preloaded.insert(url.Canonical().ToString());
  }

  for (const auto& ref : graph.Refs()) {
    if (ref.url.SameOrigin(root))
      continue;
    const std::string origin = ref.url.GetOrigin();
    if (!hinted.insert(origin).second)
      continue;

    xmlNodePtr preconnect = working.NewElement("link");
    HtmlDocument::SetAttr(preconnect, "rel", "preconnect");
    HtmlDocument::SetAttr(preconnect, "href", origin);
    InsertHint(head, preconnect);
    xmlNodePtr dns = working.NewElement("link");
    HtmlDocument::SetAttr(dns, "rel", "dns-prefetch");
    HtmlDocument::SetAttr(dns, "href", origin);
    InsertHint(head, dns);

    result.actions.push_back(Applied(URL(origin), ActionKind::AddResourceHint,
                                     "", "preconnect + dns-prefetch",
                                     "external origin"));
  }

  // fonts the critical CSS needs right away
  const std::string critical_text = critical.Text();
  for (const auto& res : graph.Resources()) {
    if (res->kind != ResourceKind::Font)
      continue;
    const std::string url = res->url.ToString();
    if (critical_text.find(url) == std::string::npos ||
        !preloaded.insert(url).second)
      continue;
    xmlNodePtr link = working.NewElement("link");
    HtmlDocument::SetAttr(link, "rel", "preload");
    HtmlDocument::SetAttr(link, "as", "font");
    HtmlDocument::SetAttr(link, "href", url);
    HtmlDocument::SetFlag(link, "crossorigin");
    InsertHint(head, link);
    result.actions.push_back(Applied(res->url, ActionKind::AddResourceHint, "",
                                     "preload as=font",
                                     "used by critical @font-face"));
  }
}

void ResourceOptimizer::CachePolicy(const ResourceGraph& graph,
                                    OptimizationResult& result) const {
  const ResourceKind kinds[] = {ResourceKind::Css, ResourceKind::Js,
                                ResourceKind::Image, ResourceKind::Font};
  const auto resources = graph.Resources();
  for (ResourceKind kind : kinds) {
    const Resource* first = nullptr;
    std::size_t count = 0;
    for (const auto& res : resources) {
      if (res->kind != kind)
        continue;
      if (first == nullptr)
        first = res.get();
      ++count;
    }
    if (first == nullptr)
      continue;
    result.actions.push_back(Applied(
      first->url, ActionKind::SetCacheHeader, "",
      std::string{"Cache-Control: "} + kStaticCacheControl,
      "recommended for " + std::to_string(count) + " " + KindName(kind) +
        " resource(s); served headers are not changed"));
  }
}
