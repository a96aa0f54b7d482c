#include "SiteFetcher.hpp"
#include "CssParser.hpp"
#include "Errors.hpp"
#include "Gate.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>

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
  size_t e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

bool StartsWith(const std::string& s, const char* prefix) {
  return s.rfind(prefix, 0) == 0;
}

std::vector<std::string> Tokens(const std::string& s) {
  std::vector<std::string> out;
  std::istringstream in(Lower(s));
  std::string t;
  while (in >> t)
    out.push_back(t);
  return out;
}

bool Has(const std::vector<std::string>& v, const char* t) {
  return std::find(v.begin(), v.end(), t) != v.end();
}

// "a.png 1x, b.png 2x" -> "a.png"
std::string FirstSrcsetCandidate(const std::string& srcset) {
  std::string first = Trim(srcset.substr(0, srcset.find(',')));
  return first.substr(0, first.find_first_of(" \t\r\n"));
}

std::string ErrorOf(const HttpResponse& resp) {
  if (!resp.GetError().empty())
    return resp.GetError();
  return "HTTP " + std::to_string(resp.GetStatusCode());
}
}  // namespace

SiteFetcher::SiteFetcher(const RunConfig& conf, HttpTransport& transport,
                         MirrorStore& mirror)
    : conf_{conf}, transport_{transport}, mirror_{mirror} {
}

ResourceGraph SiteFetcher::Fetch(const URL& root_url, const FetchControl& ctl) {
  const URL requested = root_url.Canonical();
  logr::info << "[SiteFetcher] fetching " << requested;

  HttpResponse resp = transport_.Get(requested, ctl);
  if (!resp.IsOkay()) {
    throw FetchError(requested.ToString(), ErrorOf(resp));
  }

  const URL effective = resp.GetEffectiveUrl().IsValid()
                          ? resp.GetEffectiveUrl().Canonical()
                          : requested;
  if (effective != requested) {
    logr::debug << "[SiteFetcher] redirected to " << effective;
  }

  auto root = std::make_shared<Resource>();
  root->url = effective;
  root->kind = ResourceKind::Html;
  root->bytes = resp.GetBody();
  root->content_type = resp.GetContentType();
  root->local_path = mirror_.LocalPathFor(effective, ResourceKind::Html);
  if (!mirror_.Store(root->local_path, root->bytes)) {
    logr::warning << "[SiteFetcher] could not mirror the root document";
  }

  {
    std::lock_guard<std::mutex> lk(seen_mu_);
    seen_.clear();
    seen_.insert(effective);
    seen_.insert(requested);
  }

  std::vector<DocumentRef> found;
  try {
    HtmlDocument doc = HtmlDocument::Parse(root->bytes, effective.ToString());
    found = ScanDocument(doc, DocumentBase(doc, effective));
  } catch (const std::runtime_error& e) {
    throw FetchError(requested.ToString(), e.what());
  }

  // the page itself, under either URL, is already fetched
  auto is_root = [&](const URL& url) {
    return url == effective || url == requested;
  };

  ResourceGraph graph(root);
  std::vector<ResourceRef> wave;
  for (auto& d : found) {
    if (is_root(d.ref.url))
      continue;
    graph.AddRef(d.ref);
    if (Claim(d.ref.url))
      wave.push_back(d.ref);
  }
  logr::info << "[SiteFetcher] " << wave.size() << " resource(s) referenced by "
             << effective;

  std::vector<ResourceRef> discovered = RunWave(wave, graph, ctl);
  while (!discovered.empty()) {
    std::vector<ResourceRef> next;
    for (auto& child : discovered) {
      if (is_root(child.url))
        continue;
      if (child.depth > conf_.max_css_depth) {
        if (child.origin != RefOrigin::CssImport) {
          IF_DEBUG {
            logr::debug << "[SiteFetcher] not following " << child.url
                        << " at depth " << child.depth;
          }
          continue;
        }
        const bool first = Claim(child.url);
        graph.AddRef(child);
        if (first) {
          logr::warning << "[SiteFetcher] @import " << child.url << " in "
                        << child.referrer << " exceeds the nesting limit";
          graph.MarkUnresolved(child.url, "depth limit");
        }
        continue;
      }
      const bool first = Claim(child.url);
      graph.AddRef(child);
      if (first)
        next.push_back(std::move(child));
    }
    discovered = RunWave(next, graph, ctl);
  }

  if (graph.HasUnresolved()) {
    logr::warning << "[SiteFetcher] " << graph.UnresolvedCount()
                  << " reference(s) unresolved";
  }
  return graph;
}

bool SiteFetcher::Claim(const URL& url) {
  std::lock_guard<std::mutex> lk(seen_mu_);
  return seen_.insert(url).second;
}

std::vector<ResourceRef> SiteFetcher::RunWave(
  const std::vector<ResourceRef>& wave, ResourceGraph& graph,
  const FetchControl& ctl) {
  std::vector<ResourceRef> discovered;
  if (wave.empty())
    return discovered;

  Gate gate(conf_.fetch_concurrency);
  std::vector<Pending> pending;
  pending.reserve(wave.size());

  for (const auto& ref : wave) {
    if (!gate.acquire_until(ctl.deadline, ctl.cancelled)) {
      const bool cancelled = ctl.IsCancelled();
      graph.MarkUnresolved(ref.url,
                           cancelled ? "cancelled" : "run deadline reached",
                           !cancelled);
      continue;
    }
    try {
      pending.push_back(Pending{
        ref, std::async(std::launch::async, [this, ref, &ctl, &gate]() {
          Gate::Permit permit{gate};
          return FetchOne(ref, ctl);
        })});
    } catch (const std::exception& e) {
      // If thread creation fails, don't leak the permit
      gate.release();
      logr::error << "[SiteFetcher] failed to start fetch of " << ref.url
                  << ": " << e.what();
      graph.MarkUnresolved(ref.url, e.what());
    }
  }

  // Outcomes are folded in scheduling order so the graph never depends on
  // which worker finished first.
  using namespace std::chrono_literals;
  for (size_t i = 0; i < pending.size(); ++i) {
    auto& p = pending[i];
    while (p.result.wait_for(250ms) != std::future_status::ready) {
      IF_DEBUG {
        logr::debug << "[SiteFetcher] waiting on " << pending.size() - i
                    << " fetch(es)";
      }
    }

    Outcome out;
    try {
      out = p.result.get();
    } catch (const std::exception& e) {
      logr::error << "[SiteFetcher] fetch of " << p.ref.url
                  << " propagated: " << e.what();
      graph.MarkUnresolved(p.ref.url, e.what());
      continue;
    }

    if (!out.resource) {
      logr::warning << "[SiteFetcher] unresolved " << out.url << ": "
                    << out.error;
      graph.MarkUnresolved(out.url, out.error, out.timed_out);
      continue;
    }
    if (!mirror_.Store(out.resource->local_path, out.resource->bytes)) {
      logr::warning << "[SiteFetcher] no mirror copy for " << out.url;
      out.resource->local_path.clear();
    }
    graph.Resolve(out.url, out.resource);
    for (auto& child : out.children)
      discovered.push_back(std::move(child));
  }
  return discovered;
}

SiteFetcher::Outcome SiteFetcher::FetchOne(const ResourceRef& ref,
                                           const FetchControl& ctl) {
  Outcome out;
  out.url = ref.url;

  HttpResponse resp = transport_.Get(ref.url, ctl);
  if (!resp.IsOkay()) {
    out.error = ErrorOf(resp);
    out.timed_out = resp.IsTimeout();
    return out;
  }

  auto res = std::make_shared<Resource>();
  res->url = ref.url;
  res->content_type = resp.GetContentType();
  res->kind = InferKind(ref.origin, res->content_type, ref.url);
  res->bytes = resp.GetBody();
  res->local_path = mirror_.LocalPathFor(ref.url, res->kind);

  IF_DEBUG {
    logr::debug << "[SiteFetcher] " << KindName(res->kind) << " "
                << res->bytes.size() << " bytes " << ref.url;
  }

  if (res->kind == ResourceKind::Css)
    out.children = DiscoverCssRefs(*res, ref);
  out.resource = std::move(res);
  return out;
}

std::vector<ResourceRef> SiteFetcher::DiscoverCssRefs(
  const Resource& css, const ResourceRef& parent) const {
  std::vector<ResourceRef> out;
  for (const auto& found : FindCssReferences(css.bytes)) {
    URL abs = css.url.Resolve(found.url).Canonical();
    if (!abs.IsValid() || !abs.IsHttp())
      continue;
    ResourceRef ref;
    ref.raw = found.url;
    ref.url = abs;
    ref.origin = found.import ? RefOrigin::CssImport : RefOrigin::CssUrl;
    ref.referrer = css.url;
    ref.depth = parent.depth + 1;
    out.push_back(std::move(ref));
  }
  return out;
}

URL SiteFetcher::DocumentBase(const HtmlDocument& doc, const URL& url) {
  if (auto href = doc.BaseHref(); href.has_value() && !Trim(*href).empty()) {
    URL base = url.Resolve(Trim(*href));
    if (base.IsValid() && base.IsHttp())
      return base;
  }
  return url;
}

std::vector<DocumentRef> SiteFetcher::ScanDocument(const HtmlDocument& doc,
                                                   const URL& base) {
  std::vector<DocumentRef> out;

  URL referrer = base;
  if (doc.get()->URL != nullptr)
    referrer = URL(reinterpret_cast<const char*>(doc.get()->URL));

  auto add = [&](xmlNodePtr node, const char* attr, const std::string& raw,
                 RefOrigin origin) {
    const std::string value = Trim(raw);
    const std::string lowered = Lower(value.substr(0, 11));
    if (value.empty() || value[0] == '#' || StartsWith(lowered, "data:") ||
        StartsWith(lowered, "javascript:"))
      return;
    URL abs = base.Resolve(value).Canonical();
    if (!abs.IsValid() || !abs.IsHttp())
      return;
    DocumentRef d;
    d.node = node;
    d.attr = attr;
    d.ref.raw = value;
    d.ref.url = abs;
    d.ref.origin = origin;
    d.ref.referrer = referrer;
    d.ref.depth = 0;
    out.push_back(std::move(d));
  };

  for (xmlNodePtr node : doc.Elements()) {
    const std::string name = HtmlDocument::Name(node);
    if (name == "link") {
      auto href = HtmlDocument::Attr(node, "href");
      if (!href.has_value())
        continue;
      auto rel = Tokens(HtmlDocument::Attr(node, "rel").value_or(""));
      auto as = Lower(HtmlDocument::Attr(node, "as").value_or(""));
      if (Has(rel, "stylesheet")) {
        add(node, "href", *href, RefOrigin::StylesheetLink);
      } else if ((Has(rel, "preload") || Has(rel, "prefetch")) &&
                 as == "font") {
        add(node, "href", *href, RefOrigin::FontLink);
      } else if (Has(rel, "icon") || Has(rel, "apple-touch-icon")) {
        add(node, "href", *href, RefOrigin::IconLink);
      }
    } else if (name == "script") {
      if (auto src = HtmlDocument::Attr(node, "src"))
        add(node, "src", *src, RefOrigin::ScriptSrc);
    } else if (name == "img") {
      if (auto src = HtmlDocument::Attr(node, "src"))
        add(node, "src", *src, RefOrigin::ImgSrc);
    } else if (name == "source") {
      if (auto srcset = HtmlDocument::Attr(node, "srcset"))
        add(node, "srcset", FirstSrcsetCandidate(*srcset),
            RefOrigin::SourceSrcset);
    }
  }
  return out;
}

ResourceKind SiteFetcher::InferKind(RefOrigin origin,
                                    const std::string& content_type,
                                    const URL& url) {
  switch (origin) {
    case RefOrigin::StylesheetLink:
    case RefOrigin::CssImport:
      return ResourceKind::Css;
    case RefOrigin::ScriptSrc:
      return ResourceKind::Js;
    case RefOrigin::ImgSrc:
    case RefOrigin::SourceSrcset:
      return ResourceKind::Image;
    case RefOrigin::FontLink:
      return ResourceKind::Font;
    case RefOrigin::IconLink:
      return ResourceKind::Other;
    case RefOrigin::CssUrl:
      break;
  }

  const std::string ct = Lower(content_type);
  if (StartsWith(ct, "image/"))
    return ResourceKind::Image;
  if (StartsWith(ct, "font/") || ct.find("font-") != std::string::npos ||
      ct.find("woff") != std::string::npos)
    return ResourceKind::Font;
  if (ct == "text/css")
    return ResourceKind::Css;
  if (ct.find("javascript") != std::string::npos ||
      ct.find("ecmascript") != std::string::npos)
    return ResourceKind::Js;
  if (ct == "text/html" || ct == "application/xhtml+xml")
    return ResourceKind::Html;

  std::string path = Lower(url.GetPath());
  auto dot = path.rfind('.');
  if (dot == std::string::npos || path.find('/', dot) != std::string::npos)
    return ResourceKind::Other;
  const std::string ext = path.substr(dot + 1);
  static const char* const kImage[] = {"png", "jpg", "jpeg", "gif", "webp",
                                       "svg", "avif", "ico", "bmp"};
  static const char* const kFont[] = {"woff", "woff2", "ttf", "otf", "eot"};
  for (const char* e : kImage) {
    if (ext == e)
      return ResourceKind::Image;
  }
  for (const char* e : kFont) {
    if (ext == e)
      return ResourceKind::Font;
  }
  if (ext == "css")
    return ResourceKind::Css;
  if (ext == "js" || ext == "mjs")
    return ResourceKind::Js;
  if (ext == "html" || ext == "htm")
    return ResourceKind::Html;
  return ResourceKind::Other;
}
