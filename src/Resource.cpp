#include "Resource.hpp"

#include <algorithm>
#include <stdexcept>

const char* KindName(ResourceKind k) {
  switch (k) {
    case ResourceKind::Html:
      return "html";
    case ResourceKind::Css:
      return "css";
    case ResourceKind::Js:
      return "js";
    case ResourceKind::Image:
      return "image";
    case ResourceKind::Font:
      return "font";
    case ResourceKind::Other:
      return "other";
  }
  return "other";
}

const char* OriginName(RefOrigin o) {
  switch (o) {
    case RefOrigin::StylesheetLink:
      return "link[rel=stylesheet]";
    case RefOrigin::FontLink:
      return "link[font]";
    case RefOrigin::IconLink:
      return "link[rel=icon]";
    case RefOrigin::ScriptSrc:
      return "script[src]";
    case RefOrigin::ImgSrc:
      return "img[src]";
    case RefOrigin::SourceSrcset:
      return "source[srcset]";
    case RefOrigin::CssUrl:
      return "css url()";
    case RefOrigin::CssImport:
      return "css @import";
  }
  return "unknown";
}

ResourceGraph::ResourceGraph(std::shared_ptr<const Resource> root)
    : root_{std::move(root)} {
}

const Resource& ResourceGraph::Root() const {
  if (!root_)
    throw std::logic_error("ResourceGraph has no root document");
  return *root_;
}

bool ResourceGraph::HasRoot() const {
  return root_ != nullptr;
}

void ResourceGraph::AddRef(ResourceRef ref) {
  ref.resolved = false;
  if (auto it = by_url_.find(ref.url); it != by_url_.end() && it->second) {
    ref.resolved = true;
    ref.error.clear();
  } else {
    // an earlier ref to the same URL may already have failed
    auto prior = std::find_if(refs_.begin(), refs_.end(), [&](const auto& r) {
      return r.url == ref.url && !r.error.empty();
    });
    if (prior != refs_.end()) {
      ref.error = prior->error;
      ref.timed_out = prior->timed_out;
    }
  }
  if (std::find(order_.begin(), order_.end(), ref.url) == order_.end())
    order_.push_back(ref.url);
  refs_.push_back(std::move(ref));
}

void ResourceGraph::Resolve(const URL& url,
                            std::shared_ptr<const Resource> resource) {
  by_url_[url] = std::move(resource);
  for (auto& ref : refs_) {
    if (ref.url == url) {
      ref.resolved = true;
      ref.timed_out = false;
      ref.error.clear();
    }
  }
}

void ResourceGraph::MarkUnresolved(const URL& url, const std::string& error,
                                   bool timed_out) {
  by_url_.erase(url);
  for (auto& ref : refs_) {
    if (ref.url == url) {
      ref.resolved = false;
      ref.timed_out = timed_out;
      ref.error = error.empty() ? "unresolved" : error;
    }
  }
}

const std::vector<ResourceRef>& ResourceGraph::Refs() const {
  return refs_;
}

std::vector<std::shared_ptr<const Resource>> ResourceGraph::Resources() const {
  std::vector<std::shared_ptr<const Resource>> out;
  out.reserve(order_.size());
  for (const auto& url : order_) {
    if (auto it = by_url_.find(url); it != by_url_.end() && it->second)
      out.push_back(it->second);
  }
  return out;
}

const Resource* ResourceGraph::Find(const URL& url) const {
  if (auto it = by_url_.find(url.Canonical()); it != by_url_.end())
    return it->second.get();
  return nullptr;
}

bool ResourceGraph::HasUnresolved() const {
  return UnresolvedCount() > 0;
}

std::size_t ResourceGraph::UnresolvedCount() const {
  std::vector<URL> seen;
  for (const auto& ref : refs_) {
    if (!ref.resolved &&
        std::find(seen.begin(), seen.end(), ref.url) == seen.end())
      seen.push_back(ref.url);
  }
  return seen.size();
}

std::vector<const Resource*> ResourceGraph::Stylesheets() const {
  std::vector<const Resource*> out;
  for (const auto& ref : refs_) {
    if (ref.origin != RefOrigin::StylesheetLink || !ref.resolved)
      continue;
    const Resource* css = Find(ref.url);
    if (css != nullptr && std::find(out.begin(), out.end(), css) == out.end())
      out.push_back(css);
  }
  return out;
}
