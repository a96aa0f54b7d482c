#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "URL.hpp"

enum class ResourceKind { Html, Css, Js, Image, Font, Other };

const char* KindName(ResourceKind k);

// Where in the referring document a reference was found.
enum class RefOrigin {
  StylesheetLink,  // <link rel=stylesheet href>
  FontLink,        // <link rel=preload as=font href>, font-ish hrefs
  IconLink,        // <link rel=icon href>
  ScriptSrc,       // <script src>
  ImgSrc,          // <img src>
  SourceSrcset,    // <source srcset>, first candidate
  CssUrl,          // url(...) in a stylesheet
  CssImport,       // @import in a stylesheet
};

const char* OriginName(RefOrigin o);

// A fetched resource. Immutable once the fetcher hands it over.
struct Resource {
  URL url;  // canonical absolute URL
  ResourceKind kind{ResourceKind::Other};
  std::string bytes;
  std::filesystem::path local_path;  // relative to the site directory
  std::string content_type;
};

// One reference as discovered in a document or stylesheet.
struct ResourceRef {
  std::string raw;  // attribute or url() text as written
  URL url;          // canonical absolute URL
  RefOrigin origin{RefOrigin::ImgSrc};
  URL referrer;     // document or stylesheet containing the reference
  int depth{0};     // 0: root document, 1: inside a linked stylesheet
  bool resolved{false};
  bool timed_out{false};
  std::string error;  // set iff !resolved
};

// Root HTML resource plus every resource it references, in discovery order.
// Each reference either resolves to exactly one Resource or carries an error.
class ResourceGraph {
 public:
  ResourceGraph() = default;
  explicit ResourceGraph(std::shared_ptr<const Resource> root);

  const Resource& Root() const;
  bool HasRoot() const;

  // Adds the reference; a resource for the same canonical URL is shared.
  void AddRef(ResourceRef ref);
  // Records the outcome of fetching `url`; applies to every ref to it.
  void Resolve(const URL& url, std::shared_ptr<const Resource> resource);
  void MarkUnresolved(const URL& url, const std::string& error,
                      bool timed_out = false);

  const std::vector<ResourceRef>& Refs() const;
  // Resources in first-discovery order, root excluded.
  std::vector<std::shared_ptr<const Resource>> Resources() const;
  const Resource* Find(const URL& url) const;

  bool HasUnresolved() const;
  std::size_t UnresolvedCount() const;
  // Stylesheets in document order: external resources only.
  std::vector<const Resource*> Stylesheets() const;

 private:
  std::shared_ptr<const Resource> root_;
  std::vector<ResourceRef> refs_;
  std::vector<URL> order_;
  std::unordered_map<URL, std::shared_ptr<const Resource>> by_url_;
};
