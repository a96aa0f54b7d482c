#pragma once

#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "Config.hpp"
#include "HtmlDocument.hpp"
#include "HttpTransport.hpp"
#include "MirrorStore.hpp"
#include "Resource.hpp"
#include "URL.hpp"

// A resource reference found in an HTML document, with the element and
// attribute carrying it.
struct DocumentRef {
  xmlNodePtr node{nullptr};
  const char* attr{""};
  ResourceRef ref;
};

// Retrieves a page and everything it references into the local mirror.
class SiteFetcher {
 public:
  SiteFetcher(const RunConfig& conf, HttpTransport& transport,
              MirrorStore& mirror);

  // Throws FetchError when the root document cannot be retrieved. Every
  // other failure ends up as an unresolved reference in the graph.
  ResourceGraph Fetch(const URL& root, const FetchControl& ctl);

  // References in `doc`, resolved against `base`, in document order.
  // data: and non-http(s) references are left out.
  static std::vector<DocumentRef> ScanDocument(const HtmlDocument& doc,
                                               const URL& base);

  // Base for relative references: <base href> when present, else `url`.
  static URL DocumentBase(const HtmlDocument& doc, const URL& url);

  // Reference origin first, then Content-Type, then file extension.
  static ResourceKind InferKind(RefOrigin origin,
                                const std::string& content_type,
                                const URL& url);

 private:
  struct Outcome {
    URL url;
    std::shared_ptr<Resource> resource;
    std::string error;
    bool timed_out{false};
    // references found inside a fetched stylesheet
    std::vector<ResourceRef> children;
  };

  struct Pending {
    ResourceRef ref;
    std::future<Outcome> result;
  };

  // True the first time `url` is seen; shared by all workers.
  bool Claim(const URL& url);

  Outcome FetchOne(const ResourceRef& ref, const FetchControl& ctl);
  std::vector<ResourceRef> DiscoverCssRefs(const Resource& css,
                                           const ResourceRef& parent) const;

  // Runs one wave of fetches and folds the outcomes into `graph`, in
  // scheduling order. Returns the references discovered in stylesheets.
  std::vector<ResourceRef> RunWave(const std::vector<ResourceRef>& wave,
                                   ResourceGraph& graph,
                                   const FetchControl& ctl);

  const RunConfig& conf_;
  HttpTransport& transport_;
  MirrorStore& mirror_;

  std::mutex seen_mu_;
  std::unordered_set<URL> seen_;
};
