#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "CriticalCss.hpp"
#include "HtmlDocument.hpp"
#include "LayoutProvider.hpp"
#include "Resource.hpp"
#include "SiteScript.hpp"

enum class ActionKind {
  ConvertFormat,
  Compress,
  AddDimensions,
  AddLazyLoad,
  Defer,
  Async,
  AddResourceHint,
  SetCacheHeader
};

const char* ActionKindName(ActionKind k);

// One optimization rule outcome. applied == false records a rule whose
// preconditions failed; `note` says why.
struct OptimizationAction {
  URL target;
  ActionKind kind{ActionKind::Compress};
  std::string before;
  std::string after;
  bool applied{true};
  std::string note;

  nlohmann::json ToJson() const;
};

// Re-encoded replacement for a fetched image. A WebP variant is offered
// through <picture> next to the original format.
struct OptimizedImage {
  URL url;
  std::filesystem::path local_path;  // relative to the site directory
  std::string bytes;
  bool webp{false};
};

struct OptimizationResult {
  std::vector<OptimizationAction> actions;
  std::vector<OptimizedImage> images;

  std::size_t AppliedCount() const;
  // Same-format replacement for `url`.
  const OptimizedImage* ImageFor(const URL& url) const;
  const OptimizedImage* WebpFor(const URL& url) const;
};

// Applies resource-level rules to a working copy of the page. Rules are
// independent; each no-ops and records a skipped action when it cannot run.
class ResourceOptimizer {
 public:
  explicit ResourceOptimizer(SiteHints hints = {});

  // `working` must be a Clone() of the document `layout` was computed for;
  // `layout` is null when no viewport data exists.
  OptimizationResult Optimize(const ResourceGraph& graph,
                              HtmlDocument& working,
                              const CriticalCssSet& critical,
                              const LayoutData* layout) const;

  // Mirror path of the re-encoded variant: "img/a.png" -> "img/a.opt.png".
  static std::filesystem::path VariantPath(const std::filesystem::path& p);
  // "img/a.png" -> "img/a.png.webp"
  static std::filesystem::path WebpPath(const std::filesystem::path& p);

  static constexpr const char* kStaticCacheControl =
    "public, max-age=31536000, immutable";

 private:
  void ReencodeImages(const ResourceGraph& graph,
                      OptimizationResult& result) const;
  void RecompressPng(const Resource& res, OptimizationResult& result) const;
  void ConvertToWebp(const Resource& res, const std::string& format,
                     OptimizationResult& result) const;
  void ImageElements(const ResourceGraph& graph, HtmlDocument& working,
                     const std::vector<xmlNodePtr>& elements,
                     const LayoutData* layout,
                     OptimizationResult& result) const;
  void Scripts(const ResourceGraph& graph, HtmlDocument& working,
               const std::vector<xmlNodePtr>& elements,
               OptimizationResult& result) const;
  void ResourceHints(const ResourceGraph& graph, HtmlDocument& working,
                     const CriticalCssSet& critical,
                     OptimizationResult& result) const;
  void CachePolicy(const ResourceGraph& graph,
                   OptimizationResult& result) const;

  SiteHints hints_;
};
