#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "CriticalCss.hpp"
#include "HtmlDocument.hpp"
#include "Optimizer.hpp"
#include "Resource.hpp"

// Turns the optimized working document into the self-contained page written
// next to the mirror as optimized.html.
class DocumentRewriter {
 public:
  DocumentRewriter(const ResourceGraph& graph,
                   const OptimizationResult& optimized);

  // Inlines `critical` as the first child of <head>, turns the remaining
  // stylesheet links into preload + onload swaps with a <noscript> fallback
  // and points every resolved reference at its mirror copy. An <img> with a
  // WebP variant is wrapped in <picture>. Stylesheets stay blocking when
  // `critical` is empty.
  std::string Rewrite(HtmlDocument& working,
                      const CriticalCssSet& critical) const;

  // url() targets in `css`, resolved against `base`, mapped to mirror paths.
  std::string MapCss(const std::string& css, const URL& base) const;

  // Mirror-relative path serving `url`: the re-encoded variant when one
  // exists, else the mirrored original. Nothing for unresolved URLs.
  std::optional<std::string> LocalTarget(const URL& url) const;

  static constexpr const char* kPreloadSwap =
    "this.onload=null;this.rel='stylesheet'";

 private:
  using WebpSource = std::pair<xmlNodePtr, std::string>;

  // Plain <img> elements (no srcset, not already in <picture>) whose source
  // has a WebP variant, with the variant's mirror path.
  std::vector<WebpSource> WebpSources(const HtmlDocument& working,
                                      const URL& base) const;
  void MapReferences(HtmlDocument& working, const URL& base) const;
  void DeferStylesheets(HtmlDocument& working) const;

  const ResourceGraph& graph_;
  const OptimizationResult& optimized_;
};
