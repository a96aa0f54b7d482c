#pragma once

#include <optional>
#include <string>
#include <vector>

#include "CssParser.hpp"
#include "HtmlDocument.hpp"
#include "LayoutProvider.hpp"
#include "Resource.hpp"
#include "SiteScript.hpp"

// Rules needed for the first viewport, in cascade order.
struct CriticalCssSet {
  std::vector<std::string> rules;
  bool has_viewport_data{true};
  std::optional<std::string> warning;

  bool Empty() const {
    return rules.empty();
  }
  // Rules joined by newlines, with a trailing newline when not empty.
  std::string Text() const;
};

class CriticalCssExtractor {
 public:
  explicit CriticalCssExtractor(SiteHints hints = {});

  // Without layout data the set is empty and has_viewport_data is false.
  CriticalCssSet Extract(const ResourceGraph& graph, const HtmlDocument& doc,
                         const LayoutData* layout) const;

  // Asks `provider` for layout first; a NoViewportDataError degrades to the
  // empty set instead of propagating.
  CriticalCssSet Extract(const ResourceGraph& graph, const HtmlDocument& doc,
                         LayoutProvider& provider, const Viewport& vp) const;

 private:
  struct Sheet {
    std::string css;
    URL base;
    std::string label;
  };

  std::vector<Sheet> CollectSheets(const ResourceGraph& graph,
                                   const HtmlDocument& doc) const;
  bool IsCritical(const CssRule& rule,
                  const std::vector<const xmlNode*>& visible) const;
  // Retained text of `rule` (wrapped for @media), or nullopt.
  std::optional<std::string> Filter(
    const CssRule& rule, const URL& base,
    const std::vector<const xmlNode*>& visible) const;

  SiteHints hints_;
};
