#pragma once

#include "LayoutProvider.hpp"

// Block-flow estimate over the parsed document: blocks stack vertically,
// inline content wraps at a fixed character width, replaced elements take
// their attribute or intrinsic size. No stylesheet is applied apart from
// inline display:none and the hidden attribute.
class FlowLayout : public LayoutProvider {
 public:
  static constexpr double kFontSize = 16.0;
  static constexpr double kBodyMargin = 8.0;

  LayoutData Layout(const HtmlDocument& doc, const ResourceGraph& graph,
                    const Viewport& vp) override;
};
