#pragma once

#include <optional>
#include <unordered_map>

#include "Config.hpp"
#include "HtmlDocument.hpp"
#include "Resource.hpp"

struct Box {
  double x{0};
  double y{0};
  double width{0};
  double height{0};

  bool Intersects(const Viewport& vp) const {
    return y < vp.height && y + height > 0 && x < vp.width && x + width > 0;
  }
};

// Element geometry for one viewport. Elements are identified by their index
// in HtmlDocument::Elements(), which a Clone() of the document preserves.
class LayoutData {
 public:
  LayoutData() = default;
  explicit LayoutData(const Viewport& vp) : viewport_{vp} {
  }

  void Set(int element_index, const Box& box) {
    boxes_[element_index] = box;
  }

  const Viewport& GetViewport() const {
    return viewport_;
  }
  std::optional<Box> BoxOf(int element_index) const;
  bool Empty() const {
    return boxes_.empty();
  }
  std::size_t Size() const {
    return boxes_.size();
  }

  // Box intersects the viewport.
  bool InViewport(int element_index) const;
  // Box starts at or below the fold. False for unknown elements.
  bool BelowFold(int element_index) const;

 private:
  Viewport viewport_{};
  std::unordered_map<int, Box> boxes_;
};

// Source of element geometry. Implementations throw NoViewportDataError when
// they cannot produce any.
class LayoutProvider {
 public:
  virtual ~LayoutProvider() = default;
  virtual LayoutData Layout(const HtmlDocument& doc, const ResourceGraph& graph,
                            const Viewport& vp) = 0;
};
