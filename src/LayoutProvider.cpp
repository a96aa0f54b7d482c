#include "LayoutProvider.hpp"

std::optional<Box> LayoutData::BoxOf(int element_index) const {
  if (auto it = boxes_.find(element_index); it != boxes_.end())
    return it->second;
  return std::nullopt;
}

bool LayoutData::InViewport(int element_index) const {
  auto box = BoxOf(element_index);
  return box.has_value() && box->Intersects(viewport_);
}

bool LayoutData::BelowFold(int element_index) const {
  auto box = BoxOf(element_index);
  return box.has_value() && box->y >= viewport_.height;
}
