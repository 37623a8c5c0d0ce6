#pragma once

#include <cstddef>

#include "util/geometry.hpp"

namespace dockapp::modules::cpu {

// Column `index` of `count` equal-width columns spanning `area`.
inline util::Rect columnRect(const util::Rect& area, std::size_t index, std::size_t count) {
  const int width = count == 0 ? 0 : area.width / static_cast<int>(count);
  return {area.x + static_cast<int>(index) * width, area.y, width, area.height};
}

// Utilization bar of a column, anchored at its bottom edge.
inline util::Rect barRect(const util::Rect& column, double utilization) {
  if (utilization < 0) {
    utilization = 0;
  } else if (utilization > 1) {
    utilization = 1;
  }
  const int height = static_cast<int>(column.height * utilization);
  return {column.x, column.bottom() - height, column.width, height};
}

}  // namespace dockapp::modules::cpu
