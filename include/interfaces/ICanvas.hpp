#pragma once

#include <string>

#include "util/color.hpp"
#include "util/geometry.hpp"

namespace dockapp {

// Drawing surface of a dockapp window, in window coordinates.
class ICanvas {
 public:
  virtual ~ICanvas() = default;
  virtual auto bounds() const -> util::Rect = 0;
  virtual auto fill(const util::Rect& rect, const util::Color& color) -> void = 0;
  // Draws `text` centred in `box`; nothing is drawn outside of it.
  virtual auto drawText(const util::Rect& box, const std::string& text, const util::Color& color)
      -> void = 0;
};

}  // namespace dockapp
