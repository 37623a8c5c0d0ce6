#pragma once

#include <string>

namespace dockapp::util {

struct Rect {
  int x{0};
  int y{0};
  int width{0};
  int height{0};

  int right() const { return x + width; }
  int bottom() const { return y + height; }
  bool empty() const { return width <= 0 || height <= 0; }

  bool operator==(const Rect& other) const {
    return x == other.x && y == other.y && width == other.width && height == other.height;
  }
  bool operator!=(const Rect& other) const { return !(*this == other); }
};

/**
 * Parses X11 style geometry, `<w>x<h>` optionally followed by `{+-}<dx>{+-}<dy>`.
 * Throws std::invalid_argument naming the element that was expected.
 */
Rect parseGeometry(const std::string& geometry);

/// Inverse of parseGeometry: "WxH" when the origin is zero, "WxH+X+Y" otherwise.
std::string formatGeometry(const Rect& rect);

/// Shrinks `rect` by `dx` on the left and right and by `dy` on the top and bottom.
Rect contract(Rect rect, int dx, int dy);

}  // namespace dockapp::util
