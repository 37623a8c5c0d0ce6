#pragma once

#include <cstdint>
#include <string>

namespace dockapp::util {

struct Color {
  uint8_t r{0};
  uint8_t g{0};
  uint8_t b{0};
  uint8_t a{0xff};

  bool operator==(const Color& other) const {
    return r == other.r && g == other.g && b == other.b && a == other.a;
  }
  bool operator!=(const Color& other) const { return !(*this == other); }
};

// Accepts "#rrggbb" and "#rrggbbaa".
Color parseColor(const std::string& text);
std::string toString(const Color& color);

}  // namespace dockapp::util
