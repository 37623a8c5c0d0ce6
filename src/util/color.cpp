#include "util/color.hpp"

#include <fmt/format.h>

#include <charconv>
#include <stdexcept>

namespace dockapp::util {

namespace {

uint8_t parseComponent(const std::string& text, size_t offset) {
  unsigned value = 0;
  const char* begin = text.data() + offset;
  auto [ptr, ec] = std::from_chars(begin, begin + 2, value, 16);
  if (ec != std::errc{} || ptr != begin + 2) {
    throw std::invalid_argument(fmt::format("invalid colour \"{}\"", text));
  }
  return static_cast<uint8_t>(value);
}

}  // namespace

Color parseColor(const std::string& text) {
  if (text.empty() || text[0] != '#' || (text.size() != 7 && text.size() != 9)) {
    throw std::invalid_argument(fmt::format("invalid colour \"{}\", expected #rrggbb[aa]", text));
  }
  Color color;
  color.r = parseComponent(text, 1);
  color.g = parseComponent(text, 3);
  color.b = parseComponent(text, 5);
  if (text.size() == 9) {
    color.a = parseComponent(text, 7);
  }
  return color;
}

std::string toString(const Color& color) {
  if (color.a == 0xff) {
    return fmt::format("#{:02x}{:02x}{:02x}", color.r, color.g, color.b);
  }
  return fmt::format("#{:02x}{:02x}{:02x}{:02x}", color.r, color.g, color.b, color.a);
}

}  // namespace dockapp::util
