#include "util/geometry.hpp"

#include <fmt/format.h>

#include <cctype>
#include <limits>
#include <stdexcept>

namespace dockapp::util {

namespace {

class GeometryParser {
 public:
  explicit GeometryParser(const std::string& input) : input_(input) {}

  Rect parse() {
    if (input_.empty()) {
      throw std::invalid_argument("geometry: empty string");
    }
    Rect rect;
    rect.width = number("width");
    expect('x', "'x'");
    rect.height = number("height");
    if (atEnd()) {
      return rect;
    }
    rect.x = offset("x offset");
    rect.y = offset("y offset");
    if (!atEnd()) {
      fail("end of input");
    }
    return rect;
  }

 private:
  bool atEnd() const { return pos_ >= input_.size(); }

  [[noreturn]] void fail(const char* expected) const {
    throw std::invalid_argument(
        fmt::format("geometry \"{}\": expected {} at offset {}", input_, expected, pos_));
  }

  void expect(char c, const char* what) {
    if (atEnd() || input_[pos_] != c) {
      fail(what);
    }
    ++pos_;
  }

  int number(const char* what) {
    if (atEnd() || std::isdigit(static_cast<unsigned char>(input_[pos_])) == 0) {
      fail(what);
    }
    long value = 0;
    while (!atEnd() && std::isdigit(static_cast<unsigned char>(input_[pos_])) != 0) {
      value = value * 10 + (input_[pos_] - '0');
      if (value > std::numeric_limits<int>::max()) {
        fail(what);
      }
      ++pos_;
    }
    return static_cast<int>(value);
  }

  int offset(const char* what) {
    if (atEnd() || (input_[pos_] != '+' && input_[pos_] != '-')) {
      fail(what);
    }
    const bool negative = input_[pos_] == '-';
    ++pos_;
    const int value = number(what);
    return negative ? -value : value;
  }

  const std::string& input_;
  std::size_t pos_{0};
};

}  // namespace

Rect parseGeometry(const std::string& geometry) { return GeometryParser(geometry).parse(); }

std::string formatGeometry(const Rect& rect) {
  if (rect.x == 0 && rect.y == 0) {
    return fmt::format("{}x{}", rect.width, rect.height);
  }
  return fmt::format("{}x{}{:+}{:+}", rect.width, rect.height, rect.x, rect.y);
}

Rect contract(Rect rect, int dx, int dy) {
  rect.x += dx;
  rect.y += dy;
  rect.width -= 2 * dx;
  rect.height -= 2 * dy;
  return rect;
}

}  // namespace dockapp::util
