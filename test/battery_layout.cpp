#include "modules/battery/layout.hpp"

#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif

using namespace dockapp::modules::battery;
using dockapp::util::Rect;

TEST_CASE("Battery layout", "[battery]") {
  const auto layout = computeLayout({1, 2, 21, 18}, 1);

  REQUIRE(layout.cap == Rect{1, 4, 2, 14});
  REQUIRE(layout.body == Rect{3, 2, 19, 18});
  REQUIRE(layout.energy_left == 2);
  REQUIRE(layout.energy_right == 21);
  REQUIRE(layout.shell.size() == 8);
  REQUIRE(layout.shell[0] == Rect{3, 2, 19, 1});
  REQUIRE(layout.shell[2] == Rect{21, 3, 1, 16});
  REQUIRE(layout.shell[7] == Rect{1, 5, 1, 12});
}

TEST_CASE("Energy drains from the cap", "[battery]") {
  const auto layout = computeLayout({1, 2, 21, 18}, 1);

  SECTION("half charged") {
    const auto rects = energyRects(layout, 0.5);
    REQUIRE(rects.size() == 1);
    REQUIRE(rects[0] == Rect{11, 2, 10, 18});
  }

  SECTION("full reaches into the cap") {
    const auto rects = energyRects(layout, 1.0);
    REQUIRE(rects.size() == 2);
    REQUIRE(rects[0] == Rect{2, 4, 1, 14});
    REQUIRE(rects[1] == Rect{3, 2, 18, 18});
  }

  SECTION("empty and out of range") {
    REQUIRE(energyRects(layout, 0.0).empty());
    REQUIRE(energyRects(layout, -0.5).empty());
    REQUIRE(energyRects(layout, 2.0) == energyRects(layout, 1.0));
  }
}

TEST_CASE("Energy colour", "[battery]") {
  const Palette palette;
  REQUIRE(energyColor({.fraction = 0.1, .state = State::Charging}, palette) == palette.charging);
  REQUIRE(energyColor({.fraction = 0.1, .state = State::Discharging}, palette) == palette.low);
  REQUIRE(energyColor({.fraction = 0.15, .state = State::Discharging}, palette) == palette.low);
  REQUIRE(energyColor({.fraction = 0.6, .state = State::Discharging}, palette) == palette.normal);
}

TEST_CASE("Rectangle intersection", "[battery]") {
  REQUIRE(intersect({0, 0, 10, 10}, {5, 5, 10, 10}) == Rect{5, 5, 5, 5});
  REQUIRE(intersect({0, 0, 10, 10}, {20, 20, 5, 5}).empty());
}
