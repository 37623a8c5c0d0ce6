#include "util/format_rotator.hpp"

#include <stdexcept>
#include <string>

#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif

using Rotator = dockapp::util::FormatRotator<std::string>;
using namespace std::chrono_literals;

TEST_CASE("Formats rotate in order", "[FormatRotator]") {
  Rotator rotator({"A", "B", "C"}, 30ms);
  REQUIRE(rotator.size() == 3);
  REQUIRE(rotator.current() == "A");
  REQUIRE_FALSE(rotator.channel().pending());

  rotator.start();
  REQUIRE(rotator.channel().poll() == std::optional<std::string>{"A"});
  REQUIRE(rotator.channel().take_for(5s) == std::optional<std::string>{"B"});
  REQUIRE(rotator.channel().take_for(5s) == std::optional<std::string>{"C"});
  REQUIRE(rotator.channel().take_for(5s) == std::optional<std::string>{"A"});
}

TEST_CASE("Single format is offered on every tick", "[FormatRotator]") {
  Rotator rotator({"only"}, 10ms);
  rotator.start();
  REQUIRE(rotator.channel().poll() == std::optional<std::string>{"only"});
  REQUIRE(rotator.channel().take_for(5s) == std::optional<std::string>{"only"});
  REQUIRE(rotator.index() == 0);
}

TEST_CASE("Stopped rotator stays put", "[FormatRotator]") {
  Rotator rotator({"A", "B"}, 20ms);
  rotator.start();
  rotator.channel().poll();
  rotator.stop();
  REQUIRE_FALSE(rotator.channel().take_for(60ms).has_value());
  REQUIRE(rotator.current() == "A");
}

TEST_CASE("Invalid rotation", "[FormatRotator]") {
  REQUIRE_THROWS_AS(Rotator({}, 1s), std::invalid_argument);
  REQUIRE_THROWS_AS(Rotator({"A"}, 0ms), std::invalid_argument);
}
