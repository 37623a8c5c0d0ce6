#include "config.hpp"

#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif

#include "util/json_value.hpp"

using namespace std::chrono_literals;

TEST_CASE("Load simple config", "[config]") {
  dockapp::Config conf;
  conf.load("test/config/simple.json", "dockapp-battery");
  REQUIRE(conf.path() == "test/config/simple.json");

  auto& data = conf.getConfig();
  REQUIRE(data["window-geometry"].asString() == "117x20");
  REQUIRE(data["interval"].asInt() == 30);
  REQUIRE(data["formats"].size() == 2);
  REQUIRE(data["colors"]["charging"].asString() == "#ffff00");
}

TEST_CASE("Load simple config with include", "[config]") {
  dockapp::Config conf;
  conf.load("test/config/include.json", "dockapp-battery");

  auto& data = conf.getConfig();
  REQUIRE_FALSE(data.isMember("include"));
  // value from the top config wins
  REQUIRE(data["font-size"].asInt() == 12);
  REQUIRE(data["colors"]["background"].asString() == "#000000");
  // first included value wins
  REQUIRE(data["font"].asString() == "Terminus");
  // nested objects are merged
  REQUIRE(data["colors"]["shell"].asString() == "#123456");
  REQUIRE(data["interval"].asInt() == 5);
  // explicit null is still a value and should be preserved
  REQUIRE((data.isMember("nullOption") && data["nullOption"].isNull()));
}

TEST_CASE("Invalid config files", "[config]") {
  dockapp::Config conf;
  REQUIRE_THROWS_AS(conf.load("test/config/missing.json", "dockapp-battery"), std::runtime_error);
  REQUIRE_THROWS_AS(conf.load("test/config/recursive.json", "dockapp-battery"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(conf.load("test/config/array.json", "dockapp-battery"), std::runtime_error);
}

TEST_CASE("Command line overrides", "[config]") {
  dockapp::Config conf;
  conf.load("test/config/simple.json", "dockapp-battery");

  Json::Value overrides(Json::objectValue);
  overrides["interval"] = 2;
  overrides["formats"].append("{remaining}");
  conf.applyOverrides(overrides);

  auto& data = conf.getConfig();
  REQUIRE(data["interval"].asInt() == 2);
  REQUIRE(data["formats"].size() == 1);
  REQUIRE(data["window-geometry"].asString() == "117x20");
}

TEST_CASE("Typed config values", "[config]") {
  dockapp::Config conf;
  conf.load("test/config/simple.json", "dockapp-battery");
  const auto& data = conf.getConfig();

  REQUIRE(dockapp::util::geometryValue(data, "window-geometry", {}) ==
          dockapp::util::Rect{0, 0, 117, 20});
  REQUIRE(dockapp::util::intervalValue(data, "interval", 1s) == 30s);
  REQUIRE(dockapp::util::intervalValue(data, "text-interval", 1s) == 2500ms);
  REQUIRE(dockapp::util::intervalValue(data, "missing", 7s) == 7s);
  REQUIRE(dockapp::util::stringListValue(data, "formats") ==
          std::vector<std::string>{"{percent}", "{state}"});
  REQUIRE(dockapp::util::colorValue(data["colors"], "background", {}) ==
          dockapp::util::Color{0x20, 0x20, 0x20});

  SECTION("comma separated lists") {
    Json::Value value(Json::objectValue);
    value["ignore"] = "cpu,cpu3";
    REQUIRE(dockapp::util::stringListValue(value, "ignore") ==
            std::vector<std::string>{"cpu", "cpu3"});
  }

  SECTION("intervals out of range are rejected") {
    Json::Value value(Json::objectValue);
    value["huge"] = 1e300;
    value["negative"] = -2.5;
    value["tiny"] = 0.0001;
    value["week"] = 604800;
    REQUIRE_THROWS_AS(dockapp::util::intervalValue(value, "huge", 1s), std::invalid_argument);
    REQUIRE_THROWS_AS(dockapp::util::intervalValue(value, "negative", 1s), std::invalid_argument);
    REQUIRE_THROWS_AS(dockapp::util::intervalValue(value, "tiny", 1s), std::invalid_argument);
    REQUIRE(dockapp::util::intervalValue(value, "week", 1s) == std::chrono::hours(168));
  }

  SECTION("wrong types are rejected") {
    Json::Value value(Json::objectValue);
    value["interval"] = "soon";
    value["zero"] = 0;
    value["border"] = 1.5;
    value["font"] = 3;
    value["window-geometry"] = "big";
    REQUIRE_THROWS_AS(dockapp::util::intervalValue(value, "interval", 1s), std::invalid_argument);
    REQUIRE_THROWS_AS(dockapp::util::intervalValue(value, "zero", 1s), std::invalid_argument);
    REQUIRE_THROWS_AS(dockapp::util::intValue(value, "border", 1), std::invalid_argument);
    REQUIRE_THROWS_AS(dockapp::util::stringValue(value, "font", ""), std::invalid_argument);
    REQUIRE_THROWS_AS(dockapp::util::geometryValue(value, "window-geometry", {}),
                      std::invalid_argument);
  }
}
