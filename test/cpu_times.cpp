#include "modules/cpu/times.hpp"

#include <sstream>
#include <stdexcept>

#if __has_include(<catch2/catch_approx.hpp>)
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
using Catch::Approx;
using Catch::Matchers::ContainsSubstring;
#else
#include <catch2/catch.hpp>
#define ContainsSubstring Catch::Matchers::Contains
#endif

#include "modules/cpu/layout.hpp"

using namespace dockapp::modules::cpu;
using dockapp::util::Rect;

namespace {

const char* const STAT = R"(cpu  4705 356 584 3699 23 23 0 0 0 0
cpu0 1393280 32966 572056 13343292 6130 0 17875 0 23933 0
cpu1 1335010 30521 571356 13353212 6108 0 15210 0 23876 0
intr 114930548 113199788 3 0 5 263 0 4 [... lots more numbers ...]
ctxt 1990473
btime 1062191376
cpuidle 12
processes 2915
procs_running 1
)";

}  // namespace

TEST_CASE("Parse /proc/stat", "[cpu]") {
  std::istringstream input(STAT);
  auto times = parseStat(input);
  REQUIRE(names(times) == std::vector<std::string>{"cpu", "cpu0", "cpu1"});
  REQUIRE(times[0].in_mode.size() == 10);
  REQUIRE(times[0].in_mode[MODE_IDLE] == 3699);
  REQUIRE(times[1].in_mode[0] == 1393280);
}

TEST_CASE("Malformed counter", "[cpu]") {
  std::istringstream input("cpu0 12 abc 4\n");
  REQUIRE_THROWS_WITH(parseStat(input), ContainsSubstring("unable to parse line: \"cpu0 12 abc 4\""));
}

TEST_CASE("Missing stat file", "[cpu]") {
  REQUIRE_THROWS_WITH(readStat("/nonexistent/stat"), "Can't open /nonexistent/stat");
}

TEST_CASE("Counter differences", "[cpu]") {
  const CpuTimes prev{{"cpu0", {100, 50, 0, 200}}};
  const CpuTimes curr{{"cpu0", {110, 52, 0, 210}}};
  REQUIRE(sameShape(prev, curr));
  REQUIRE(delta(prev, curr) == CpuTimes{{"cpu0", {10, 2, 0, 10}}});

  SECTION("differing cpu sets are rejected") {
    const CpuTimes more{{"cpu0", {1, 1, 1, 1}}, {"cpu1", {1, 1, 1, 1}}};
    REQUIRE_FALSE(sameShape(prev, more));
    REQUIRE_THROWS_AS(delta(prev, more), std::invalid_argument);
  }

  SECTION("renamed cpus are rejected") {
    const CpuTimes renamed{{"cpu1", {1, 1, 1, 1}}};
    REQUIRE_FALSE(sameShape(prev, renamed));
  }

  SECTION("counters going backwards are kept") {
    const CpuTimes back{{"cpu0", {90, 50, 0, 200}}};
    REQUIRE(delta(prev, back)[0].in_mode[0] == -10);
  }
}

TEST_CASE("Utilization", "[cpu]") {
  REQUIRE(utilization({"cpu0", {10, 10, 10, 70}}) == Approx(0.30));
  REQUIRE(utilization({"cpu0", {0, 0, 0, 100}}) == Approx(0.0));
  REQUIRE(utilization({"cpu0", {50, 0, 0, 0}}) == Approx(1.0));
  REQUIRE(utilization({"cpu0", {0, 0, 0, 0}}) == 0.0);
  REQUIRE(utilization({"cpu0", {1, 2}}) == 0.0);
}

TEST_CASE("Columns and bars", "[cpu]") {
  const Rect area{0, 0, 100, 20};
  REQUIRE(columnRect(area, 0, 4) == Rect{0, 0, 25, 20});
  REQUIRE(columnRect(area, 3, 4) == Rect{75, 0, 25, 20});
  REQUIRE(columnRect(area, 1, 3) == Rect{33, 0, 33, 20});

  const Rect column{25, 0, 25, 20};
  REQUIRE(barRect(column, 0.5) == Rect{25, 10, 25, 10});
  REQUIRE(barRect(column, 0.0).empty());
  REQUIRE(barRect(column, 1.5) == column);
  REQUIRE(barRect(column, -1).height == 0);
}
