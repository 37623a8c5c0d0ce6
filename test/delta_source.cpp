#include "modules/cpu/delta_source.hpp"

#include <deque>
#include <memory>
#include <stdexcept>
#include <string>

#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif

using namespace dockapp::modules::cpu;

namespace {

class ScriptedStat : public dockapp::ISampleSource<CpuTimes> {
 public:
  auto fetch() -> CpuTimes override {
    if (samples.empty()) {
      throw std::runtime_error("no more samples");
    }
    auto sample = samples.front();
    samples.pop_front();
    ++calls;
    return sample;
  }

  std::deque<CpuTimes> samples;
  int calls = 0;
};

}  // namespace

TEST_CASE("First fetch primes a baseline", "[DeltaSource]") {
  auto raw = std::make_shared<ScriptedStat>();
  raw->samples = {{{"cpu0", {100, 0, 0, 100}}},
                  {{"cpu0", {150, 0, 0, 150}}},
                  {{"cpu0", {160, 0, 0, 190}}}};
  DeltaSource source(raw, std::chrono::milliseconds(0));

  REQUIRE(source.fetch() == CpuTimes{{"cpu0", {50, 0, 0, 50}}});
  REQUIRE(raw->calls == 2);
  REQUIRE(source.fetch() == CpuTimes{{"cpu0", {10, 0, 0, 40}}});
  REQUIRE(raw->calls == 3);
}

TEST_CASE("Changed cpu set starts a new baseline", "[DeltaSource]") {
  auto raw = std::make_shared<ScriptedStat>();
  raw->samples = {{{"cpu0", {1, 0, 0, 1}}},
                  {{"cpu0", {2, 0, 0, 2}}},
                  {{"cpu0", {3, 0, 0, 3}}, {"cpu1", {5, 0, 0, 5}}},
                  {{"cpu0", {4, 0, 0, 5}}, {"cpu1", {7, 0, 0, 5}}}};
  DeltaSource source(raw, std::chrono::milliseconds(0));

  source.fetch();
  // Not an error: the coordinator keeps lastError() untouched for skipped samples.
  REQUIRE_THROWS_AS(source.fetch(), dockapp::SampleSkipped);
  REQUIRE(source.fetch() == CpuTimes{{"cpu0", {1, 0, 0, 2}}, {"cpu1", {2, 0, 0, 0}}});
}

TEST_CASE("Reset primes again", "[DeltaSource]") {
  auto raw = std::make_shared<ScriptedStat>();
  raw->samples = {{{"cpu0", {0, 0, 0, 0}}},
                  {{"cpu0", {1, 0, 0, 1}}},
                  {{"cpu0", {10, 0, 0, 10}}},
                  {{"cpu0", {12, 0, 0, 10}}}};
  DeltaSource source(raw, std::chrono::milliseconds(0));
  source.fetch();
  source.reset();
  REQUIRE(source.fetch() == CpuTimes{{"cpu0", {2, 0, 0, 0}}});
  REQUIRE(raw->calls == 4);
}

TEST_CASE("Shape change is reported once as a skip", "[DeltaSource]") {
  auto raw = std::make_shared<ScriptedStat>();
  raw->samples = {{{"cpu0", {1, 0, 0, 1}}},
                  {{"cpu0", {2, 0, 0, 2}}},
                  {{"cpu0", {3, 0, 0, 3}}, {"cpu1", {5, 0, 0, 5}}}};
  DeltaSource source(raw, std::chrono::milliseconds(0));
  source.fetch();
  try {
    source.fetch();
    FAIL("expected ShapeChanged");
  } catch (const ShapeChanged& e) {
    REQUIRE(std::string(e.what()) == "cpu set changed, new baseline: cpu0, cpu1");
  }
}

TEST_CASE("Raw source errors propagate", "[DeltaSource]") {
  auto raw = std::make_shared<ScriptedStat>();
  DeltaSource source(raw, std::chrono::milliseconds(0));
  REQUIRE_THROWS_AS(source.fetch(), std::runtime_error);
  REQUIRE_THROWS_AS(DeltaSource(nullptr), std::invalid_argument);
}
