#include "util/mailbox.hpp"

#include <glibmm/dispatcher.h>

#include <atomic>
#include <string>
#include <thread>

#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif

#include "fixtures/GlibTestsFixture.hpp"

using dockapp::util::Mailbox;

TEST_CASE("Only the most recent value is kept", "[Mailbox]") {
  Mailbox<int> box;
  CHECK_FALSE(box.pending());
  CHECK_FALSE(box.poll().has_value());

  box.offer(1);
  box.offer(2);
  box.offer(3);
  REQUIRE(box.pending());
  auto value = box.poll();
  REQUIRE(value.has_value());
  REQUIRE(*value == 3);
  REQUIRE_FALSE(box.poll().has_value());
}

TEST_CASE("take_for waits for an offer", "[Mailbox]") {
  Mailbox<std::string> box;

  SECTION("times out when nothing is offered") {
    REQUIRE_FALSE(box.take_for(std::chrono::milliseconds(10)).has_value());
  }

  SECTION("returns a value offered from another thread") {
    std::thread producer([&box] {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      box.offer("ready");
    });
    auto value = box.take_for(std::chrono::seconds(5));
    producer.join();
    REQUIRE(value == std::optional<std::string>{"ready"});
  }
}

TEST_CASE("Closed mailbox rejects offers", "[Mailbox]") {
  Mailbox<int> box;
  box.offer(7);
  box.close();
  REQUIRE(box.closed());
  REQUIRE_FALSE(box.offer(8));
  REQUIRE(box.poll() == std::optional<int>{7});
  REQUIRE_FALSE(box.take_for(std::chrono::seconds(5)).has_value());
}

TEST_CASE("onOffer is called for every accepted offer", "[Mailbox]") {
  Mailbox<int> box;
  int calls = 0;
  box.onOffer([&calls] { ++calls; });
  box.offer(1);
  box.offer(2);
  box.close();
  box.offer(3);
  REQUIRE(calls == 2);
}

class MailboxDispatchFixture : public GlibTestsFixture {
 public:
  MailboxDispatchFixture() {
    box.onOffer([this] { dp.emit(); });
    dp.connect([this] {
      if (auto value = box.poll()) {
        received = *value;
        quit();
      }
    });
  }

  Mailbox<int> box;
  Glib::Dispatcher dp;
  std::atomic<int> received = 0;
};

TEST_CASE_METHOD(MailboxDispatchFixture, "Offer from a worker wakes the main loop", "[Mailbox]") {
  setTimeout(1000);
  std::thread producer;
  run([this, &producer] {
    producer = std::thread([this] { box.offer(42); });
  });
  producer.join();
  REQUIRE(received == 42);
}
