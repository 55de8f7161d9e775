#include "log.hpp"
#include "signals.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <future>
#include <signal.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

TEST_CASE("shutdown signal reaches the watcher while logging runs") {
  prv::block_shutdown_signals();
  // Starts the asynchronous logging thread, which must inherit the mask.
  prv::init_logger(prv::LogSettings{});
  spdlog::info("logging started");

  std::promise<int> received;
  auto signalled = received.get_future();
  {
    prv::SignalWatcher watcher(
        [&received](int sig) { received.set_value(sig); });
    REQUIRE(kill(getpid(), SIGTERM) == 0);
    REQUIRE(signalled.wait_for(std::chrono::seconds(10)) ==
            std::future_status::ready);
    REQUIRE(signalled.get() == SIGTERM);
  }
  spdlog::shutdown();
}

TEST_CASE("watcher stops without a signal") {
  prv::block_shutdown_signals();
  bool called = false;
  {
    prv::SignalWatcher watcher([&called](int) { called = true; });
  }
  REQUIRE_FALSE(called);
}
