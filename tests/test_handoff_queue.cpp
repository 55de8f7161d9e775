#include "handoff_queue.hpp"
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <thread>
#include <vector>

using namespace prv;

TEST_CASE("handoff rejects zero capacity") {
  REQUIRE_THROWS_AS(BoundedHandoffQueue<int>(0), std::invalid_argument);
}

TEST_CASE("handoff preserves order and tracks high water") {
  BoundedHandoffQueue<int> q(4);
  REQUIRE(q.push(1));
  REQUIRE(q.push(2));
  REQUIRE(q.push(3));
  REQUIRE(q.size() == 3);
  REQUIRE(*q.pop() == 1);
  REQUIRE(q.push(4));
  REQUIRE(*q.pop() == 2);
  REQUIRE(*q.pop() == 3);
  REQUIRE(*q.pop() == 4);
  REQUIRE(q.high_water() == 3);
  REQUIRE(q.pushed() == 4);
  REQUIRE(q.capacity() == 4);
}

TEST_CASE("push blocks while full") {
  BoundedHandoffQueue<int> q(2);
  REQUIRE(q.push(1));
  REQUIRE(q.push(2));
  std::atomic<bool> pushed{false};
  std::thread producer([&] {
    q.push(3);
    pushed = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE_FALSE(pushed.load());
  REQUIRE(*q.pop() == 1);
  producer.join();
  REQUIRE(pushed.load());
  REQUIRE(q.size() == 2);
  REQUIRE(q.high_water() == 2);
}

TEST_CASE("close drains then ends consumers") {
  BoundedHandoffQueue<std::unique_ptr<int>> q(3);
  REQUIRE(q.push(std::make_unique<int>(7)));
  q.close();
  REQUIRE(q.closed());
  REQUIRE_FALSE(q.push(std::make_unique<int>(8)));
  auto item = q.pop();
  REQUIRE(item);
  REQUIRE(**item == 7);
  REQUIRE_FALSE(q.pop());
}

TEST_CASE("close releases a blocked producer") {
  BoundedHandoffQueue<int> q(1);
  REQUIRE(q.push(1));
  std::atomic<int> result{-1};
  std::thread producer([&] { result = q.push(2) ? 1 : 0; });
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  q.close();
  producer.join();
  REQUIRE(result.load() == 0);
}

TEST_CASE("clear destroys queued items") {
  auto counter = std::make_shared<int>(0);
  {
    BoundedHandoffQueue<std::shared_ptr<int>> q(4);
    q.push(counter);
    q.push(counter);
    REQUIRE(counter.use_count() == 3);
    REQUIRE(q.clear() == 2);
    REQUIRE(counter.use_count() == 1);
    REQUIRE(q.size() == 0);
  }
}

TEST_CASE("outstanding items never exceed capacity under overload") {
  const std::size_t capacity = 4;
  BoundedHandoffQueue<int> q(capacity);
  std::vector<std::thread> producers;
  for (int p = 0; p < 6; ++p) {
    producers.emplace_back([&q, p] {
      for (int i = 0; i < 50; ++i) {
        q.push(p * 100 + i);
      }
    });
  }
  std::thread consumer([&q] {
    for (int i = 0; i < 300; ++i) {
      q.pop();
      if (i % 10 == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
      }
    }
  });
  for (auto &t : producers) {
    t.join();
  }
  consumer.join();
  REQUIRE(q.pushed() == 300);
  REQUIRE(q.high_water() <= capacity);
  REQUIRE(q.size() == 0);
}
