#include "errors.hpp"
#include "review_queue.hpp"
#include "util/ids.hpp"
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace prv;

namespace {

std::filesystem::path fresh_queue_file(const std::string &name) {
  auto dir = std::filesystem::temp_directory_path() /
             ("prv_queue_" + name + "_" + generate_uuid());
  std::filesystem::create_directories(dir);
  return dir / "queue.json";
}

ReviewRequest make_request(const std::string &hash, std::size_t patches = 1) {
  ReviewSubmission s;
  s.tree = "linux";
  s.range = hash + "~" + std::to_string(patches) + ".." + hash;
  auto request = validate_submission(s, "tester");
  request.estimated_patches = patches;
  return request;
}

} // namespace

TEST_CASE("queue is fifo and reports positions") {
  ReviewQueue queue(fresh_queue_file("fifo"));
  auto a = queue.submit(make_request("aaa", 3));
  auto b = queue.submit(make_request("bbb", 2));
  auto c = queue.submit(make_request("ccc", 1));
  REQUIRE(queue.length() == 3);
  REQUIRE(queue.position(a) == 0u);
  REQUIRE(queue.position(c) == 2u);
  REQUIRE(queue.patches_ahead(c) == 5);
  REQUIRE(queue.patches_ahead("unknown") == 0);
  REQUIRE_FALSE(queue.position("unknown"));
  REQUIRE(queue.ids() == std::vector<std::string>{a, b, c});

  REQUIRE(queue.claim()->id == a);
  REQUIRE(queue.length() == 2);
  REQUIRE(queue.claim()->id == b);
  REQUIRE(queue.claim()->id == c);
  REQUIRE(queue.length() == 0);
  REQUIRE_FALSE(queue.claim_for(std::chrono::milliseconds(20)));
}

TEST_CASE("queue survives a restart in order") {
  auto path = fresh_queue_file("reload");
  std::vector<std::string> ids;
  {
    ReviewQueue queue(path);
    for (const char *hash : {"one", "two", "three", "four"}) {
      ids.push_back(queue.submit(make_request(hash)));
    }
    REQUIRE(queue.claim()->id == ids[0]);
  }
  ReviewQueue reloaded(path);
  REQUIRE(reloaded.length() == 3);
  REQUIRE(reloaded.ids() ==
          std::vector<std::string>{ids[1], ids[2], ids[3]});
  auto next = reloaded.claim();
  REQUIRE(next);
  REQUIRE(next->id == ids[1]);
  REQUIRE(std::get<RangeOrigin>(next->origin).tip == "two");
}

TEST_CASE("corrupt queue file is a storage error") {
  auto path = fresh_queue_file("corrupt");
  {
    std::ofstream f(path);
    f << "{ not json";
  }
  REQUIRE_THROWS_AS(ReviewQueue(path), StorageError);
}

TEST_CASE("close wakes blocked claimers") {
  ReviewQueue queue(fresh_queue_file("close"));
  std::atomic<int> empty_claims{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 3; ++i) {
    threads.emplace_back([&] {
      if (!queue.claim()) {
        ++empty_claims;
      }
    });
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  queue.close();
  for (auto &t : threads) {
    t.join();
  }
  REQUIRE(empty_claims.load() == 3);
  REQUIRE(queue.closed());
}

TEST_CASE("concurrent claimers receive every request exactly once") {
  ReviewQueue queue(fresh_queue_file("once"));
  const int total = 60;
  std::set<std::string> submitted;
  for (int i = 0; i < total; ++i) {
    submitted.insert(queue.submit(make_request("c" + std::to_string(i))));
  }
  std::mutex mutex;
  std::vector<std::string> claimed;
  std::atomic<bool> grew{false};
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&] {
      std::size_t last_length = queue.length();
      while (auto request = queue.claim_for(std::chrono::milliseconds(50))) {
        const auto now = queue.length();
        if (now > last_length) {
          grew = true;
        }
        last_length = now;
        std::lock_guard<std::mutex> lock(mutex);
        claimed.push_back(request->id);
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  REQUIRE_FALSE(grew.load());
  REQUIRE(claimed.size() == static_cast<std::size_t>(total));
  REQUIRE(std::set<std::string>(claimed.begin(), claimed.end()) == submitted);
}
