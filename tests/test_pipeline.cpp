#include "errors.hpp"
#include "result_store.hpp"
#include "review_service.hpp"
#include "util/ids.hpp"
#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <filesystem>
#include <map>
#include <mutex>
#include <thread>

using namespace prv;

namespace {

namespace fs = std::filesystem;

/// Bookkeeping shared by the fake trees, their snapshots and the reviewer.
struct Ledger {
  std::mutex mutex;
  std::vector<std::string> prepared; ///< request ids in prepare order
  std::map<std::string, int> snapshots_created;
  std::map<std::string, int> snapshots_removed;
  std::map<std::string, int> reviews; ///< reviewer calls per commit
  std::size_t indexed{0};

  int created_total() {
    std::lock_guard<std::mutex> lock(mutex);
    int n = 0;
    for (const auto &[path, count] : snapshots_created) {
      n += count;
    }
    return n;
  }

  bool every_snapshot_removed_once() {
    std::lock_guard<std::mutex> lock(mutex);
    if (snapshots_created.size() != snapshots_removed.size()) {
      return false;
    }
    for (const auto &[path, count] : snapshots_created) {
      auto it = snapshots_removed.find(path);
      if (count != 1 || it == snapshots_removed.end() || it->second != 1) {
        return false;
      }
    }
    return true;
  }

  int reviews_of(const std::string &commit) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = reviews.find(commit);
    return it == reviews.end() ? 0 : it->second;
  }
};

/**
 * Work tree that turns literal patch bodies into commits named after the
 * body, and a range "0..N" into N commits. A body of "FAIL-PREP" fails the
 * preparation, "FAIL-INDEX" fails the indexer and "SNAPFAIL" fails only its
 * snapshot.
 */
class FakeWorkTree : public WorkTree {
public:
  FakeWorkTree(std::size_t id, fs::path root, std::shared_ptr<Ledger> ledger)
      : id_(id), path_(root / ("wt-" + std::to_string(id))),
        root_(std::move(root)), ledger_(std::move(ledger)) {
    fs::create_directories(path_);
  }

  std::size_t id() const override { return id_; }
  const fs::path &path() const override { return path_; }

  PreparedSeries prepare(const ReviewRequest &request) override {
    {
      std::lock_guard<std::mutex> lock(ledger_->mutex);
      ledger_->prepared.push_back(request.id);
    }
    PreparedSeries series;
    if (const auto *patches = std::get_if<PatchesOrigin>(&request.origin)) {
      for (const auto &body : patches->bodies) {
        if (body == "FAIL-PREP") {
          throw PreparationError("git am failed: corrupt patch");
        }
        series.patches.push_back({series.patches.size() + 1, body, body});
      }
    } else if (const auto *range = std::get_if<RangeOrigin>(&request.origin)) {
      const auto count = std::stoul(range->tip);
      for (std::size_t i = 1; i <= count; ++i) {
        const auto commit = "range-" + std::to_string(i);
        series.patches.push_back({i, commit, commit});
      }
    }
    series.range = "base..tip";
    return series;
  }

  void index(const PreparedSeries &series) override {
    {
      std::lock_guard<std::mutex> lock(ledger_->mutex);
      ++ledger_->indexed;
    }
    for (const auto &patch : series.patches) {
      if (patch.commit == "FAIL-INDEX") {
        throw PreparationError("Indexing base..tip failed: exit status 4");
      }
    }
  }

  Snapshot snapshot(const std::string &review_id, std::size_t patch_index,
                    const std::string &commit) override {
    if (commit == "SNAPFAIL") {
      throw PreparationError("reflink copy failed");
    }
    const auto target =
        root_ / ("snap-" + review_id + "-" + std::to_string(patch_index));
    fs::create_directories(target);
    write_text_file(target / "COMMIT", commit);
    {
      std::lock_guard<std::mutex> lock(ledger_->mutex);
      ++ledger_->snapshots_created[target.string()];
    }
    auto ledger = ledger_;
    return Snapshot(target, [ledger](const fs::path &p) {
      std::error_code ec;
      fs::remove_all(p, ec);
      std::lock_guard<std::mutex> lock(ledger->mutex);
      ++ledger->snapshots_removed[p.string()];
    });
  }

private:
  std::size_t id_;
  fs::path path_;
  fs::path root_;
  std::shared_ptr<Ledger> ledger_;
};

/**
 * Reviewer keyed on the commit name: "TIMEOUT" always times out, "CRASH"
 * raises a plain runtime error and "STORAGE" a storage error.
 */
class FakeReviewer : public Reviewer {
public:
  FakeReviewer(std::shared_ptr<Ledger> ledger, std::chrono::milliseconds delay)
      : ledger_(std::move(ledger)), delay_(delay) {}

  void review(const ReviewJob &job) override {
    {
      std::lock_guard<std::mutex> lock(ledger_->mutex);
      ++ledger_->reviews[job.commit];
    }
    if (delay_.count() > 0) {
      std::this_thread::sleep_for(delay_);
    }
    if (!read_text_file(job.workdir / "COMMIT")) {
      throw ReviewExecutionError("snapshot is gone");
    }
    if (job.commit == "TIMEOUT") {
      throw ReviewTimeoutError("Reviewer timed out after 800s");
    }
    if (job.commit == "CRASH") {
      throw std::runtime_error("reviewer blew up");
    }
    if (job.commit == "STORAGE") {
      throw StorageError("disk full");
    }
    write_text_file(job.patch_dir / "review.json", "{}\n");
    write_text_file(job.patch_dir / "review.md", "review of " + job.commit);
  }

private:
  std::shared_ptr<Ledger> ledger_;
  std::chrono::milliseconds delay_;
};

struct Harness {
  fs::path root = fs::temp_directory_path() / ("prv_pipeline_" + generate_uuid());
  std::shared_ptr<Ledger> ledger = std::make_shared<Ledger>();

  ~Harness() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  std::unique_ptr<ReviewService>
  service(std::size_t setup_workers, std::size_t reviewer_workers,
          std::chrono::milliseconds delay = std::chrono::milliseconds(0),
          bool keep_snapshots = false) {
    std::vector<std::unique_ptr<WorkTree>> trees;
    for (std::size_t i = 1; i <= setup_workers; ++i) {
      trees.push_back(std::make_unique<FakeWorkTree>(i, root / "trees", ledger));
    }
    ServiceSettings settings;
    settings.results_path = root / "results";
    settings.reviewer_workers = reviewer_workers;
    settings.reviewer_attempts = 3;
    settings.keep_snapshots = keep_snapshots;
    return std::make_unique<ReviewService>(
        settings, std::move(trees),
        std::make_unique<FakeReviewer>(ledger, delay));
  }
};

ReviewSubmission literal(std::vector<std::string> bodies,
                         std::vector<bool> mask = {}) {
  ReviewSubmission s;
  s.tree = "linux";
  s.patches = std::move(bodies);
  if (!mask.empty()) {
    s.mask = std::move(mask);
  }
  return s;
}

const auto kWait = std::chrono::seconds(30);

} // namespace

TEST_CASE("masked patches are never snapshotted") {
  Harness h;
  auto service = h.service(1, 1);
  service->start();
  auto id = service->submit(literal({"A", "B", "C"}, {true, false, true}),
                            "alice");
  auto record = service->wait_for(id, kWait);
  REQUIRE(record);
  REQUIRE(record->status == ReviewStatus::Done);
  REQUIRE(record->message.empty());

  auto doc = service->get(id, "alice", ReviewFormat::Markdown);
  REQUIRE(doc);
  REQUIRE((*doc)["review"] ==
          nlohmann::json::array({"review of A", nullptr, "review of C"}));
  REQUIRE((*doc)["patches"][1]["state"] == "skipped");
  REQUIRE(h.ledger->created_total() == 2);
  REQUIRE(h.ledger->reviews_of("B") == 0);
  service->stop();
  REQUIRE(h.ledger->every_snapshot_removed_once());
  REQUIRE(h.ledger->indexed == 1);
}

TEST_CASE("preparation failure fails the request without results") {
  Harness h;
  auto service = h.service(1, 1);
  service->start();
  auto id = service->submit(literal({"A", "FAIL-PREP"}), "alice");
  auto record = service->wait_for(id, kWait);
  REQUIRE(record->status == ReviewStatus::Error);
  REQUIRE(record->message.find("corrupt patch") != std::string::npos);

  auto doc = service->get(id, {}, ReviewFormat::Markdown);
  REQUIRE((*doc)["status"] == "error");
  REQUIRE_FALSE((*doc)["message"].get<std::string>().empty());
  for (const auto &review : (*doc)["review"]) {
    REQUIRE(review.is_null());
  }
  REQUIRE(service->artifacts().read_message("alice", id));
  REQUIRE(h.ledger->created_total() == 0);
  REQUIRE(h.ledger->reviews.empty());
  service->stop();
}

TEST_CASE("indexer failure fails the stored patches") {
  Harness h;
  auto service = h.service(1, 1);
  service->start();
  auto id = service->submit(
      literal({"A", "B", "FAIL-INDEX"}, {true, false, true}), "alice");
  auto record = service->wait_for(id, kWait);
  REQUIRE(record->status == ReviewStatus::Error);
  REQUIRE(record->message.find("Indexing") != std::string::npos);
  REQUIRE(record->patches.size() == 3);
  for (const auto &patch : record->patches) {
    if (patch.index == 2) {
      REQUIRE(patch.state == PatchState::Skipped);
    } else {
      REQUIRE(patch.state == PatchState::Error);
      REQUIRE(patch.error == record->message);
    }
  }

  auto doc = service->get(id, "alice", ReviewFormat::Json);
  REQUIRE((*doc)["review"] == nlohmann::json::array({nullptr, nullptr, nullptr}));
  REQUIRE(service->artifacts().read_message("alice", id).value() ==
          record->message);
  REQUIRE(h.ledger->indexed == 1);
  REQUIRE(h.ledger->created_total() == 0);
  REQUIRE(h.ledger->reviews.empty());
  service->stop();
}

TEST_CASE("failed patches have no review text") {
  Harness h;
  auto service = h.service(1, 1);
  service->start();
  auto id = service->submit(literal({"OK", "TIMEOUT"}), "bob");
  auto record = service->wait_for(id, kWait);
  REQUIRE(record->status == ReviewStatus::Done);
  REQUIRE(record->patches[1].state == PatchState::Error);

  // The reviewer may leave partial output behind on a failed attempt.
  write_text_file(
      service->artifacts().ensure_patch_dir("bob", id, 2) / "review.json",
      "{\"partial\": true}\n");
  auto doc = service->get(id, "bob", ReviewFormat::Json);
  REQUIRE((*doc)["review"][0] == "{}\n");
  REQUIRE((*doc)["review"][1].is_null());
  service->stop();
}

TEST_CASE("one timing out patch does not abort the series") {
  Harness h;
  auto service = h.service(1, 2);
  service->start();
  auto id =
      service->submit(literal({"P1", "P2", "TIMEOUT", "P4", "P5"}), "bob");
  auto record = service->wait_for(id, kWait);
  REQUIRE(record->status == ReviewStatus::Done);
  REQUIRE(record->message == "1 of 5 patches failed review");
  for (const auto &patch : record->patches) {
    if (patch.index == 3) {
      REQUIRE(patch.state == PatchState::Error);
      REQUIRE(patch.attempts == 3);
      REQUIRE(patch.error.find("timed out") != std::string::npos);
    } else {
      REQUIRE(patch.state == PatchState::Done);
      REQUIRE(patch.attempts == 1);
    }
  }
  REQUIRE(h.ledger->reviews_of("TIMEOUT") == 3);
  REQUIRE(h.ledger->reviews_of("P4") == 1);
  service->stop();
  REQUIRE(h.ledger->created_total() == 5);
  REQUIRE(h.ledger->every_snapshot_removed_once());
}

TEST_CASE("unexpected reviewer exceptions are not retried") {
  Harness h;
  auto service = h.service(1, 1);
  service->start();
  auto id = service->submit(literal({"CRASH", "OK"}), "bob");
  auto record = service->wait_for(id, kWait);
  REQUIRE(record->status == ReviewStatus::Done);
  REQUIRE(record->patches[0].state == PatchState::Error);
  REQUIRE(record->patches[0].attempts == 1);
  REQUIRE(record->patches[0].error == "reviewer blew up");
  REQUIRE(h.ledger->reviews_of("CRASH") == 1);
  service->stop();
  REQUIRE(h.ledger->every_snapshot_removed_once());
}

TEST_CASE("snapshot failure only fails its patch") {
  Harness h;
  auto service = h.service(1, 1);
  service->start();
  auto id = service->submit(literal({"A", "SNAPFAIL", "C"}), "carol");
  auto record = service->wait_for(id, kWait);
  REQUIRE(record->status == ReviewStatus::Done);
  REQUIRE(record->patches[0].state == PatchState::Done);
  REQUIRE(record->patches[1].state == PatchState::Error);
  REQUIRE(record->patches[1].error.rfind("Snapshot failed", 0) == 0);
  REQUIRE(record->patches[2].state == PatchState::Done);
  service->stop();
}

TEST_CASE("mask mismatch after resolution is a preparation error") {
  Harness h;
  auto service = h.service(1, 1);
  service->start();
  ReviewSubmission s;
  s.tree = "linux";
  s.range = "0..3";
  s.mask = std::vector<bool>{true, false};
  auto id = service->submit(s, "dave");
  auto record = service->wait_for(id, kWait);
  REQUIRE(record->status == ReviewStatus::Error);
  REQUIRE(record->message.find("Mask") != std::string::npos);
  REQUIRE(h.ledger->created_total() == 0);

  s.mask = std::vector<bool>{true, false, true};
  auto ok = service->submit(s, "dave");
  REQUIRE(service->wait_for(ok, kWait)->status == ReviewStatus::Done);
  REQUIRE(h.ledger->created_total() == 2);
  service->stop();
}

TEST_CASE("handoff stays bounded under overload") {
  Harness h;
  const std::size_t reviewers = 2;
  auto service = h.service(3, reviewers, std::chrono::milliseconds(15));
  service->start();
  std::vector<std::string> ids;
  for (int i = 0; i < 6; ++i) {
    const auto n = std::to_string(i);
    ids.push_back(service->submit(
        literal({"a" + n, "b" + n, "c" + n, "d" + n}), "load"));
  }
  for (const auto &id : ids) {
    REQUIRE(service->wait_for(id, kWait)->status == ReviewStatus::Done);
  }
  REQUIRE(service->handoff().high_water() <= 2 * reviewers);
  REQUIRE(service->handoff().pushed() == 24);
  REQUIRE(h.ledger->created_total() == 24);

  {
    std::lock_guard<std::mutex> lock(h.ledger->mutex);
    REQUIRE(h.ledger->prepared.size() == ids.size());
    std::vector<std::string> sorted_prepared = h.ledger->prepared;
    std::vector<std::string> sorted_ids = ids;
    std::sort(sorted_prepared.begin(), sorted_prepared.end());
    std::sort(sorted_ids.begin(), sorted_ids.end());
    REQUIRE(sorted_prepared == sorted_ids);
  }

  auto status = service->status();
  REQUIRE(status["status"] == "running");
  REQUIRE(status["setup_workers"] == 3);
  REQUIRE(status["reviewer_workers"] == reviewers);
  REQUIRE(status["handoff"]["capacity"] == 2 * reviewers);
  REQUIRE(status["review_counts"]["reviews"]["done"] == 6);
  service->stop();
  REQUIRE(service->status()["status"] == "stopped");
  REQUIRE(h.ledger->every_snapshot_removed_once());
}

TEST_CASE("queued requests survive a restart in order") {
  Harness h;
  std::vector<std::string> ids;
  {
    auto service = h.service(1, 1);
    for (const char *body : {"first", "second", "third"}) {
      ids.push_back(service->submit(literal({body}), "erin"));
    }
    auto doc = service->get(ids[2]);
    REQUIRE((*doc)["status"] == "queued");
    REQUIRE((*doc)["queue-position"] == 2);
    REQUIRE((*doc)["queue-len"] == 2);
  }
  auto service = h.service(1, 1);
  REQUIRE(service->queue().ids() == ids);
  REQUIRE(service->start() == 0);
  for (const auto &id : ids) {
    REQUIRE(service->wait_for(id, kWait)->status == ReviewStatus::Done);
  }
  {
    std::lock_guard<std::mutex> lock(h.ledger->mutex);
    REQUIRE(h.ledger->prepared == ids);
  }
  service->stop();
}

TEST_CASE("unfinished requests are interrupted at start") {
  Harness h;
  fs::create_directories(h.root / "results");
  std::string lost;
  {
    ResultStore store((h.root / "results" / "metadata.db").string());
    auto request = validate_submission(literal({"X"}), "frank");
    store.create_review(request);
    store.mark_setup_started(request.id);
    lost = request.id;
  }
  auto service = h.service(1, 1);
  REQUIRE(service->start() == 1);
  auto record = service->store().get(lost);
  REQUIRE(record->status == ReviewStatus::Error);
  REQUIRE(record->message == "interrupted by restart");
  service->stop();
}

TEST_CASE("kept snapshots are not removed") {
  Harness h;
  auto service = h.service(1, 1, std::chrono::milliseconds(0), true);
  service->start();
  auto id = service->submit(literal({"A"}), "gina");
  REQUIRE(service->wait_for(id, kWait)->status == ReviewStatus::Done);
  service->stop();
  REQUIRE(h.ledger->created_total() == 1);
  std::lock_guard<std::mutex> lock(h.ledger->mutex);
  REQUIRE(h.ledger->snapshots_removed.empty());
}

TEST_CASE("storage failure stops the pipeline") {
  Harness h;
  auto service = h.service(1, 1);
  service->start();
  auto id = service->submit(literal({"STORAGE"}), "hank");
  service->wait_for(id, kWait);
  REQUIRE(service->failed());
  REQUIRE(service->fatal_error() == "disk full");
  REQUIRE(service->status()["status"] == "failed");
  REQUIRE_THROWS_AS(service->submit(literal({"A"}), "hank"), StorageError);
  service->stop();
  REQUIRE(h.ledger->every_snapshot_removed_once());
}

TEST_CASE("queries respect ownership and validation") {
  Harness h;
  auto service = h.service(1, 1);
  REQUIRE_THROWS_AS(service->submit(ReviewSubmission{}, "ivan"),
                    ValidationError);
  auto id = service->submit(literal({"A"}), "ivan");
  REQUIRE(service->get(id, "ivan"));
  REQUIRE_FALSE(service->get(id, "mallory"));
  REQUIRE_FALSE(service->get("no-such-id"));
  auto listing = service->list("ivan", 10);
  REQUIRE(listing.size() == 1);
  REQUIRE(listing[0]["review_id"] == id);
  REQUIRE(service->list("mallory", 10).empty());
}
