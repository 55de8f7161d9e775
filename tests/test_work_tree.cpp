#include "errors.hpp"
#include "process.hpp"
#include "review_artifacts.hpp"
#include "review_request.hpp"
#include "util/ids.hpp"
#include "work_tree.hpp"
#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <thread>

using namespace prv;

namespace {

namespace fs = std::filesystem;

class NullTree : public WorkTree {
public:
  explicit NullTree(std::size_t id) : id_(id), path_("/nonexistent") {}
  std::size_t id() const override { return id_; }
  const fs::path &path() const override { return path_; }
  PreparedSeries prepare(const ReviewRequest &) override { return {}; }
  void index(const PreparedSeries &) override {}
  Snapshot snapshot(const std::string &, std::size_t,
                    const std::string &) override {
    return {};
  }

private:
  std::size_t id_;
  fs::path path_;
};

const std::map<std::string, std::string> kIdentity = {
    {"GIT_AUTHOR_NAME", "Test Author"},
    {"GIT_AUTHOR_EMAIL", "author@example.org"},
    {"GIT_COMMITTER_NAME", "Test Author"},
    {"GIT_COMMITTER_EMAIL", "author@example.org"},
};

std::string run_in(const fs::path &cwd, std::vector<std::string> argv) {
  ProcessSpec spec;
  spec.argv = std::move(argv);
  spec.cwd = cwd.string();
  spec.env = kIdentity;
  spec.timeout = std::chrono::seconds(60);
  auto result = run_process(spec);
  if (!result.ok()) {
    throw std::runtime_error(join_command(spec.argv) + ": " +
                             describe_failure(result));
  }
  auto out = result.stdout_text;
  while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) {
    out.pop_back();
  }
  return out;
}

/// Overrides an environment variable until the end of the scope.
class ScopedEnv {
public:
  ScopedEnv(const char *name, const char *value) : name_(name) {
    if (const char *old = std::getenv(name)) {
      previous_ = old;
    }
    setenv(name, value, 1);
  }
  ~ScopedEnv() {
    if (previous_) {
      setenv(name_.c_str(), previous_->c_str(), 1);
    } else {
      unsetenv(name_.c_str());
    }
  }
  ScopedEnv(const ScopedEnv &) = delete;
  ScopedEnv &operator=(const ScopedEnv &) = delete;

private:
  std::string name_;
  std::optional<std::string> previous_;
};

bool git_available() {
  ProcessSpec spec;
  spec.argv = {"git", "--version"};
  spec.timeout = std::chrono::seconds(10);
  return run_process(spec).ok();
}

std::string commit_file(const fs::path &repo, const std::string &name,
                        const std::string &content) {
  write_text_file(repo / name, content);
  run_in(repo, {"git", "add", name});
  run_in(repo, {"git", "commit", "-q", "-m", "update " + name});
  return run_in(repo, {"git", "rev-parse", "HEAD"});
}

/// Upstream "linux" repository plus an empty main repository.
struct GitFixture {
  fs::path root = fs::temp_directory_path() / ("prv_git_" + generate_uuid());
  fs::path upstream = root / "upstream" / "linux";
  fs::path repo = root / "repo";
  std::vector<std::string> mainline;
  std::string topic_patch;

  GitFixture() {
    fs::create_directories(upstream);
    run_in(upstream, {"git", "init", "-q"});
    run_in(upstream, {"git", "symbolic-ref", "HEAD", "refs/heads/main"});
    mainline.push_back(commit_file(upstream, "a.txt", "one\n"));
    mainline.push_back(commit_file(upstream, "a.txt", "two\n"));
    mainline.push_back(commit_file(upstream, "b.txt", "three\n"));
    run_in(upstream, {"git", "checkout", "-q", "-b", "topic"});
    commit_file(upstream, "topic.txt", "topic work\n");
    topic_patch =
        run_in(upstream, {"git", "format-patch", "-1", "--stdout", "HEAD"}) +
        "\n";
    run_in(upstream, {"git", "checkout", "-q", "main"});

    fs::create_directories(repo);
    run_in(repo, {"git", "init", "-q"});
    commit_file(repo, "README", "main repository\n");
  }

  ~GitFixture() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  GitSettings settings() const {
    GitSettings s;
    s.repo = repo;
    s.remote_url_template = (root / "upstream" / "{tree}").string();
    s.git_timeout = std::chrono::seconds(60);
    return s;
  }

  ReviewRequest request(ReviewSubmission submission) const {
    submission.tree = "linux";
    return validate_submission(submission, "tester");
  }
};

} // namespace

TEST_CASE("snapshot handle removes its directory once") {
  int removed = 0;
  auto remover = [&removed](const fs::path &) { ++removed; };
  {
    Snapshot snap("/tmp/snap-a", remover);
    REQUIRE(snap);
    snap.discard();
    snap.discard();
    REQUIRE_FALSE(snap);
  }
  REQUIRE(removed == 1);

  {
    Snapshot first("/tmp/snap-b", remover);
    Snapshot second(std::move(first));
    REQUIRE_FALSE(first);
    REQUIRE(second.path() == fs::path("/tmp/snap-b"));
    Snapshot third;
    third = std::move(second);
  }
  REQUIRE(removed == 2);

  {
    Snapshot kept("/tmp/snap-c", remover);
    REQUIRE(kept.release() == fs::path("/tmp/snap-c"));
  }
  REQUIRE(removed == 2);

  {
    Snapshot replaced("/tmp/snap-d", remover);
    replaced = Snapshot("/tmp/snap-e", remover);
    REQUIRE(removed == 3);
  }
  REQUIRE(removed == 4);
}

TEST_CASE("remover exceptions do not escape") {
  Snapshot snap("/tmp/snap-x",
                [](const fs::path &) { throw std::runtime_error("busy"); });
  snap.discard();
  REQUIRE_FALSE(snap);
}

TEST_CASE("work tree pool leases are exclusive per slot") {
  std::vector<std::unique_ptr<WorkTree>> trees;
  trees.push_back(std::make_unique<NullTree>(1));
  trees.push_back(std::make_unique<NullTree>(2));
  WorkTreePool pool(std::move(trees));
  REQUIRE(pool.size() == 2);
  REQUIRE(pool.idle_count() == 2);
  REQUIRE_THROWS_AS(pool.acquire(2, "x"), std::out_of_range);

  auto lease = pool.acquire(0, "setup-1");
  REQUIRE(lease->id() == 1);
  REQUIRE(lease.owner() == "setup-1");
  REQUIRE(pool.owner_of(0).value() == "setup-1");
  REQUIRE_FALSE(pool.owner_of(1));
  REQUIRE(pool.idle_count() == 1);

  std::atomic<bool> acquired{false};
  std::thread other([&] {
    auto second = pool.acquire(0, "setup-2");
    acquired = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  REQUIRE_FALSE(acquired.load());
  lease.release();
  other.join();
  REQUIRE(acquired.load());
  REQUIRE(pool.idle_count() == 2);
}

TEST_CASE("remote urls are built from the template") {
  GitSettings settings;
  settings.remote_url_template = "https://git.example.org/{tree}.git#{tree}";
  RemoteRegistry registry(settings);
  REQUIRE(registry.url_for("net-next") ==
          "https://git.example.org/net-next.git#net-next");
}

TEST_CASE("missing repository is a configuration error") {
  if (!git_available()) {
    WARN("git not available, skipping");
    return;
  }
  GitSettings settings;
  settings.repo = fs::temp_directory_path() / ("prv_none_" + generate_uuid());
  fs::create_directories(settings.repo);
  REQUIRE_THROWS_AS(create_git_work_trees(settings, 1, nullptr), ConfigError);
  fs::remove_all(settings.repo);
}

TEST_CASE("git work trees realize every origin") {
  if (!git_available()) {
    WARN("git not available, skipping");
    return;
  }
  GitFixture fx;
  auto trees = create_git_work_trees(fx.settings(), 2, nullptr);
  REQUIRE(trees.size() == 2);
  REQUIRE(fs::exists(fx.repo / "wt-1"));
  REQUIRE(trees[1]->path() == fx.repo / "wt-2");
  auto &tree = *trees[0];

  SECTION("single commit") {
    ReviewSubmission s;
    s.hash = fx.mainline[1];
    auto series = tree.prepare(fx.request(s));
    REQUIRE(series.patches.size() == 1);
    REQUIRE(series.patches[0].commit == fx.mainline[1]);
    REQUIRE(series.patches[0].content.find("+two") != std::string::npos);
    REQUIRE(series.range == fx.mainline[1] + "^.." + fx.mainline[1]);
  }

  SECTION("commit range") {
    ReviewSubmission s;
    s.range = fx.mainline[0] + ".." + fx.mainline[2];
    auto series = tree.prepare(fx.request(s));
    REQUIRE(series.patches.size() == 2);
    REQUIRE(series.patches[0].index == 1);
    REQUIRE(series.patches[0].commit == fx.mainline[1]);
    REQUIRE(series.patches[1].commit == fx.mainline[2]);
  }

  SECTION("literal patches on a branch") {
    ReviewSubmission s;
    s.branch = "main";
    s.patches = std::vector<std::string>{fx.topic_patch};
    auto series = tree.prepare(fx.request(s));
    REQUIRE(series.patches.size() == 1);
    REQUIRE(series.patches[0].content == fx.topic_patch);
    REQUIRE(read_text_file(tree.path() / "topic.txt").value() ==
            "topic work\n");
    REQUIRE(series.range ==
            fx.mainline[2] + ".." + series.patches[0].commit);
  }

  SECTION("patches that do not apply") {
    ReviewSubmission s;
    s.branch = "main";
    s.patches = std::vector<std::string>{"From: nobody\nSubject: junk\n\n"};
    REQUIRE_THROWS_AS(tree.prepare(fx.request(s)), PreparationError);

    // The tree stays usable for the next request.
    s.patches = std::vector<std::string>{fx.topic_patch};
    REQUIRE(tree.prepare(fx.request(s)).patches.size() == 1);
  }

  SECTION("unwritable scratch space only fails the request") {
    ReviewSubmission s;
    s.branch = "main";
    s.patches = std::vector<std::string>{fx.topic_patch};
    auto request = fx.request(s);
    // /proc refuses new files even for root; the second path is missing.
    for (const char *tmpdir : {"/proc", "/nonexistent-prv-scratch"}) {
      ScopedEnv env("TMPDIR", tmpdir);
      REQUIRE_THROWS_AS(tree.prepare(request), PreparationError);
    }
    REQUIRE(tree.prepare(request).patches.size() == 1);
  }

  SECTION("unknown commit") {
    ReviewSubmission s;
    s.hash = "deadbeefdeadbeef";
    REQUIRE_THROWS_AS(tree.prepare(fx.request(s)), PreparationError);
  }
}

TEST_CASE("indexer runs over the prepared range") {
  if (!git_available()) {
    WARN("git not available, skipping");
    return;
  }
  GitFixture fx;
  auto settings = fx.settings();
  settings.indexer_command = {"/bin/sh", "-c", "echo {range} > indexed.txt"};
  auto trees = create_git_work_trees(settings, 1, nullptr);
  PreparedSeries series;
  series.range = "a..b";
  trees[0]->index(series);
  REQUIRE(read_text_file(trees[0]->path() / "indexed.txt").value() == "a..b\n");

  settings.indexer_command = {"/bin/sh", "-c", "exit 4"};
  auto failing = create_git_work_trees(settings, 1, nullptr);
  REQUIRE_THROWS_AS(failing[0]->index(series), PreparationError);

  settings.skip_index = true;
  auto skipped = create_git_work_trees(settings, 1, nullptr);
  REQUIRE_NOTHROW(skipped[0]->index(series));
}

TEST_CASE("snapshots are pinned to their commit") {
  if (!git_available()) {
    WARN("git not available, skipping");
    return;
  }
  GitFixture fx;
  try {
    probe_reflink_support(fx.repo);
  } catch (const ConfigError &e) {
    WARN("reflink copies unsupported, skipping: " << e.what());
    return;
  }
  auto trees = create_git_work_trees(fx.settings(), 1, nullptr);
  auto &tree = *trees[0];
  ReviewSubmission s;
  s.range = fx.mainline[0] + ".." + fx.mainline[2];
  auto request = fx.request(s);
  auto series = tree.prepare(request);

  fs::path kept;
  {
    auto snap = tree.snapshot(request.id, 1, series.patches[0].commit);
    kept = snap.path();
    REQUIRE(fs::exists(kept));
    REQUIRE(read_text_file(kept / "a.txt").value() == "two\n");
    REQUIRE_FALSE(fs::exists(kept / "b.txt"));
    REQUIRE(run_in(kept, {"git", "rev-parse", "HEAD"}) ==
            series.patches[0].commit);
    // The tree itself is untouched.
    REQUIRE(fs::exists(tree.path() / "b.txt"));
  }
  REQUIRE_FALSE(fs::exists(kept));
}
