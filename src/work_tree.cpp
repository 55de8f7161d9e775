#include "work_tree.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "patchwork_client.hpp"
#include "process.hpp"
#include "review_artifacts.hpp"
#include "util/ids.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <type_traits>
#include <variant>

namespace prv {

namespace {

namespace fs = std::filesystem;

std::shared_ptr<spdlog::logger> worktree_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("worktree");
  }();
  return logger;
}

const std::map<std::string, std::string> kGitEnv = {
    {"GIT_COMMITTER_NAME", "patchreview"},
    {"GIT_COMMITTER_EMAIL", "patchreview@localhost"},
    {"GIT_TERMINAL_PROMPT", "0"},
};

std::string trim(std::string s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
    s.pop_back();
  }
  std::size_t start = 0;
  while (start < s.size() &&
         std::isspace(static_cast<unsigned char>(s[start]))) {
    ++start;
  }
  return s.substr(start);
}

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> out;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (!line.empty()) {
      out.push_back(line);
    }
  }
  return out;
}

ProcessResult run_git(const fs::path &cwd, const std::vector<std::string> &args,
                      std::chrono::milliseconds timeout) {
  ProcessSpec spec;
  spec.argv.reserve(args.size() + 1);
  spec.argv.push_back("git");
  spec.argv.insert(spec.argv.end(), args.begin(), args.end());
  spec.cwd = cwd.string();
  spec.env = kGitEnv;
  spec.timeout = timeout;
  return run_process(spec);
}

/// Files under a work tree or scratch space only concern the current request.
void write_tree_file(const fs::path &path, const std::string &content) {
  try {
    write_text_file(path, content);
  } catch (const StorageError &e) {
    throw PreparationError(e.what());
  }
}

/// Temporary file deleted when the scope ends.
class ScratchFile {
public:
  ScratchFile(const std::string &prefix, const std::string &content) {
    try {
      path_ = fs::temp_directory_path() /
              (prefix + "-" + generate_uuid() + ".patch");
    } catch (const fs::filesystem_error &e) {
      throw PreparationError(std::string("No scratch directory: ") +
                             e.what());
    }
    write_tree_file(path_, content);
  }
  ~ScratchFile() {
    std::error_code ec;
    fs::remove(path_, ec);
  }
  ScratchFile(const ScratchFile &) = delete;
  ScratchFile &operator=(const ScratchFile &) = delete;

  const fs::path &path() const { return path_; }

private:
  fs::path path_;
};

/**
 * Unregister and delete a snapshot. Runs from destructors, so failures are
 * logged rather than thrown.
 */
void remove_snapshot_dir(const fs::path &repo, const fs::path &snapshot,
                         std::chrono::milliseconds timeout) {
  auto result =
      run_git(repo, {"worktree", "remove", "--force", snapshot.string()},
              timeout);
  std::error_code ec;
  if (result.ok() && !fs::exists(snapshot, ec)) {
    worktree_log()->debug("Removed snapshot {}", snapshot.string());
    return;
  }
  fs::remove_all(snapshot, ec);
  if (ec) {
    worktree_log()->error("Failed to delete snapshot {}: {}",
                          snapshot.string(), ec.message());
  }
  auto prune = run_git(repo, {"worktree", "prune"}, timeout);
  if (!prune.ok()) {
    worktree_log()->warn("git worktree prune failed: {}",
                         describe_failure(prune));
  }
  worktree_log()->debug("Removed snapshot {} without git ({})",
                        snapshot.string(), describe_failure(result));
}

/// "gitdir: /repo/.git/worktrees/x" -> "/repo/.git/worktrees/x"
fs::path parse_gitfile(const std::string &content, const fs::path &base) {
  const std::string prefix = "gitdir:";
  auto text = trim(content);
  if (text.rfind(prefix, 0) != 0) {
    throw PreparationError("Unexpected .git file content in " + base.string());
  }
  fs::path dir = trim(text.substr(prefix.size()));
  return dir.is_absolute() ? dir : base / dir;
}

} // namespace

Snapshot::Snapshot(std::filesystem::path path, Remover remover)
    : path_(std::move(path)), remover_(std::move(remover)) {}

Snapshot::~Snapshot() { discard(); }

Snapshot::Snapshot(Snapshot &&other) noexcept
    : path_(std::move(other.path_)), remover_(std::move(other.remover_)) {
  other.remover_ = nullptr;
}

Snapshot &Snapshot::operator=(Snapshot &&other) noexcept {
  if (this != &other) {
    discard();
    path_ = std::move(other.path_);
    remover_ = std::move(other.remover_);
    other.remover_ = nullptr;
  }
  return *this;
}

void Snapshot::discard() noexcept {
  if (!remover_) {
    return;
  }
  Remover remover = std::move(remover_);
  remover_ = nullptr;
  try {
    remover(path_);
  } catch (const std::exception &e) {
    worktree_log()->error("Removing snapshot {} failed: {}", path_.string(),
                          e.what());
  }
}

std::filesystem::path Snapshot::release() noexcept {
  remover_ = nullptr;
  return path_;
}

RemoteRegistry::RemoteRegistry(GitSettings settings)
    : settings_(std::move(settings)) {}

std::string RemoteRegistry::url_for(const std::string &name) const {
  std::string url = settings_.remote_url_template;
  const std::string key = "{tree}";
  for (auto pos = url.find(key); pos != std::string::npos;
       pos = url.find(key, pos + name.size())) {
    url.replace(pos, key.size(), name);
  }
  return url;
}

std::mutex &RemoteRegistry::remote_mutex(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &slot = fetch_mutexes_[name];
  if (!slot) {
    slot = std::make_unique<std::mutex>();
  }
  return *slot;
}

void RemoteRegistry::ensure(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto existing =
      run_git(settings_.repo, {"remote", "get-url", name}, settings_.git_timeout);
  if (existing.ok()) {
    return;
  }
  const std::string url = url_for(name);
  auto added = run_git(settings_.repo, {"remote", "add", name, url},
                       settings_.git_timeout);
  if (!added.ok()) {
    throw PreparationError("Failed to add remote " + name + ": " +
                           describe_failure(added));
  }
  worktree_log()->info("Added remote {} -> {}", name, url);
}

void RemoteRegistry::fetch(const std::filesystem::path &tree_path,
                           const std::string &name) {
  std::lock_guard<std::mutex> lock(remote_mutex(name));
  worktree_log()->debug("Fetching {} in {}", name, tree_path.string());
  auto result = run_git(tree_path, {"fetch", name}, settings_.git_timeout);
  if (!result.ok()) {
    throw PreparationError("git fetch " + name + " failed: " +
                           describe_failure(result));
  }
}

GitWorkTree::GitWorkTree(std::size_t id, const GitSettings &settings,
                         std::shared_ptr<RemoteRegistry> remotes,
                         std::shared_ptr<SeriesSource> series)
    : id_(id), settings_(settings),
      path_(settings.repo / ("wt-" + std::to_string(id))),
      remotes_(std::move(remotes)), series_(std::move(series)) {
  std::error_code ec;
  if (fs::exists(path_, ec)) {
    worktree_log()->debug("Reusing work tree {}", path_.string());
    return;
  }
  worktree_log()->info("Creating work tree {}", path_.string());
  auto result = run_git(settings_.repo,
                        {"worktree", "add", "--detach", path_.filename().string()},
                        settings_.git_timeout);
  if (!result.ok()) {
    throw ConfigError("Failed to create work tree " + path_.string() + ": " +
                      describe_failure(result));
  }
}

std::string GitWorkTree::git(const std::vector<std::string> &args,
                             const std::string &what) const {
  auto result = run_git(path_, args, settings_.git_timeout);
  if (!result.ok()) {
    throw PreparationError(what + ": " + describe_failure(result));
  }
  return result.stdout_text;
}

std::string GitWorkTree::default_branch(const std::string &remote) const {
  auto head = run_git(path_,
                      {"symbolic-ref", "--short", "refs/remotes/" + remote + "/HEAD"},
                      settings_.git_timeout);
  if (head.ok()) {
    auto ref = trim(head.stdout_text);
    const std::string prefix = remote + "/";
    if (ref.rfind(prefix, 0) == 0) {
      return ref.substr(prefix.size());
    }
  }
  auto show = run_git(path_, {"remote", "show", remote}, settings_.git_timeout);
  if (show.ok()) {
    for (const auto &line : split_lines(show.stdout_text)) {
      const std::string key = "HEAD branch:";
      auto pos = line.find(key);
      if (pos != std::string::npos) {
        auto branch = trim(line.substr(pos + key.size()));
        if (!branch.empty() && branch != "(unknown)") {
          return branch;
        }
      }
    }
  }
  throw PreparationError("Failed to determine default branch for " + remote);
}

std::string GitWorkTree::verify_commit(const std::string &rev) const {
  auto result = run_git(path_, {"rev-parse", "--verify", "--quiet",
                                "--end-of-options", rev + "^{commit}"},
                        settings_.git_timeout);
  auto sha = trim(result.stdout_text);
  if (!result.ok() || sha.empty()) {
    throw PreparationError("Commit " + rev + " not found");
  }
  return sha;
}

std::vector<std::string>
GitWorkTree::list_commits(const std::string &range) const {
  return split_lines(
      git({"rev-list", "--reverse", range}, "Failed to list " + range));
}

std::string GitWorkTree::format_patch(const std::string &commit) const {
  return git({"format-patch", "-1", "--stdout", commit},
             "Failed to format " + commit);
}

void GitWorkTree::reset_to(const std::string &ref) const {
  // A previous request may have died in the middle of git am.
  auto abort = run_git(path_, {"am", "--abort"}, settings_.git_timeout);
  if (abort.ok()) {
    worktree_log()->warn("Aborted stale git am in {}", path_.string());
  }
  git({"reset", "--hard", ref}, "Failed to reset to " + ref);
}

std::vector<std::string>
GitWorkTree::apply_mbox(const std::string &body,
                        const std::string &label) const {
  const std::string before =
      trim(git({"rev-parse", "HEAD"}, "Failed to resolve HEAD"));
  ScratchFile file("prv-wt" + std::to_string(id_), body);
  auto result =
      run_git(path_, {"am", file.path().string()}, settings_.git_timeout);
  if (!result.ok()) {
    auto abort = run_git(path_, {"am", "--abort"}, settings_.git_timeout);
    if (!abort.ok()) {
      worktree_log()->warn("git am --abort failed in {}: {}", path_.string(),
                           describe_failure(abort));
    }
    throw PreparationError("Failed to apply " + label + ": " +
                           describe_failure(result));
  }
  return list_commits(before + "..HEAD");
}

PreparedSeries GitWorkTree::prepare(const ReviewRequest &request) {
  remotes_->ensure(request.tree);
  remotes_->fetch(path_, request.tree);

  PreparedSeries series;
  auto add = [&series](const std::string &commit, std::string content) {
    series.patches.push_back(
        PreparedPatch{series.patches.size() + 1, commit, std::move(content)});
  };

  std::visit(
      [&](const auto &origin) {
        using T = std::decay_t<decltype(origin)>;
        if constexpr (std::is_same_v<T, CommitOrigin>) {
          const auto sha = verify_commit(origin.hash);
          add(sha, format_patch(sha));
          series.range = sha + "^.." + sha;
        } else if constexpr (std::is_same_v<T, RangeOrigin>) {
          const auto base = verify_commit(origin.base);
          const auto tip = verify_commit(origin.tip);
          series.range = base + ".." + tip;
          for (const auto &sha : list_commits(series.range)) {
            add(sha, format_patch(sha));
          }
        } else {
          const std::string branch = request.branch.empty()
                                         ? default_branch(request.tree)
                                         : request.branch;
          const std::string base_ref = request.tree + "/" + branch;
          reset_to(base_ref);
          const auto base = verify_commit(base_ref);
          if constexpr (std::is_same_v<T, SeriesOrigin>) {
            if (!series_) {
              throw PreparationError("No series source is configured");
            }
            auto mbox = series_->fetch_mbox(origin.series_id);
            for (const auto &sha :
                 apply_mbox(mbox, "series " + origin.series_id)) {
              add(sha, format_patch(sha));
            }
          } else {
            for (std::size_t i = 0; i < origin.bodies.size(); ++i) {
              auto commits =
                  apply_mbox(origin.bodies[i], "patch " + std::to_string(i + 1));
              for (const auto &sha : commits) {
                add(sha, commits.size() == 1 ? origin.bodies[i]
                                             : format_patch(sha));
              }
            }
          }
          if (!series.patches.empty()) {
            series.range = base + ".." + series.patches.back().commit;
          }
        }
      },
      request.origin);

  if (series.patches.empty()) {
    throw PreparationError("Nothing to review for " +
                           describe_origin(request.origin));
  }
  reset_to(series.patches.back().commit);
  worktree_log()->info("Tree {} prepared {} patch(es) for review {} ({})", id_,
                       series.patches.size(), request.id, series.range);
  return series;
}

void GitWorkTree::index(const PreparedSeries &series) {
  if (settings_.skip_index || settings_.indexer_command.empty()) {
    worktree_log()->debug("Indexing skipped for tree {}", id_);
    return;
  }
  ProcessSpec spec;
  for (auto arg : settings_.indexer_command) {
    const std::string key = "{range}";
    auto pos = arg.find(key);
    if (pos != std::string::npos) {
      arg.replace(pos, key.size(), series.range);
    }
    spec.argv.push_back(std::move(arg));
  }
  spec.cwd = path_.string();
  spec.timeout = settings_.index_timeout;
  auto started = std::chrono::steady_clock::now();
  auto result = run_process(spec);
  if (!result.ok()) {
    throw PreparationError("Indexing " + series.range +
                           " failed: " + describe_failure(result));
  }
  worktree_log()->info(
      "Indexed {} in {}ms", series.range,
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started)
          .count());
}

std::filesystem::path
GitWorkTree::snapshot_path(const std::string &review_id,
                           std::size_t patch_index) const {
  return path_.string() + "." + safe_path_component(review_id) + "-" +
         std::to_string(patch_index);
}

void GitWorkTree::remove_snapshot(const std::filesystem::path &path) const {
  remove_snapshot_dir(settings_.repo, path, settings_.git_timeout);
}

Snapshot GitWorkTree::snapshot(const std::string &review_id,
                               std::size_t patch_index,
                               const std::string &commit) {
  const fs::path target = snapshot_path(review_id, patch_index);
  std::error_code ec;
  if (fs::exists(target, ec)) {
    worktree_log()->warn("Removing stale snapshot {}", target.string());
    remove_snapshot(target);
  }

  git({"worktree", "add", "--no-checkout", "--detach", target.string(), commit},
      "Failed to register snapshot " + target.string());
  Snapshot handle(target, [repo = settings_.repo,
                           timeout = settings_.git_timeout](const fs::path &p) {
    remove_snapshot_dir(repo, p, timeout);
  });

  auto gitfile = read_text_file(target / ".git");
  if (!gitfile) {
    throw PreparationError("Snapshot " + target.string() + " has no .git file");
  }
  const fs::path snapshot_gitdir = parse_gitfile(*gitfile, target);
  const fs::path tree_gitdir =
      trim(git({"rev-parse", "--absolute-git-dir"}, "Failed to locate git dir"));

  fs::remove_all(target, ec);
  if (ec) {
    throw PreparationError("Failed to clear " + target.string() + ": " +
                           ec.message());
  }
  ProcessSpec copy;
  copy.argv = {"cp", "-a", "--reflink=always", path_.string(), target.string()};
  copy.timeout = settings_.git_timeout;
  auto copied = run_process(copy);
  if (!copied.ok()) {
    throw PreparationError("Reflink copy to " + target.string() +
                           " failed: " + describe_failure(copied));
  }
  write_tree_file(target / ".git", *gitfile);
  fs::copy_file(tree_gitdir / "index", snapshot_gitdir / "index",
                fs::copy_options::overwrite_existing, ec);
  if (ec) {
    worktree_log()->debug("No index copied into {}: {}", target.string(),
                          ec.message());
  }

  auto reset = run_git(target, {"reset", "--hard", "--quiet", commit},
                       settings_.git_timeout);
  if (!reset.ok()) {
    throw PreparationError("Failed to reset snapshot to " + commit + ": " +
                           describe_failure(reset));
  }
  worktree_log()->debug("Snapshot {} at {}", target.string(), commit);
  return handle;
}

WorkTreePool::Lease::Lease(WorkTreePool *pool, std::size_t slot,
                           WorkTree *tree, std::string owner)
    : pool_(pool), slot_(slot), tree_(tree), owner_(std::move(owner)) {}

WorkTreePool::Lease::Lease(Lease &&other) noexcept
    : pool_(other.pool_), slot_(other.slot_), tree_(other.tree_),
      owner_(std::move(other.owner_)) {
  other.pool_ = nullptr;
}

WorkTreePool::Lease::~Lease() { release(); }

void WorkTreePool::Lease::release() {
  if (pool_) {
    pool_->release(slot_);
    pool_ = nullptr;
  }
}

WorkTreePool::WorkTreePool(std::vector<std::unique_ptr<WorkTree>> trees)
    : trees_(std::move(trees)), owners_(trees_.size()) {}

WorkTreePool::Lease WorkTreePool::acquire(std::size_t slot,
                                          const std::string &owner) {
  if (slot >= trees_.size()) {
    throw std::out_of_range("No work tree in slot " + std::to_string(slot));
  }
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [&] { return !owners_[slot].has_value(); });
  owners_[slot] = owner;
  worktree_log()->debug("Tree {} bound to {}", trees_[slot]->id(), owner);
  return Lease(this, slot, trees_[slot].get(), owner);
}

void WorkTreePool::release(std::size_t slot) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    worktree_log()->debug("Tree {} released by {}", trees_[slot]->id(),
                          owners_[slot].value_or("?"));
    owners_[slot].reset();
  }
  cv_.notify_all();
}

std::optional<std::string> WorkTreePool::owner_of(std::size_t slot) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (slot >= owners_.size()) {
    return std::nullopt;
  }
  return owners_[slot];
}

std::size_t WorkTreePool::idle_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t idle = 0;
  for (const auto &owner : owners_) {
    if (!owner) {
      ++idle;
    }
  }
  return idle;
}

std::vector<std::unique_ptr<WorkTree>>
create_git_work_trees(const GitSettings &settings, std::size_t count,
                      std::shared_ptr<SeriesSource> series) {
  auto check = run_git(settings.repo, {"rev-parse", "--git-dir"},
                       settings.git_timeout);
  if (!check.ok()) {
    throw ConfigError("Not a git repository: " + settings.repo.string() +
                      " (" + describe_failure(check) + ")");
  }
  auto remotes = std::make_shared<RemoteRegistry>(settings);
  std::vector<std::unique_ptr<WorkTree>> trees;
  trees.reserve(count);
  for (std::size_t i = 1; i <= count; ++i) {
    trees.push_back(
        std::make_unique<GitWorkTree>(i, settings, remotes, series));
  }
  return trees;
}

void probe_reflink_support(const std::filesystem::path &dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  const fs::path probe = dir / (".prv-reflink-probe-" + generate_uuid());
  const fs::path clone = probe.string() + ".clone";
  write_text_file(probe, "reflink probe\n");
  ProcessSpec spec;
  spec.argv = {"cp", "--reflink=always", probe.string(), clone.string()};
  spec.timeout = std::chrono::seconds(30);
  auto result = run_process(spec);
  fs::remove(probe, ec);
  fs::remove(clone, ec);
  if (!result.ok()) {
    throw ConfigError("Filesystem at " + dir.string() +
                      " does not support reflink copies: " +
                      describe_failure(result));
  }
  worktree_log()->info("Reflink copies supported under {}", dir.string());
}

} // namespace prv
