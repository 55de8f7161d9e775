/**
 * @file work_tree.hpp
 * @brief Git work trees, their pool and copy-on-write snapshots.
 *
 * Each setup worker owns one work tree for the lifetime of the process. The
 * tree is mutated in place while a request is prepared and then cut into one
 * snapshot per reviewed patch. Snapshots are reflink copies reset to a single
 * commit; they outlive the tree lease and are removed exactly once by their
 * owning Snapshot handle.
 */
#ifndef PATCHREVIEW_WORK_TREE_HPP
#define PATCHREVIEW_WORK_TREE_HPP

#include "review_request.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace prv {

class SeriesSource;

/** One patch of a prepared series. */
struct PreparedPatch {
  std::size_t index{0}; ///< 1-based
  std::string commit;   ///< full commit id in the work tree
  std::string content;  ///< patch text stored as the review input
};

/** Result of realizing a request's origin onto a work tree. */
struct PreparedSeries {
  std::vector<PreparedPatch> patches;
  std::string range; ///< git range covering every patch, e.g. "a^..b"
};

/**
 * Move-only owner of a snapshot directory.
 *
 * The directory is removed when the handle is destroyed or discard() is
 * called, whichever happens first, and never twice.
 */
class Snapshot {
public:
  using Remover = std::function<void(const std::filesystem::path &)>;

  Snapshot() = default;

  /**
   * @param path Snapshot directory.
   * @param remover Callback deleting @p path; must not throw.
   */
  Snapshot(std::filesystem::path path, Remover remover);

  ~Snapshot();

  Snapshot(Snapshot &&other) noexcept;
  Snapshot &operator=(Snapshot &&other) noexcept;
  Snapshot(const Snapshot &) = delete;
  Snapshot &operator=(const Snapshot &) = delete;

  const std::filesystem::path &path() const { return path_; }

  /// Whether the handle still owns a directory.
  explicit operator bool() const { return static_cast<bool>(remover_); }

  /// Delete the directory now. Further calls do nothing.
  void discard() noexcept;

  /**
   * Give up ownership without deleting the directory.
   *
   * @return The path that is no longer managed.
   */
  std::filesystem::path release() noexcept;

private:
  std::filesystem::path path_;
  Remover remover_;
};

/**
 * A working directory that can realize review requests and cut snapshots.
 *
 * Implementations are only ever driven by the worker holding the tree's
 * lease, so they need no internal locking for their own state.
 */
class WorkTree {
public:
  virtual ~WorkTree() = default;

  /// 1-based position in the pool.
  virtual std::size_t id() const = 0;

  virtual const std::filesystem::path &path() const = 0;

  /**
   * Realize @p request on the tree.
   *
   * @return The ordered patches to review.
   * @throws PreparationError on any git or download failure.
   */
  virtual PreparedSeries prepare(const ReviewRequest &request) = 0;

  /**
   * Run the optional indexing step over the prepared range.
   *
   * @throws PreparationError when the indexer fails.
   */
  virtual void index(const PreparedSeries &series) = 0;

  /**
   * Cut a copy-on-write snapshot of the tree fixed at @p commit.
   *
   * @throws PreparationError when the snapshot cannot be created; the caller
   *         treats this as a failure of that patch only.
   */
  virtual Snapshot snapshot(const std::string &review_id,
                            std::size_t patch_index,
                            const std::string &commit) = 0;
};

/** Settings shared by all git work trees. */
struct GitSettings {
  std::filesystem::path repo; ///< main repository the trees are attached to
  std::string remote_url_template{
      "git://git.kernel.org/pub/scm/linux/kernel/git/{tree}.git"};
  std::vector<std::string> indexer_command; ///< may contain "{range}"
  std::chrono::milliseconds index_timeout{std::chrono::seconds(300)};
  bool skip_index{false};
  std::chrono::milliseconds git_timeout{std::chrono::minutes(30)};
};

/**
 * Remotes of the main repository. Adding a remote and fetching it are
 * serialized because every tree shares the same object store and config.
 */
class RemoteRegistry {
public:
  explicit RemoteRegistry(GitSettings settings);

  /**
   * Make sure remote @p name exists, adding it from the URL template.
   *
   * @throws PreparationError when git refuses.
   */
  void ensure(const std::string &name);

  /**
   * Fetch @p name from within @p tree_path.
   *
   * @throws PreparationError when the fetch fails.
   */
  void fetch(const std::filesystem::path &tree_path, const std::string &name);

  /// URL a remote named @p name is created with.
  std::string url_for(const std::string &name) const;

private:
  std::mutex &remote_mutex(const std::string &name);

  GitSettings settings_;
  std::mutex mutex_;
  std::map<std::string, std::unique_ptr<std::mutex>> fetch_mutexes_;
};

/**
 * WorkTree driven by the git command line.
 */
class GitWorkTree : public WorkTree {
public:
  /**
   * Attach to (or create) tree @p id at `<repo>/wt-<id>`.
   *
   * @throws ConfigError when the worktree cannot be created.
   */
  GitWorkTree(std::size_t id, const GitSettings &settings,
              std::shared_ptr<RemoteRegistry> remotes,
              std::shared_ptr<SeriesSource> series);

  std::size_t id() const override { return id_; }
  const std::filesystem::path &path() const override { return path_; }

  PreparedSeries prepare(const ReviewRequest &request) override;
  void index(const PreparedSeries &series) override;
  Snapshot snapshot(const std::string &review_id, std::size_t patch_index,
                    const std::string &commit) override;

  /// Directory used for the snapshot of patch @p patch_index of a request.
  std::filesystem::path snapshot_path(const std::string &review_id,
                                      std::size_t patch_index) const;

private:
  std::string git(const std::vector<std::string> &args,
                  const std::string &what) const;
  std::string default_branch(const std::string &remote) const;
  std::string verify_commit(const std::string &rev) const;
  std::vector<std::string> list_commits(const std::string &range) const;
  std::string format_patch(const std::string &commit) const;
  void reset_to(const std::string &ref) const;
  std::vector<std::string> apply_mbox(const std::string &body,
                                      const std::string &label) const;
  void remove_snapshot(const std::filesystem::path &path) const;

  std::size_t id_;
  GitSettings settings_;
  std::filesystem::path path_;
  std::shared_ptr<RemoteRegistry> remotes_;
  std::shared_ptr<SeriesSource> series_;
};

/**
 * Fixed set of work trees with exclusive, owner-tagged leases.
 */
class WorkTreePool {
public:
  /// Exclusive access to one tree; releases it on destruction.
  class Lease {
  public:
    Lease(Lease &&other) noexcept;
    Lease &operator=(Lease &&) = delete;
    Lease(const Lease &) = delete;
    Lease &operator=(const Lease &) = delete;
    ~Lease();

    WorkTree &tree() const { return *tree_; }
    WorkTree *operator->() const { return tree_; }
    const std::string &owner() const { return owner_; }

    /// Return the tree to the pool early.
    void release();

  private:
    friend class WorkTreePool;
    Lease(WorkTreePool *pool, std::size_t slot, WorkTree *tree,
          std::string owner);

    WorkTreePool *pool_;
    std::size_t slot_;
    WorkTree *tree_;
    std::string owner_;
  };

  explicit WorkTreePool(std::vector<std::unique_ptr<WorkTree>> trees);

  WorkTreePool(const WorkTreePool &) = delete;
  WorkTreePool &operator=(const WorkTreePool &) = delete;

  /**
   * Bind tree @p slot (0-based) to @p owner, waiting while another owner
   * holds it.
   *
   * @throws std::out_of_range for an invalid slot.
   */
  Lease acquire(std::size_t slot, const std::string &owner);

  std::size_t size() const { return trees_.size(); }

  /// Current owner of @p slot, empty when idle.
  std::optional<std::string> owner_of(std::size_t slot) const;

  std::size_t idle_count() const;

private:
  void release(std::size_t slot);

  std::vector<std::unique_ptr<WorkTree>> trees_;
  std::vector<std::optional<std::string>> owners_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
};

/**
 * Create @p count git work trees for the repository in @p settings.
 *
 * @throws ConfigError when the repository or a tree is unusable.
 */
std::vector<std::unique_ptr<WorkTree>>
create_git_work_trees(const GitSettings &settings, std::size_t count,
                      std::shared_ptr<SeriesSource> series);

/**
 * Verify that @p dir lives on a filesystem supporting reflink copies.
 *
 * @throws ConfigError when `cp --reflink=always` fails there.
 */
void probe_reflink_support(const std::filesystem::path &dir);

} // namespace prv

#endif // PATCHREVIEW_WORK_TREE_HPP
