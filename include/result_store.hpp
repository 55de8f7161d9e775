/**
 * @file result_store.hpp
 * @brief Durable review and patch status records backed by SQLite.
 *
 * The store is the single source of truth read by status queries. Every
 * mutation runs in its own transaction so a reader never observes a partially
 * updated patch list, and the database runs with WAL journaling and
 * synchronous=FULL so an acknowledged write survives a crash.
 */

#ifndef PATCHREVIEW_RESULT_STORE_HPP
#define PATCHREVIEW_RESULT_STORE_HPP

#include "review_request.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace prv {

/** Stored state of one patch. */
struct PatchRecord {
  std::size_t index{0}; ///< 1-based position within the request
  std::string commit;
  PatchState state{PatchState::Pending};
  std::string error;    ///< diagnostic when state is Error
  std::string snapshot; ///< snapshot path once one was cut
  int attempts{0};      ///< reviewer invocations spent
  std::string completed_at;
};

/** Stored state of one review request. */
struct ReviewRecord {
  std::string id;
  std::string owner;
  std::string tree;
  std::string branch;
  std::string origin_kind;
  std::string origin; ///< human readable origin
  ReviewStatus status{ReviewStatus::Queued};
  std::string message;
  std::string submitted_at;
  std::string setup_started_at;
  std::string review_started_at;
  std::string completed_at;
  std::vector<PatchRecord> patches;

  /// Number of patches in @p state.
  std::size_t count(PatchState state) const;

  nlohmann::json to_json() const;
};

/** Process-wide counts. */
struct StatusSummary {
  std::map<std::string, std::size_t> reviews; ///< status name to count
  std::map<std::string, std::size_t> patches; ///< patch state to count
  std::size_t total_reviews{0};

  nlohmann::json to_json() const;
};

/** Initial patch row written once preparation resolved the series. */
struct PatchInit {
  std::size_t index{0};
  std::string commit;
  bool skipped{false};
};

/**
 * SQLite backed store of review records.
 *
 * All writes share one connection guarded by a mutex; transactions are short
 * so unrelated requests are never held up for long. Busy databases are
 * retried, every other SQLite failure raises StorageError.
 */
class ResultStore {
public:
  /**
   * Open or create the database at @p db_path and apply the schema.
   *
   * @param db_path Database file (":memory:" for tests).
   * @throws StorageError when the database cannot be opened or migrated.
   */
  explicit ResultStore(const std::string &db_path);

  ~ResultStore();

  ResultStore(const ResultStore &) = delete;
  ResultStore &operator=(const ResultStore &) = delete;

  /// Insert a new record in state queued.
  void create_review(const ReviewRequest &request);

  /// queued -> setup-in-progress, recording the setup start time.
  void mark_setup_started(const std::string &id);

  /**
   * Replace the patch list of a request. Skipped patches are stored as
   * skipped, everything else as pending.
   */
  void set_patches(const std::string &id, const std::vector<PatchInit> &patches);

  /// Remember the snapshot that was cut for patch @p index.
  void record_snapshot(const std::string &id, std::size_t index,
                       const std::string &path);

  /**
   * Record the end of the setup phase.
   *
   * @return Status after the update: reviewing while patches are pending,
   *         done when nothing is left (or already finished).
   */
  ReviewStatus mark_setup_complete(const std::string &id);

  /// Record the first reviewer start and move the request to reviewing.
  void mark_review_started(const std::string &id);

  /**
   * Store the terminal state of one patch.
   *
   * When this leaves no pending patch the aggregate status and completion
   * time are written in the same transaction.
   *
   * @param id Request id.
   * @param index 1-based patch index.
   * @param state Done or Error.
   * @param error Diagnostic for Error, ignored otherwise.
   * @param attempts Reviewer invocations spent on the patch.
   * @return Request status after the update.
   */
  ReviewStatus record_patch_result(const std::string &id, std::size_t index,
                                   PatchState state, const std::string &error,
                                   int attempts = 0);

  /**
   * Mark the request failed. Every pending patch becomes error with the same
   * message. No-op for requests that already finished.
   */
  void fail_review(const std::string &id, const std::string &message);

  /**
   * Restart reconciliation: every unfinished request whose id is not in
   * @p still_queued is failed with @p message.
   *
   * @return Number of requests failed.
   */
  std::size_t interrupt_unfinished(const std::vector<std::string> &still_queued,
                                   const std::string &message);

  std::optional<ReviewRecord> get(const std::string &id) const;

  /**
   * Most recent requests first.
   *
   * @param owner Filter by owner, empty lists everybody's.
   * @param limit Maximum number of records.
   */
  std::vector<ReviewRecord> list(const std::string &owner,
                                 std::size_t limit) const;

  StatusSummary summary() const;

private:
  void exec(const char *sql) const;
  std::optional<ReviewRecord> get_locked(const std::string &id) const;
  ReviewStatus finalize_if_complete_locked(const std::string &id);

  sqlite3 *db_ = nullptr;
  mutable std::mutex mutex_;
};

} // namespace prv

#endif // PATCHREVIEW_RESULT_STORE_HPP
