/**
 * @file result_store.cpp
 * @brief SQLite implementation of the review result store.
 */
#include "result_store.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "util/ids.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <thread>

namespace prv {

namespace {

std::shared_ptr<spdlog::logger> store_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("store");
  }();
  return logger;
}

constexpr int kBusyRetries = 50;
constexpr std::chrono::milliseconds kBusyBackoff{20};

bool is_busy(int rc) {
  return rc == SQLITE_BUSY || rc == SQLITE_LOCKED;
}

std::string sqlite_error(sqlite3 *db, const std::string &what) {
  return what + ": " + (db ? sqlite3_errmsg(db) : "no database");
}

/**
 * Prepared statement that is finalized on every exit path.
 */
class Statement {
public:
  Statement(sqlite3 *db, const char *sql) : db_(db) {
    int rc = SQLITE_OK;
    for (int attempt = 0; attempt < kBusyRetries; ++attempt) {
      rc = sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr);
      if (!is_busy(rc)) {
        break;
      }
      std::this_thread::sleep_for(kBusyBackoff);
    }
    if (rc != SQLITE_OK) {
      throw StorageError(sqlite_error(db_, std::string("prepare '") + sql + "'"));
    }
  }

  ~Statement() {
    if (stmt_) {
      sqlite3_finalize(stmt_);
    }
  }

  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  sqlite3_stmt *get() const { return stmt_; }

  Statement &bind(int pos, const std::string &value) {
    check(sqlite3_bind_text(stmt_, pos, value.c_str(), -1, SQLITE_TRANSIENT),
          "bind text");
    return *this;
  }

  Statement &bind(int pos, long long value) {
    check(sqlite3_bind_int64(stmt_, pos, value), "bind int");
    return *this;
  }

  /// Bind an empty string as NULL.
  Statement &bind_nullable(int pos, const std::string &value) {
    if (value.empty()) {
      check(sqlite3_bind_null(stmt_, pos), "bind null");
      return *this;
    }
    return bind(pos, value);
  }

  /**
   * Advance the statement.
   *
   * @return true while a row is available.
   * @throws StorageError on failure other than a transient busy database.
   */
  bool step() {
    for (int attempt = 0; attempt < kBusyRetries; ++attempt) {
      int rc = sqlite3_step(stmt_);
      if (rc == SQLITE_ROW) {
        return true;
      }
      if (rc == SQLITE_DONE) {
        return false;
      }
      if (!is_busy(rc)) {
        throw StorageError(sqlite_error(db_, "step"));
      }
      sqlite3_reset(stmt_);
      std::this_thread::sleep_for(kBusyBackoff);
    }
    throw StorageError(sqlite_error(db_, "database stayed busy"));
  }

  std::string text(int col) const {
    const unsigned char *v = sqlite3_column_text(stmt_, col);
    return v ? reinterpret_cast<const char *>(v) : "";
  }

  long long integer(int col) const { return sqlite3_column_int64(stmt_, col); }

private:
  void check(int rc, const char *what) {
    if (rc != SQLITE_OK) {
      throw StorageError(sqlite_error(db_, what));
    }
  }

  sqlite3 *db_;
  sqlite3_stmt *stmt_ = nullptr;
};

/// BEGIN IMMEDIATE ... COMMIT with rollback when the scope unwinds early.
class Transaction {
public:
  explicit Transaction(sqlite3 *db) : db_(db) { run("BEGIN IMMEDIATE"); }

  ~Transaction() {
    if (!committed_) {
      sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
    }
  }

  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  void commit() {
    run("COMMIT");
    committed_ = true;
  }

private:
  void run(const char *sql) {
    for (int attempt = 0; attempt < kBusyRetries; ++attempt) {
      char *err = nullptr;
      int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
      std::string msg = err ? err : "";
      sqlite3_free(err);
      if (rc == SQLITE_OK) {
        return;
      }
      if (!is_busy(rc)) {
        throw StorageError(std::string(sql) + " failed: " + msg);
      }
      std::this_thread::sleep_for(kBusyBackoff);
    }
    throw StorageError(std::string(sql) + " failed: database stayed busy");
  }

  sqlite3 *db_;
  bool committed_{false};
};

const char *kSchema =
    "CREATE TABLE IF NOT EXISTS reviews("
    "id TEXT PRIMARY KEY,"
    "owner TEXT NOT NULL,"
    "tree TEXT NOT NULL,"
    "branch TEXT,"
    "origin_kind TEXT NOT NULL,"
    "origin TEXT NOT NULL,"
    "status TEXT NOT NULL,"
    "message TEXT,"
    "submitted_at TEXT NOT NULL,"
    "setup_started_at TEXT,"
    "review_started_at TEXT,"
    "completed_at TEXT);"
    "CREATE INDEX IF NOT EXISTS reviews_owner ON reviews(owner, submitted_at);"
    "CREATE TABLE IF NOT EXISTS patches("
    "review_id TEXT NOT NULL REFERENCES reviews(id) ON DELETE CASCADE,"
    "idx INTEGER NOT NULL,"
    "commit_id TEXT,"
    "state TEXT NOT NULL,"
    "error TEXT,"
    "snapshot TEXT,"
    "attempts INTEGER NOT NULL DEFAULT 0,"
    "completed_at TEXT,"
    "PRIMARY KEY(review_id, idx));";

const char *kSelectReview =
    "SELECT id,owner,tree,branch,origin_kind,origin,status,message,"
    "submitted_at,setup_started_at,review_started_at,completed_at "
    "FROM reviews";

ReviewRecord read_review_row(const Statement &stmt) {
  ReviewRecord r;
  r.id = stmt.text(0);
  r.owner = stmt.text(1);
  r.tree = stmt.text(2);
  r.branch = stmt.text(3);
  r.origin_kind = stmt.text(4);
  r.origin = stmt.text(5);
  r.status = parse_review_status(stmt.text(6));
  r.message = stmt.text(7);
  r.submitted_at = stmt.text(8);
  r.setup_started_at = stmt.text(9);
  r.review_started_at = stmt.text(10);
  r.completed_at = stmt.text(11);
  return r;
}

void load_patches(sqlite3 *db, ReviewRecord &record) {
  Statement stmt(db, "SELECT idx,commit_id,state,error,snapshot,attempts,"
                     "completed_at FROM patches WHERE review_id=? "
                     "ORDER BY idx");
  stmt.bind(1, record.id);
  while (stmt.step()) {
    PatchRecord p;
    p.index = static_cast<std::size_t>(stmt.integer(0));
    p.commit = stmt.text(1);
    p.state = parse_patch_state(stmt.text(2));
    p.error = stmt.text(3);
    p.snapshot = stmt.text(4);
    p.attempts = static_cast<int>(stmt.integer(5));
    p.completed_at = stmt.text(6);
    record.patches.push_back(std::move(p));
  }
}

std::optional<ReviewStatus> current_status(sqlite3 *db, const std::string &id) {
  Statement stmt(db, "SELECT status FROM reviews WHERE id=?");
  stmt.bind(1, id);
  if (!stmt.step()) {
    return std::nullopt;
  }
  return parse_review_status(stmt.text(0));
}

ReviewStatus require_status(sqlite3 *db, const std::string &id) {
  auto status = current_status(db, id);
  if (!status) {
    throw StorageError("Unknown review " + id);
  }
  return *status;
}

} // namespace

std::size_t ReviewRecord::count(PatchState state) const {
  std::size_t n = 0;
  for (const auto &p : patches) {
    if (p.state == state) {
      ++n;
    }
  }
  return n;
}

nlohmann::json ReviewRecord::to_json() const {
  nlohmann::json j{{"review_id", id},
                   {"owner", owner},
                   {"tree", tree},
                   {"origin", origin_kind},
                   {"status", to_string(status)},
                   {"date", submitted_at},
                   {"patch_count", patches.size()},
                   {"completed_patches",
                    count(PatchState::Done) + count(PatchState::Error)}};
  j[origin_kind == "series" ? "series" : "source"] = origin;
  if (!branch.empty())
    j["branch"] = branch;
  if (!message.empty())
    j["message"] = message;
  if (!setup_started_at.empty())
    j["start"] = setup_started_at;
  if (!review_started_at.empty())
    j["start_review"] = review_started_at;
  if (!completed_at.empty())
    j["end"] = completed_at;
  nlohmann::json list = nlohmann::json::array();
  for (const auto &p : patches) {
    nlohmann::json pj{{"index", p.index}, {"state", to_string(p.state)}};
    if (!p.commit.empty())
      pj["commit"] = p.commit;
    if (!p.error.empty())
      pj["error"] = p.error;
    if (p.attempts > 0)
      pj["attempts"] = p.attempts;
    list.push_back(std::move(pj));
  }
  j["patches"] = std::move(list);
  return j;
}

nlohmann::json StatusSummary::to_json() const {
  return nlohmann::json{
      {"total", total_reviews}, {"reviews", reviews}, {"patches", patches}};
}

ResultStore::ResultStore(const std::string &db_path) {
  store_log()->debug("Opening result store {}", db_path);
  int rc = sqlite3_open_v2(db_path.c_str(), &db_,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                               SQLITE_OPEN_FULLMUTEX,
                           nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = sqlite_error(db_, "Failed to open " + db_path);
    sqlite3_close(db_);
    db_ = nullptr;
    throw StorageError(msg);
  }
  sqlite3_busy_timeout(db_, 5000);
  try {
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=FULL;");
    exec("PRAGMA foreign_keys=ON;");
    exec(kSchema);
  } catch (const StorageError &) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
  store_log()->info("Result store ready at {}", db_path);
}

ResultStore::~ResultStore() {
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

void ResultStore::exec(const char *sql) const {
  char *err = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    throw StorageError("SQL failed: " + msg);
  }
}

void ResultStore::create_review(const ReviewRequest &request) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction tx(db_);
  Statement stmt(db_, "INSERT INTO reviews(id,owner,tree,branch,origin_kind,"
                      "origin,status,submitted_at) VALUES(?,?,?,?,?,?,?,?)");
  stmt.bind(1, request.id)
      .bind(2, request.owner)
      .bind(3, request.tree)
      .bind_nullable(4, request.branch)
      .bind(5, origin_kind(request.origin))
      .bind(6, describe_origin(request.origin))
      .bind(7, to_string(ReviewStatus::Queued))
      .bind(8, request.submitted_at.empty() ? now_timestamp()
                                            : request.submitted_at);
  stmt.step();
  tx.commit();
  store_log()->debug("Created review {}", request.id);
}

void ResultStore::mark_setup_started(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction tx(db_);
  Statement stmt(db_, "UPDATE reviews SET status=?, setup_started_at=? "
                      "WHERE id=? AND status=?");
  stmt.bind(1, to_string(ReviewStatus::SetupInProgress))
      .bind(2, now_timestamp())
      .bind(3, id)
      .bind(4, to_string(ReviewStatus::Queued));
  stmt.step();
  if (sqlite3_changes(db_) == 0) {
    store_log()->warn("Review {} was not queued when setup started ({})", id,
                      to_string(require_status(db_, id)));
  }
  tx.commit();
}

void ResultStore::set_patches(const std::string &id,
                              const std::vector<PatchInit> &patches) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction tx(db_);
  require_status(db_, id);
  {
    Statement del(db_, "DELETE FROM patches WHERE review_id=?");
    del.bind(1, id);
    del.step();
  }
  const std::string now = now_timestamp();
  for (const auto &p : patches) {
    Statement ins(db_, "INSERT INTO patches(review_id,idx,commit_id,state,"
                       "completed_at) VALUES(?,?,?,?,?)");
    ins.bind(1, id)
        .bind(2, static_cast<long long>(p.index))
        .bind_nullable(3, p.commit)
        .bind(4, to_string(p.skipped ? PatchState::Skipped
                                     : PatchState::Pending))
        .bind_nullable(5, p.skipped ? now : std::string());
    ins.step();
  }
  tx.commit();
  store_log()->debug("Review {}: stored {} patch row(s)", id, patches.size());
}

void ResultStore::record_snapshot(const std::string &id, std::size_t index,
                                  const std::string &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction tx(db_);
  Statement stmt(db_,
                 "UPDATE patches SET snapshot=? WHERE review_id=? AND idx=?");
  stmt.bind(1, path).bind(2, id).bind(3, static_cast<long long>(index));
  stmt.step();
  tx.commit();
}

ReviewStatus ResultStore::finalize_if_complete_locked(const std::string &id) {
  ReviewStatus status = require_status(db_, id);
  if (is_terminal(status) || status == ReviewStatus::Queued) {
    return status;
  }
  long long pending = 0;
  long long failed = 0;
  long long reviewed = 0;
  {
    Statement stmt(db_, "SELECT state, COUNT(*) FROM patches WHERE "
                        "review_id=? GROUP BY state");
    stmt.bind(1, id);
    while (stmt.step()) {
      const auto state = parse_patch_state(stmt.text(0));
      const auto n = stmt.integer(1);
      if (state == PatchState::Pending) {
        pending = n;
      } else if (state == PatchState::Error) {
        failed = n;
        reviewed += n;
      } else if (state == PatchState::Done) {
        reviewed += n;
      }
    }
  }
  if (pending > 0) {
    return status;
  }
  std::string message;
  if (failed > 0) {
    message = std::to_string(failed) + " of " + std::to_string(reviewed) +
              " patches failed review";
  }
  Statement stmt(db_, "UPDATE reviews SET status=?, completed_at=?, "
                      "message=COALESCE(?, message) WHERE id=?");
  stmt.bind(1, to_string(ReviewStatus::Done))
      .bind(2, now_timestamp())
      .bind_nullable(3, message)
      .bind(4, id);
  stmt.step();
  store_log()->info("Review {} done ({} reviewed, {} failed)", id, reviewed,
                    failed);
  return ReviewStatus::Done;
}

ReviewStatus ResultStore::mark_setup_complete(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction tx(db_);
  ReviewStatus status = finalize_if_complete_locked(id);
  if (status == ReviewStatus::SetupInProgress) {
    Statement stmt(db_, "UPDATE reviews SET status=? WHERE id=? AND status=?");
    stmt.bind(1, to_string(ReviewStatus::Reviewing))
        .bind(2, id)
        .bind(3, to_string(ReviewStatus::SetupInProgress));
    stmt.step();
    status = ReviewStatus::Reviewing;
  }
  tx.commit();
  return status;
}

void ResultStore::mark_review_started(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction tx(db_);
  Statement stmt(db_,
                 "UPDATE reviews SET review_started_at=COALESCE("
                 "review_started_at, ?), status=CASE WHEN status=? THEN ? "
                 "ELSE status END WHERE id=?");
  stmt.bind(1, now_timestamp())
      .bind(2, to_string(ReviewStatus::SetupInProgress))
      .bind(3, to_string(ReviewStatus::Reviewing))
      .bind(4, id);
  stmt.step();
  tx.commit();
}

ReviewStatus ResultStore::record_patch_result(const std::string &id,
                                              std::size_t index,
                                              PatchState state,
                                              const std::string &error,
                                              int attempts) {
  if (state != PatchState::Done && state != PatchState::Error) {
    throw std::invalid_argument("Patch result must be done or error");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction tx(db_);
  Statement stmt(db_, "UPDATE patches SET state=?, error=?, attempts=?, "
                      "completed_at=? WHERE review_id=? AND idx=? AND state=?");
  stmt.bind(1, to_string(state))
      .bind_nullable(2, state == PatchState::Error ? error : std::string())
      .bind(3, static_cast<long long>(attempts))
      .bind(4, now_timestamp())
      .bind(5, id)
      .bind(6, static_cast<long long>(index))
      .bind(7, to_string(PatchState::Pending));
  stmt.step();
  if (sqlite3_changes(db_) == 0) {
    store_log()->warn("Review {} patch {} was not pending; result ignored", id,
                      index);
  }
  ReviewStatus status = finalize_if_complete_locked(id);
  tx.commit();
  return status;
}

void ResultStore::fail_review(const std::string &id,
                              const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction tx(db_);
  if (is_terminal(require_status(db_, id))) {
    store_log()->debug("Review {} already finished; not failing it", id);
    return;
  }
  const std::string now = now_timestamp();
  {
    Statement stmt(db_, "UPDATE patches SET state=?, error=?, completed_at=? "
                        "WHERE review_id=? AND state=?");
    stmt.bind(1, to_string(PatchState::Error))
        .bind(2, message)
        .bind(3, now)
        .bind(4, id)
        .bind(5, to_string(PatchState::Pending));
    stmt.step();
  }
  Statement stmt(db_, "UPDATE reviews SET status=?, message=?, completed_at=? "
                      "WHERE id=?");
  stmt.bind(1, to_string(ReviewStatus::Error))
      .bind(2, message)
      .bind(3, now)
      .bind(4, id);
  stmt.step();
  tx.commit();
  store_log()->warn("Review {} failed: {}", id, message);
}

std::size_t
ResultStore::interrupt_unfinished(const std::vector<std::string> &still_queued,
                                  const std::string &message) {
  std::vector<std::string> victims;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT id, status FROM reviews WHERE status NOT IN "
                        "('done','error')");
    while (stmt.step()) {
      const std::string id = stmt.text(0);
      const auto status = parse_review_status(stmt.text(1));
      const bool queued = std::find(still_queued.begin(), still_queued.end(),
                                    id) != still_queued.end();
      if (status != ReviewStatus::Queued || !queued) {
        victims.push_back(id);
      }
    }
  }
  for (const auto &id : victims) {
    fail_review(id, message);
  }
  if (!victims.empty()) {
    store_log()->info("Marked {} unfinished review(s) as interrupted",
                      victims.size());
  }
  return victims.size();
}

std::optional<ReviewRecord>
ResultStore::get_locked(const std::string &id) const {
  Statement stmt(db_, (std::string(kSelectReview) + " WHERE id=?").c_str());
  stmt.bind(1, id);
  if (!stmt.step()) {
    return std::nullopt;
  }
  ReviewRecord record = read_review_row(stmt);
  load_patches(db_, record);
  return record;
}

std::optional<ReviewRecord> ResultStore::get(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction tx(db_);
  auto record = get_locked(id);
  tx.commit();
  return record;
}

std::vector<ReviewRecord> ResultStore::list(const std::string &owner,
                                            std::size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction tx(db_);
  std::string sql = kSelectReview;
  if (!owner.empty()) {
    sql += " WHERE owner=?";
  }
  sql += " ORDER BY submitted_at DESC, rowid DESC LIMIT ?";
  Statement stmt(db_, sql.c_str());
  int pos = 1;
  if (!owner.empty()) {
    stmt.bind(pos++, owner);
  }
  stmt.bind(pos, static_cast<long long>(limit));
  std::vector<ReviewRecord> out;
  while (stmt.step()) {
    out.push_back(read_review_row(stmt));
  }
  for (auto &record : out) {
    load_patches(db_, record);
  }
  tx.commit();
  return out;
}

StatusSummary ResultStore::summary() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction tx(db_);
  StatusSummary summary;
  for (auto status : {ReviewStatus::Queued, ReviewStatus::SetupInProgress,
                      ReviewStatus::Reviewing, ReviewStatus::Done,
                      ReviewStatus::Error}) {
    summary.reviews[to_string(status)] = 0;
  }
  {
    Statement stmt(db_, "SELECT status, COUNT(*) FROM reviews GROUP BY status");
    while (stmt.step()) {
      const auto n = static_cast<std::size_t>(stmt.integer(1));
      summary.reviews[stmt.text(0)] = n;
      summary.total_reviews += n;
    }
  }
  {
    Statement stmt(db_, "SELECT state, COUNT(*) FROM patches GROUP BY state");
    while (stmt.step()) {
      summary.patches[stmt.text(0)] = static_cast<std::size_t>(stmt.integer(1));
    }
  }
  tx.commit();
  return summary;
}

} // namespace prv
