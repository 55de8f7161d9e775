#include "reviewer_worker.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "result_store.hpp"
#include "review_artifacts.hpp"
#include "reviewer.hpp"

#include <algorithm>

namespace prv {

namespace {

std::shared_ptr<spdlog::logger> reviewer_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("reviewer");
  }();
  return logger;
}

} // namespace

ReviewerWorkerPool::ReviewerWorkerPool(HandoffQueue &handoff,
                                       Reviewer &reviewer, ResultStore &store,
                                       const ReviewArtifacts &artifacts,
                                       ReviewerPoolSettings settings,
                                       FatalHandler on_fatal)
    : handoff_(handoff), reviewer_(reviewer), store_(store),
      artifacts_(artifacts), settings_(settings),
      on_fatal_(std::move(on_fatal)) {
  settings_.workers = std::max<std::size_t>(1, settings_.workers);
  settings_.attempts = std::max(1, settings_.attempts);
}

ReviewerWorkerPool::~ReviewerWorkerPool() { join(); }

void ReviewerWorkerPool::start() {
  if (!threads_.empty()) {
    return;
  }
  threads_.reserve(settings_.workers);
  for (std::size_t i = 0; i < settings_.workers; ++i) {
    threads_.emplace_back(&ReviewerWorkerPool::worker, this, i + 1);
  }
  reviewer_log()->info("Started {} reviewer workers", threads_.size());
}

void ReviewerWorkerPool::join() {
  for (auto &t : threads_) {
    if (t.joinable()) {
      t.join();
    }
  }
  threads_.clear();
}

void ReviewerWorkerPool::worker(std::size_t id) {
  reviewer_log()->debug("Reviewer worker {} started", id);
  while (auto item = handoff_.pop()) {
    ++busy_;
    const std::string review_id = item->review_id;
    try {
      process(std::move(*item));
    } catch (const StorageError &e) {
      --busy_;
      reviewer_log()->critical("Storage failure while reviewing {}: {}",
                               review_id, e.what());
      on_fatal_(e.what());
      break;
    }
    --busy_;
  }
  reviewer_log()->debug("Reviewer worker {} stopped", id);
}

void ReviewerWorkerPool::process(PatchHandoff item) {
  // Removed on every exit path unless released below.
  Snapshot snapshot = std::move(item.snapshot);
  store_.mark_review_started(item.review_id);

  ReviewJob job;
  job.review_id = item.review_id;
  job.patch_index = item.patch_index;
  job.commit = item.commit;
  job.workdir = snapshot.path();
  job.patch_dir =
      artifacts_.ensure_patch_dir(item.owner, item.review_id, item.patch_index);

  std::string last_error;
  bool reviewed = false;
  int attempt = 1;
  for (; attempt <= settings_.attempts; ++attempt) {
    job.attempt = attempt;
    try {
      reviewer_.review(job);
      reviewed = true;
      break;
    } catch (const ReviewTimeoutError &e) {
      last_error = e.what();
    } catch (const ReviewExecutionError &e) {
      last_error = e.what();
    } catch (const StorageError &) {
      throw;
    } catch (const std::exception &e) {
      last_error = e.what();
      reviewer_log()->error("Reviewer raised for {} patch {}: {}",
                            item.review_id, item.patch_index, last_error);
      break;
    }
    reviewer_log()->warn("Attempt {}/{} for {} patch {} failed: {}", attempt,
                         settings_.attempts, item.review_id, item.patch_index,
                         last_error);
  }

  const int spent = std::min(attempt, settings_.attempts);
  ReviewStatus status;
  if (reviewed) {
    status = store_.record_patch_result(item.review_id, item.patch_index,
                                        PatchState::Done, "", spent);
  } else {
    reviewer_log()->error("Review of {} patch {} failed after {} attempts",
                          item.review_id, item.patch_index, spent);
    status = store_.record_patch_result(item.review_id, item.patch_index,
                                        PatchState::Error, last_error, spent);
  }
  if (is_terminal(status)) {
    reviewer_log()->info("Review {} finished with status {}", item.review_id,
                         to_string(status));
  }

  if (settings_.keep_snapshots) {
    reviewer_log()->info("Keeping snapshot {}", snapshot.release().string());
  } else {
    snapshot.discard();
  }
}

} // namespace prv
