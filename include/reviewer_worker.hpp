/**
 * @file reviewer_worker.hpp
 * @brief Second pipeline stage: reviewer invocations on prepared snapshots.
 */
#ifndef PATCHREVIEW_REVIEWER_WORKER_HPP
#define PATCHREVIEW_REVIEWER_WORKER_HPP

#include "setup_worker.hpp"

#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

namespace prv {

class Reviewer;

/** Behaviour of the reviewer stage. */
struct ReviewerPoolSettings {
  std::size_t workers{1};
  int attempts{3};             ///< total invocations per patch, at least 1
  bool keep_snapshots{false};  ///< leave snapshots on disk for debugging
};

/**
 * Pool of reviewer threads draining the handoff queue.
 *
 * Every popped snapshot is discarded when its patch is finished, whatever
 * the outcome.
 */
class ReviewerWorkerPool {
public:
  ReviewerWorkerPool(HandoffQueue &handoff, Reviewer &reviewer,
                     ResultStore &store, const ReviewArtifacts &artifacts,
                     ReviewerPoolSettings settings, FatalHandler on_fatal);

  /// Joins the threads; the handoff queue must have been closed before.
  ~ReviewerWorkerPool();

  ReviewerWorkerPool(const ReviewerWorkerPool &) = delete;
  ReviewerWorkerPool &operator=(const ReviewerWorkerPool &) = delete;

  void start();

  /// Wait until the handoff queue is closed and drained.
  void join();

  std::size_t size() const { return settings_.workers; }

  /// Threads currently reviewing a patch.
  std::size_t busy() const { return busy_.load(); }

  /**
   * Review one patch with retries and record its result.
   *
   * @throws StorageError when the result cannot be recorded.
   */
  void process(PatchHandoff item);

private:
  void worker(std::size_t id);

  HandoffQueue &handoff_;
  Reviewer &reviewer_;
  ResultStore &store_;
  const ReviewArtifacts &artifacts_;
  ReviewerPoolSettings settings_;
  FatalHandler on_fatal_;
  std::vector<std::thread> threads_;
  std::atomic<std::size_t> busy_{0};
};

} // namespace prv

#endif // PATCHREVIEW_REVIEWER_WORKER_HPP
