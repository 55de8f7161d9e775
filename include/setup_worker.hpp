/**
 * @file setup_worker.hpp
 * @brief First pipeline stage: git preparation and snapshot fan-out.
 *
 * Setup worker i is bound to work tree i for the lifetime of the pool. It
 * claims a request, realizes it on its tree, persists the patch list and cuts
 * one snapshot per reviewed patch into the handoff queue. Pushing blocks while
 * the reviewers are behind, which is what keeps the fast stage from outrunning
 * the slow one.
 */
#ifndef PATCHREVIEW_SETUP_WORKER_HPP
#define PATCHREVIEW_SETUP_WORKER_HPP

#include "handoff_queue.hpp"
#include "review_request.hpp"
#include "work_tree.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace prv {

class ResultStore;
class ReviewArtifacts;
class ReviewQueue;

/** One prepared patch travelling from the setup stage to a reviewer. */
struct PatchHandoff {
  std::string review_id;
  std::string owner;
  std::size_t patch_index{0};
  std::string commit;
  Snapshot snapshot;
};

using HandoffQueue = BoundedHandoffQueue<PatchHandoff>;

/// Called from a worker thread when a process-fatal error occurred.
using FatalHandler = std::function<void(const std::string &)>;

/**
 * Pool of setup threads, one per work tree.
 */
class SetupWorkerPool {
public:
  /**
   * @param queue Source of requests.
   * @param trees Work trees; the pool starts one thread per tree.
   * @param store Status records.
   * @param artifacts Result directory layout.
   * @param handoff Destination of prepared snapshots.
   * @param on_fatal Invoked on storage or configuration failures.
   */
  SetupWorkerPool(ReviewQueue &queue, WorkTreePool &trees, ResultStore &store,
                  const ReviewArtifacts &artifacts, HandoffQueue &handoff,
                  FatalHandler on_fatal);

  /// Joins the threads; the queues must have been closed before.
  ~SetupWorkerPool();

  SetupWorkerPool(const SetupWorkerPool &) = delete;
  SetupWorkerPool &operator=(const SetupWorkerPool &) = delete;

  void start();

  /**
   * Wait for every thread to exit. Threads leave once the review queue is
   * closed and their current request is finished or the handoff queue was
   * closed under them.
   */
  void join();

  std::size_t size() const { return trees_.size(); }

  /// Threads currently working on a request.
  std::size_t busy() const { return busy_.load(); }

  /**
   * Run the setup stage for one request on tree @p slot.
   *
   * Preparation failures are recorded on the request; storage and
   * configuration failures propagate.
   *
   * @return False when the handoff queue was closed before every snapshot
   *         could be delivered.
   */
  bool process(std::size_t slot, const ReviewRequest &request);

private:
  void worker(std::size_t slot);
  void fail_request(const ReviewRequest &request, const std::string &message);
  void snapshot_failed(const ReviewRequest &request, std::size_t index,
                       const std::string &message);

  ReviewQueue &queue_;
  WorkTreePool &trees_;
  ResultStore &store_;
  const ReviewArtifacts &artifacts_;
  HandoffQueue &handoff_;
  FatalHandler on_fatal_;
  std::vector<std::thread> threads_;
  std::atomic<std::size_t> busy_{0};
};

} // namespace prv

#endif // PATCHREVIEW_SETUP_WORKER_HPP
