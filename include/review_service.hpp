/**
 * @file review_service.hpp
 * @brief Orchestrator wiring the queue, both worker pools and the store.
 *
 * The service is the submission and query boundary of the pipeline. It owns
 * every component; queries read the result store directly and never walk the
 * worker queues.
 */
#ifndef PATCHREVIEW_REVIEW_SERVICE_HPP
#define PATCHREVIEW_REVIEW_SERVICE_HPP

#include "result_store.hpp"
#include "review_artifacts.hpp"
#include "review_queue.hpp"
#include "review_request.hpp"
#include "reviewer.hpp"
#include "reviewer_worker.hpp"
#include "setup_worker.hpp"
#include "work_tree.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace prv {

class SeriesSource;

/** Settings consumed by the service itself. */
struct ServiceSettings {
  std::filesystem::path results_path; ///< queue, database and review files
  std::size_t reviewer_workers{1};
  int reviewer_attempts{3};
  bool keep_snapshots{false};
};

/**
 * The review pipeline.
 *
 * Handoff capacity is twice the number of reviewer workers. Storage or
 * configuration failures inside a worker are fatal: the service records
 * the error, closes both queues and reports it from failed().
 */
class ReviewService {
public:
  /**
   * @param settings Service settings.
   * @param trees Work trees, one setup worker each; must not be empty.
   * @param reviewer Reviewer shared by all reviewer workers.
   * @param series Optional series source used for queue estimates.
   * @throws StorageError when the queue or database cannot be opened.
   * @throws ConfigError for an empty tree list.
   */
  ReviewService(ServiceSettings settings,
                std::vector<std::unique_ptr<WorkTree>> trees,
                std::unique_ptr<Reviewer> reviewer,
                std::shared_ptr<SeriesSource> series = nullptr);

  /// Stops the pools.
  ~ReviewService();

  ReviewService(const ReviewService &) = delete;
  ReviewService &operator=(const ReviewService &) = delete;

  /**
   * Reconcile stored state with the persisted queue and start both pools.
   *
   * @return Number of requests marked as interrupted.
   */
  std::size_t start();

  /**
   * Stop accepting work, drop queued snapshots and join every worker.
   * Requests still in flight are reconciled at the next start.
   */
  void stop();

  /**
   * Validate and enqueue a submission.
   *
   * @return Id of the new request.
   * @throws ValidationError for malformed submissions.
   * @throws StorageError when the request cannot be persisted or the service
   *         has failed.
   */
  std::string submit(const ReviewSubmission &submission,
                     const std::string &owner);

  /**
   * Status document of a request.
   *
   * @param id Request id.
   * @param owner Requesting principal; empty skips the ownership check.
   * @param format When set and the request is finished, review documents of
   *        every patch are included (null for skipped or missing ones).
   * @return Nothing when the id is unknown or owned by someone else.
   */
  std::optional<nlohmann::json>
  get(const std::string &id, const std::string &owner = {},
      std::optional<ReviewFormat> format = std::nullopt) const;

  /// Short listing of recent requests of @p owner (empty lists all).
  nlohmann::json list(const std::string &owner, std::size_t limit) const;

  /// Global counters and pipeline gauges.
  nlohmann::json status() const;

  /**
   * Block until request @p id finished or @p timeout elapsed. Returns early
   * when the service fails or shutdown is requested.
   *
   * @return The last stored record, empty for unknown ids.
   */
  std::optional<ReviewRecord>
  wait_for(const std::string &id,
           std::chrono::milliseconds timeout = std::chrono::milliseconds::max());

  /// Block until stop is requested or a fatal error occurred.
  void wait_for_shutdown();

  /// Wake wait_for_shutdown(); safe to call from any thread.
  void request_shutdown();

  /// Whether a fatal error stopped the pipeline.
  bool failed() const;

  /// Message of the fatal error, empty when none occurred.
  std::string fatal_error() const;

  ResultStore &store() { return *store_; }
  const ReviewQueue &queue() const { return *queue_; }
  const HandoffQueue &handoff() const { return handoff_; }
  const ReviewArtifacts &artifacts() const { return artifacts_; }

private:
  void on_fatal(const std::string &message);

  ServiceSettings settings_;
  ReviewArtifacts artifacts_;
  std::unique_ptr<ResultStore> store_;
  std::unique_ptr<ReviewQueue> queue_;
  std::shared_ptr<SeriesSource> series_;
  std::unique_ptr<Reviewer> reviewer_;
  WorkTreePool pool_;
  HandoffQueue handoff_;
  std::unique_ptr<SetupWorkerPool> setup_;
  std::unique_ptr<ReviewerWorkerPool> reviewers_;

  mutable std::mutex state_mutex_;
  std::condition_variable state_cv_;
  std::string fatal_error_;
  bool started_{false};
  bool stopping_{false};
  bool shutdown_requested_{false};
};

} // namespace prv

#endif // PATCHREVIEW_REVIEW_SERVICE_HPP
