/**
 * @file review_queue.hpp
 * @brief Durable FIFO of review requests waiting for a setup worker.
 *
 * The queue is mirrored to a JSON file after every mutation so that requests
 * which were never claimed survive a restart in their original order.
 */
#ifndef PATCHREVIEW_REVIEW_QUEUE_HPP
#define PATCHREVIEW_REVIEW_QUEUE_HPP

#include "review_request.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace prv {

/**
 * Thread-safe persistent queue of review requests.
 *
 * Capacity is unbounded; backpressure is applied downstream. A request is
 * handed to exactly one claimer.
 */
class ReviewQueue {
public:
  /**
   * Open the queue persisted at @p path, loading any requests it contains.
   *
   * @param path Location of the queue file (typically `queue.json`).
   * @throws StorageError when an existing file cannot be read or parsed.
   */
  explicit ReviewQueue(std::filesystem::path path);

  ReviewQueue(const ReviewQueue &) = delete;
  ReviewQueue &operator=(const ReviewQueue &) = delete;

  /**
   * Append a validated request and persist the queue before returning.
   *
   * @return The request id.
   * @throws StorageError when the queue file cannot be written.
   */
  std::string submit(const ReviewRequest &request);

  /**
   * Block until a request is available and remove it.
   *
   * @return The oldest request, or empty once the queue is closed and no
   *         further request will be delivered.
   */
  std::optional<ReviewRequest> claim();

  /// Like claim() but gives up after @p timeout.
  std::optional<ReviewRequest> claim_for(std::chrono::milliseconds timeout);

  /// Number of requests waiting.
  std::size_t length() const;

  /// Entries ahead of @p id, or empty if it is not queued.
  std::optional<std::size_t> position(const std::string &id) const;

  /// Sum of estimated patch counts ahead of @p id (0 if not queued).
  std::size_t patches_ahead(const std::string &id) const;

  /// Whether @p id is still waiting.
  bool contains(const std::string &id) const;

  /// Ids of all waiting requests in queue order.
  std::vector<std::string> ids() const;

  /// Wake every blocked claimer; subsequent claims return empty.
  void close();

  /// Whether close() was called.
  bool closed() const;

private:
  std::optional<ReviewRequest> pop_locked();
  void load();
  void persist_locked() const;

  std::filesystem::path path_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<ReviewRequest> items_;
  bool closed_{false};
};

} // namespace prv

#endif // PATCHREVIEW_REVIEW_QUEUE_HPP
