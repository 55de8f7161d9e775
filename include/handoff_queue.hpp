/**
 * @file handoff_queue.hpp
 * @brief Bounded blocking channel between the setup and reviewer stages.
 */
#ifndef PATCHREVIEW_HANDOFF_QUEUE_HPP
#define PATCHREVIEW_HANDOFF_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace prv {

/**
 * Fixed capacity FIFO with blocking push and pop.
 *
 * push() blocks while the queue holds @c capacity items, which is what keeps
 * the producer stage from running arbitrarily far ahead. After close(), pop()
 * still drains what is left and push() refuses new items.
 *
 * @tparam T Move-only or copyable item type.
 */
template <typename T> class BoundedHandoffQueue {
public:
  /**
   * @param capacity Maximum number of items held at once.
   * @throws std::invalid_argument when @p capacity is zero.
   */
  explicit BoundedHandoffQueue(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
      throw std::invalid_argument("Handoff queue capacity must be positive");
    }
  }

  BoundedHandoffQueue(const BoundedHandoffQueue &) = delete;
  BoundedHandoffQueue &operator=(const BoundedHandoffQueue &) = delete;

  /**
   * Append @p item, waiting for space.
   *
   * @return false if the queue was closed; @p item is then destroyed.
   */
  bool push(T item) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock,
                   [this] { return closed_ || items_.size() < capacity_; });
    if (closed_) {
      return false;
    }
    items_.push_back(std::move(item));
    ++pushed_;
    if (items_.size() > high_water_) {
      high_water_ = items_.size();
    }
    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  /**
   * Remove the oldest item, waiting while the queue is empty.
   *
   * @return The item, or empty once the queue is closed and drained.
   */
  std::optional<T> pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
    if (items_.empty()) {
      return std::nullopt;
    }
    std::optional<T> out(std::move(items_.front()));
    items_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return out;
  }

  /// Release every blocked producer and consumer.
  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    not_full_.notify_all();
    not_empty_.notify_all();
  }

  /// Drop every queued item; returns how many were dropped.
  std::size_t clear() {
    std::deque<T> dropped;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      dropped.swap(items_);
    }
    not_full_.notify_all();
    return dropped.size();
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  std::size_t capacity() const { return capacity_; }

  /// Largest number of items ever held at once.
  std::size_t high_water() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return high_water_;
  }

  /// Total number of accepted pushes.
  std::size_t pushed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pushed_;
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

private:
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_full_;
  std::condition_variable not_empty_;
  std::deque<T> items_;
  std::size_t high_water_{0};
  std::size_t pushed_{0};
  bool closed_{false};
};

} // namespace prv

#endif // PATCHREVIEW_HANDOFF_QUEUE_HPP
