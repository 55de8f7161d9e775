#include "review_queue.hpp"

#include "errors.hpp"
#include "log.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace prv {

namespace {

std::shared_ptr<spdlog::logger> queue_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("queue");
  }();
  return logger;
}

/// Write @p data to @p path atomically: temp file, fsync, rename.
void write_file_durably(const std::filesystem::path &path,
                        const std::string &data) {
  const std::string tmp = path.string() + ".tmp";
  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw StorageError("Failed to open " + tmp + ": " + std::strerror(errno));
  }
  const char *p = data.data();
  std::size_t left = data.size();
  while (left > 0) {
    ssize_t n = ::write(fd, p, left);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      int err = errno;
      ::close(fd);
      throw StorageError("Failed to write " + tmp + ": " + std::strerror(err));
    }
    p += n;
    left -= static_cast<std::size_t>(n);
  }
  if (::fsync(fd) != 0) {
    int err = errno;
    ::close(fd);
    throw StorageError("Failed to sync " + tmp + ": " + std::strerror(err));
  }
  ::close(fd);
  if (::rename(tmp.c_str(), path.c_str()) != 0) {
    throw StorageError("Failed to replace " + path.string() + ": " +
                       std::strerror(errno));
  }
}

} // namespace

ReviewQueue::ReviewQueue(std::filesystem::path path) : path_(std::move(path)) {
  load();
}

void ReviewQueue::load() {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    queue_log()->debug("No persisted queue at {}", path_.string());
    return;
  }
  std::ifstream in(path_);
  if (!in) {
    throw StorageError("Failed to read queue file " + path_.string());
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch (const nlohmann::json::exception &e) {
    throw StorageError("Corrupt queue file " + path_.string() + ": " +
                       e.what());
  }
  if (!doc.is_array()) {
    throw StorageError("Queue file " + path_.string() + " is not an array");
  }
  for (const auto &entry : doc) {
    try {
      items_.push_back(ReviewRequest::from_json(entry));
    } catch (const ValidationError &e) {
      queue_log()->error("Dropping unreadable queue entry: {}", e.what());
    }
  }
  queue_log()->info("Loaded {} queued request(s) from {}", items_.size(),
                    path_.string());
}

void ReviewQueue::persist_locked() const {
  nlohmann::json doc = nlohmann::json::array();
  for (const auto &item : items_) {
    doc.push_back(item.to_json());
  }
  write_file_durably(path_, doc.dump(2));
}

std::string ReviewQueue::submit(const ReviewRequest &request) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    items_.push_back(request);
    try {
      persist_locked();
    } catch (const StorageError &) {
      items_.pop_back();
      throw;
    }
    queue_log()->info("Queued review {} ({}, tree {}), {} waiting", request.id,
                      describe_origin(request.origin), request.tree,
                      items_.size());
  }
  cv_.notify_one();
  return request.id;
}

std::optional<ReviewRequest> ReviewQueue::pop_locked() {
  if (items_.empty()) {
    return std::nullopt;
  }
  ReviewRequest front = std::move(items_.front());
  items_.pop_front();
  try {
    persist_locked();
  } catch (const StorageError &) {
    items_.push_front(std::move(front));
    throw;
  }
  queue_log()->debug("Claimed review {}, {} left", front.id, items_.size());
  return front;
}

std::optional<ReviewRequest> ReviewQueue::claim() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return closed_ || !items_.empty(); });
  if (closed_) {
    return std::nullopt;
  }
  return pop_locked();
}

std::optional<ReviewRequest>
ReviewQueue::claim_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!cv_.wait_for(lock, timeout,
                    [this] { return closed_ || !items_.empty(); })) {
    return std::nullopt;
  }
  if (closed_) {
    return std::nullopt;
  }
  return pop_locked();
}

std::size_t ReviewQueue::length() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_.size();
}

std::optional<std::size_t> ReviewQueue::position(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (std::size_t i = 0; i < items_.size(); ++i) {
    if (items_[i].id == id) {
      return i;
    }
  }
  return std::nullopt;
}

std::size_t ReviewQueue::patches_ahead(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t ahead = 0;
  for (const auto &item : items_) {
    if (item.id == id) {
      return ahead;
    }
    ahead += item.estimated_patches;
  }
  return 0;
}

bool ReviewQueue::contains(const std::string &id) const {
  return position(id).has_value();
}

std::vector<std::string> ReviewQueue::ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  out.reserve(items_.size());
  for (const auto &item : items_) {
    out.push_back(item.id);
  }
  return out;
}

void ReviewQueue::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool ReviewQueue::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

} // namespace prv
