#include "review_service.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "patchwork_client.hpp"

#include <algorithm>
#include <system_error>

namespace prv {

namespace {

std::shared_ptr<spdlog::logger> service_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("service");
  }();
  return logger;
}

constexpr const char *kInterruptedMessage = "interrupted by restart";

std::vector<std::unique_ptr<WorkTree>>
require_trees(std::vector<std::unique_ptr<WorkTree>> trees) {
  if (trees.empty()) {
    throw ConfigError("At least one work tree is required");
  }
  return trees;
}

std::filesystem::path
prepare_results_dir(const std::filesystem::path &results) {
  std::error_code ec;
  std::filesystem::create_directories(results, ec);
  if (ec) {
    throw StorageError("Failed to create results directory " +
                       results.string() + ": " + ec.message());
  }
  return results;
}

} // namespace

ReviewService::ReviewService(ServiceSettings settings,
                             std::vector<std::unique_ptr<WorkTree>> trees,
                             std::unique_ptr<Reviewer> reviewer,
                             std::shared_ptr<SeriesSource> series)
    : settings_(std::move(settings)),
      artifacts_(prepare_results_dir(settings_.results_path)),
      store_(std::make_unique<ResultStore>(
          (settings_.results_path / "metadata.db").string())),
      queue_(std::make_unique<ReviewQueue>(settings_.results_path /
                                           "queue.json")),
      series_(std::move(series)), reviewer_(std::move(reviewer)),
      pool_(require_trees(std::move(trees))),
      handoff_(2 * std::max<std::size_t>(1, settings_.reviewer_workers)) {
  if (!reviewer_) {
    throw ConfigError("A reviewer is required");
  }
  auto fatal = [this](const std::string &message) { on_fatal(message); };
  setup_ = std::make_unique<SetupWorkerPool>(*queue_, pool_, *store_,
                                             artifacts_, handoff_, fatal);
  ReviewerPoolSettings reviewer_settings;
  reviewer_settings.workers = settings_.reviewer_workers;
  reviewer_settings.attempts = settings_.reviewer_attempts;
  reviewer_settings.keep_snapshots = settings_.keep_snapshots;
  reviewers_ = std::make_unique<ReviewerWorkerPool>(
      handoff_, *reviewer_, *store_, artifacts_, reviewer_settings, fatal);
}

ReviewService::~ReviewService() { stop(); }

std::size_t ReviewService::start() {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (started_) {
      return 0;
    }
    started_ = true;
  }
  const auto interrupted =
      store_->interrupt_unfinished(queue_->ids(), kInterruptedMessage);
  if (interrupted > 0) {
    service_log()->warn("Marked {} unfinished reviews as interrupted",
                        interrupted);
  }
  setup_->start();
  reviewers_->start();
  service_log()->info("Review service started: {} setup workers, {} reviewer "
                      "workers, handoff capacity {}, {} queued",
                      setup_->size(), reviewers_->size(), handoff_.capacity(),
                      queue_->length());
  return interrupted;
}

void ReviewService::stop() {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (stopping_) {
      return;
    }
    stopping_ = true;
    shutdown_requested_ = true;
  }
  state_cv_.notify_all();
  queue_->close();
  handoff_.close();
  const auto dropped = handoff_.clear();
  if (dropped > 0) {
    service_log()->info("Discarded {} queued snapshots", dropped);
  }
  setup_->join();
  reviewers_->join();
  service_log()->info("Review service stopped");
}

void ReviewService::on_fatal(const std::string &message) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (fatal_error_.empty()) {
      fatal_error_ = message;
    }
  }
  service_log()->critical("Fatal error, stopping pipeline: {}", message);
  queue_->close();
  handoff_.close();
  state_cv_.notify_all();
}

bool ReviewService::failed() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return !fatal_error_.empty();
}

std::string ReviewService::fatal_error() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return fatal_error_;
}

void ReviewService::request_shutdown() {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    shutdown_requested_ = true;
  }
  state_cv_.notify_all();
}

void ReviewService::wait_for_shutdown() {
  std::unique_lock<std::mutex> lock(state_mutex_);
  state_cv_.wait(lock, [this] {
    return shutdown_requested_ || !fatal_error_.empty();
  });
}

std::string ReviewService::submit(const ReviewSubmission &submission,
                                  const std::string &owner) {
  if (failed()) {
    throw StorageError("Service stopped after a fatal error: " +
                       fatal_error());
  }
  auto request = validate_submission(submission, owner);
  if (const auto *series = std::get_if<SeriesOrigin>(&request.origin)) {
    if (series_ && request.mask.empty()) {
      request.estimated_patches =
          series_->estimate_patch_count(series->series_id);
    }
  }
  store_->create_review(request);
  artifacts_.create_review_dir(request.owner, request.id);
  queue_->submit(request);
  service_log()->info("Submitted review {} for {} ({})", request.id, owner,
                      describe_origin(request.origin));
  return request.id;
}

std::optional<nlohmann::json>
ReviewService::get(const std::string &id, const std::string &owner,
                   std::optional<ReviewFormat> format) const {
  auto record = store_->get(id);
  if (!record || (!owner.empty() && record->owner != owner)) {
    return std::nullopt;
  }
  auto result = record->to_json();
  if (!result.contains("message")) {
    if (auto message = artifacts_.read_message(record->owner, id)) {
      result["message"] = *message;
    }
  }
  if (record->status == ReviewStatus::Queued) {
    result["queue-len"] = queue_->patches_ahead(id);
    if (auto position = queue_->position(id)) {
      result["queue-position"] = *position;
    }
  }
  if (format && is_terminal(record->status)) {
    nlohmann::json reviews = nlohmann::json::array();
    for (const auto &patch : record->patches) {
      std::optional<std::string> text;
      if (patch.state == PatchState::Done) {
        text = artifacts_.read_review(record->owner, id, patch.index, *format);
      }
      if (text) {
        reviews.push_back(*text);
      } else {
        reviews.push_back(nullptr);
      }
    }
    result["review"] = std::move(reviews);
  }
  return result;
}

nlohmann::json ReviewService::list(const std::string &owner,
                                   std::size_t limit) const {
  nlohmann::json out = nlohmann::json::array();
  for (const auto &record : store_->list(owner, limit)) {
    out.push_back({{"review_id", record.id},
                   {"status", to_string(record.status)},
                   {"date", record.submitted_at},
                   {"tree", record.tree},
                   {"patch_count", record.patches.size()}});
  }
  return out;
}

nlohmann::json ReviewService::status() const {
  std::string state = "running";
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!fatal_error_.empty()) {
      state = "failed";
    } else if (stopping_ || !started_) {
      state = "stopped";
    }
  }
  nlohmann::json j{
      {"service", "patchreview"},
      {"status", state},
      {"queue_size", queue_->length()},
      {"setup_workers", setup_->size()},
      {"setup_busy", setup_->busy()},
      {"idle_trees", pool_.idle_count()},
      {"reviewer_workers", reviewers_->size()},
      {"reviewer_busy", reviewers_->busy()},
      {"handoff",
       {{"depth", handoff_.size()},
        {"capacity", handoff_.capacity()},
        {"high_water", handoff_.high_water()}}},
      {"review_counts", store_->summary().to_json()}};
  if (state == "failed") {
    j["error"] = fatal_error();
  }
  return j;
}

std::optional<ReviewRecord>
ReviewService::wait_for(const std::string &id,
                        std::chrono::milliseconds timeout) {
  const auto poll = std::chrono::milliseconds(100);
  const auto start = std::chrono::steady_clock::now();
  while (true) {
    auto record = store_->get(id);
    if (!record || is_terminal(record->status)) {
      return record;
    }
    std::unique_lock<std::mutex> lock(state_mutex_);
    if (!fatal_error_.empty() || stopping_ || shutdown_requested_) {
      return record;
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    if (elapsed >= timeout) {
      return record;
    }
    state_cv_.wait_for(lock, poll, [this] {
      return !fatal_error_.empty() || stopping_ || shutdown_requested_;
    });
  }
}

} // namespace prv
