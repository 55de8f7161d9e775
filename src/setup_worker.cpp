#include "setup_worker.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "result_store.hpp"
#include "review_artifacts.hpp"
#include "review_queue.hpp"

namespace prv {

namespace {

std::shared_ptr<spdlog::logger> setup_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("setup");
  }();
  return logger;
}

/// Decrements the busy counter when a request leaves the worker.
class BusyScope {
public:
  explicit BusyScope(std::atomic<std::size_t> &counter) : counter_(counter) {
    ++counter_;
  }
  ~BusyScope() { --counter_; }
  BusyScope(const BusyScope &) = delete;
  BusyScope &operator=(const BusyScope &) = delete;

private:
  std::atomic<std::size_t> &counter_;
};

} // namespace

SetupWorkerPool::SetupWorkerPool(ReviewQueue &queue, WorkTreePool &trees,
                                 ResultStore &store,
                                 const ReviewArtifacts &artifacts,
                                 HandoffQueue &handoff, FatalHandler on_fatal)
    : queue_(queue), trees_(trees), store_(store), artifacts_(artifacts),
      handoff_(handoff), on_fatal_(std::move(on_fatal)) {}

SetupWorkerPool::~SetupWorkerPool() { join(); }

void SetupWorkerPool::start() {
  if (!threads_.empty()) {
    return;
  }
  threads_.reserve(trees_.size());
  for (std::size_t slot = 0; slot < trees_.size(); ++slot) {
    threads_.emplace_back(&SetupWorkerPool::worker, this, slot);
  }
  setup_log()->info("Started {} setup workers", threads_.size());
}

void SetupWorkerPool::join() {
  for (auto &t : threads_) {
    if (t.joinable()) {
      t.join();
    }
  }
  threads_.clear();
}

void SetupWorkerPool::worker(std::size_t slot) {
  setup_log()->debug("Setup worker {} started", slot + 1);
  while (true) {
    std::optional<ReviewRequest> request;
    try {
      request = queue_.claim();
    } catch (const StorageError &e) {
      setup_log()->critical("Storage failure while claiming: {}", e.what());
      on_fatal_(e.what());
      break;
    }
    if (!request) {
      break;
    }
    BusyScope busy(busy_);
    try {
      if (!process(slot, *request)) {
        break;
      }
    } catch (const StorageError &e) {
      setup_log()->critical("Storage failure while preparing {}: {}",
                            request->id, e.what());
      on_fatal_(e.what());
      break;
    } catch (const ConfigError &e) {
      setup_log()->critical("Configuration failure while preparing {}: {}",
                            request->id, e.what());
      on_fatal_(e.what());
      break;
    }
  }
  setup_log()->debug("Setup worker {} stopped", slot + 1);
}

void SetupWorkerPool::fail_request(const ReviewRequest &request,
                                   const std::string &message) {
  setup_log()->error("Setup of {} failed: {}", request.id, message);
  store_.fail_review(request.id, message);
  artifacts_.write_message(request.owner, request.id, message);
}

void SetupWorkerPool::snapshot_failed(const ReviewRequest &request,
                                      std::size_t index,
                                      const std::string &message) {
  setup_log()->error("Snapshot of {} patch {} failed: {}", request.id, index,
                     message);
  store_.record_patch_result(request.id, index, PatchState::Error,
                             "Snapshot failed: " + message);
}

bool SetupWorkerPool::process(std::size_t slot, const ReviewRequest &request) {
  const std::string owner = "setup-" + std::to_string(slot + 1);
  setup_log()->info("{} processing {} ({} on {})", owner, request.id,
                    describe_origin(request.origin), request.tree);
  store_.mark_setup_started(request.id);

  auto lease = trees_.acquire(slot, owner);
  PreparedSeries series;
  std::size_t to_review = 0;
  try {
    series = lease->prepare(request);
    if (!request.mask_matches(series.patches.size())) {
      throw PreparationError(
          "Mask has " + std::to_string(request.mask.size()) +
          " entries but the series has " +
          std::to_string(series.patches.size()) + " patches");
    }
    std::vector<PatchInit> inits;
    inits.reserve(series.patches.size());
    for (const auto &patch : series.patches) {
      const bool skipped = request.is_skipped(patch.index);
      inits.push_back({patch.index, patch.commit, skipped});
      if (!skipped) {
        ++to_review;
      }
    }
    store_.set_patches(request.id, inits);
    for (const auto &patch : series.patches) {
      artifacts_.write_patch_input(request.owner, request.id, patch.index,
                                   patch.content);
    }
    if (to_review > 0) {
      lease->index(series);
    }
  } catch (const PreparationError &e) {
    fail_request(request, e.what());
    return true;
  } catch (const std::filesystem::filesystem_error &e) {
    fail_request(request, e.what());
    return true;
  }

  setup_log()->info("{}: {} patches, {} to review", request.id,
                    series.patches.size(), to_review);

  for (const auto &patch : series.patches) {
    if (request.is_skipped(patch.index)) {
      continue;
    }
    Snapshot snapshot;
    try {
      snapshot = lease->snapshot(request.id, patch.index, patch.commit);
    } catch (const PreparationError &e) {
      snapshot_failed(request, patch.index, e.what());
      continue;
    } catch (const std::filesystem::filesystem_error &e) {
      snapshot_failed(request, patch.index, e.what());
      continue;
    }
    store_.record_snapshot(request.id, patch.index, snapshot.path().string());
    PatchHandoff item{request.id, request.owner, patch.index, patch.commit,
                      std::move(snapshot)};
    if (!handoff_.push(std::move(item))) {
      setup_log()->warn("Handoff closed while preparing {}, stopping",
                        request.id);
      return false;
    }
  }

  lease.release();
  const auto status = store_.mark_setup_complete(request.id);
  setup_log()->info("Setup of {} complete, status {}", request.id,
                    to_string(status));
  return true;
}

} // namespace prv
