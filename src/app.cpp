#include "app.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "log.hpp"
#include "patchwork_client.hpp"
#include "result_store.hpp"
#include "review_artifacts.hpp"
#include "review_service.hpp"
#include "reviewer.hpp"
#include "signals.hpp"
#include "work_tree.hpp"
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace prv {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}

ReviewSubmission submission_from_options(const ReviewCliOptions &review) {
  ReviewSubmission submission;
  submission.tree = review.tree;
  submission.branch = review.branch;
  if (!review.hash.empty()) {
    submission.hash = review.hash;
  }
  if (!review.range.empty()) {
    submission.range = review.range;
  }
  if (!review.series.empty()) {
    submission.series_id = review.series;
  }
  if (!review.patch_files.empty()) {
    std::vector<std::string> bodies;
    for (const auto &file : review.patch_files) {
      auto body = read_text_file(file);
      if (!body) {
        throw ValidationError("Cannot read patch file " + file);
      }
      bodies.push_back(std::move(*body));
    }
    submission.patches = std::move(bodies);
  }
  if (!review.mask.empty()) {
    submission.mask = review.mask;
  }
  return submission;
}

} // namespace

/**
 * Parse the command line, load the configuration file and fold command line
 * overrides into the configuration before initializing logging.
 */
std::optional<int> App::configure(int argc, char **argv) {
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    return exit.exit_code();
  }
  if (!options_.config_file.empty()) {
    config_ = Config::from_file(options_.config_file);
  }
  if (!options_.git_tree.empty()) {
    config_.set_git_tree(options_.git_tree);
  }
  if (!options_.results_path.empty()) {
    config_.set_results_path(options_.results_path);
  }
  if (options_.setup_workers > 0) {
    config_.set_setup_workers(options_.setup_workers);
  }
  if (options_.reviewer_workers > 0) {
    config_.set_reviewer_workers(options_.reviewer_workers);
  }
  if (options_.reviewer_timeout) {
    config_.set_reviewer_timeout(*options_.reviewer_timeout);
  }
  if (options_.reviewer_attempts > 0) {
    config_.set_reviewer_attempts(options_.reviewer_attempts);
  }
  if (!options_.prompt_dir.empty()) {
    config_.set_prompt_dir(options_.prompt_dir);
  }
  if (!options_.patchwork_url.empty()) {
    config_.set_patchwork_url(options_.patchwork_url);
  }
  if (options_.skip_index) {
    config_.set_skip_index(true);
  }
  if (options_.keep_snapshots) {
    config_.set_keep_snapshots(true);
  }
  if (!options_.log_level.empty()) {
    config_.set_log_level(options_.log_level);
  } else if (options_.verbose) {
    config_.set_log_level("debug");
  }
  if (!options_.log_pattern.empty()) {
    config_.set_log_pattern(options_.log_pattern);
  }
  if (!options_.log_file.empty()) {
    config_.set_log_file(options_.log_file);
  }
  if (options_.log_rotate) {
    config_.set_log_rotate(*options_.log_rotate);
  }
  if (options_.log_compress) {
    config_.set_log_compress(*options_.log_compress);
  }
  if (!options_.log_categories.empty()) {
    auto categories = config_.log_categories();
    for (const auto &[name, level] : options_.log_categories) {
      categories[name] = level;
    }
    config_.set_log_categories(categories);
  }

  LogSettings log;
  log.level = parse_log_level(config_.log_level(), spdlog::level::info);
  log.pattern = config_.log_pattern();
  log.file = config_.log_file();
  log.rotate_files = static_cast<std::size_t>(config_.log_rotate());
  log.compress_rotations = config_.log_compress();
  init_logger(log);
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, level_str] : config_.log_categories()) {
    const auto level = parse_log_level(level_str, spdlog::level::n_levels);
    if (level == spdlog::level::n_levels) {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      level_str, category);
      continue;
    }
    category_levels[category] = level;
  }
  configure_log_categories(category_levels);
  if (options_.verbose) {
    app_log()->debug("Verbose mode enabled");
  }
  return std::nullopt;
}

std::unique_ptr<ReviewService> App::build_service() const {
  if (config_.git_tree().empty()) {
    throw ConfigError("git_tree is not configured");
  }
  GitSettings git;
  git.repo = std::filesystem::absolute(config_.git_tree());
  git.remote_url_template = config_.remote_url_template();
  git.indexer_command = config_.indexer_command();
  git.index_timeout = config_.index_timeout();
  git.skip_index = config_.skip_index();
  git.git_timeout = config_.git_timeout();

  std::shared_ptr<SeriesSource> series;
  if (!config_.patchwork_url().empty()) {
    auto http = std::make_unique<RetryHttpClient>(
        std::make_unique<CurlHttpClient>(config_.http_timeout()),
        config_.http_retries(), std::chrono::milliseconds(500));
    series = std::make_shared<PatchworkClient>(config_.patchwork_url(),
                                               std::move(http));
  }

  probe_reflink_support(git.repo);
  auto trees = create_git_work_trees(
      git, static_cast<std::size_t>(config_.setup_workers()), series);

  ReviewerSettings reviewer;
  reviewer.command = config_.reviewer_command();
  if (!config_.prompt_dir().empty()) {
    reviewer.prompt_dir = std::filesystem::absolute(config_.prompt_dir());
  }
  reviewer.prompt_file = config_.prompt_file();
  reviewer.timeout = config_.reviewer_timeout();

  ServiceSettings settings;
  settings.results_path = std::filesystem::absolute(config_.results_path());
  settings.reviewer_workers =
      static_cast<std::size_t>(config_.reviewer_workers());
  settings.reviewer_attempts = config_.reviewer_attempts();
  settings.keep_snapshots = config_.keep_snapshots();
  return std::make_unique<ReviewService>(
      settings, std::move(trees),
      std::make_unique<CommandReviewer>(std::move(reviewer)), series);
}

int App::run_service() {
  auto service = build_service();
  SignalWatcher signals([&service](int sig) {
    app_log()->info("Received signal {}, shutting down", sig);
    service->request_shutdown();
  });
  service->start();
  service->wait_for_shutdown();
  service->stop();
  if (service->failed()) {
    app_log()->critical("Service failed: {}", service->fatal_error());
    return 1;
  }
  return 0;
}

int App::run_review() {
  auto submission = submission_from_options(options_.review);
  auto service = build_service();
  SignalWatcher signals([&service](int sig) {
    app_log()->info("Received signal {}, shutting down", sig);
    service->request_shutdown();
  });
  service->start();
  const auto id = service->submit(submission, options_.review.owner);
  app_log()->info("Waiting for review {}", id);
  auto timeout = options_.review.wait_timeout.count() > 0
                     ? options_.review.wait_timeout
                     : std::chrono::milliseconds::max();
  auto record = service->wait_for(id, timeout);
  auto doc = service->get(id, {}, parse_review_format(options_.review.format));
  service->stop();
  if (doc) {
    std::cout << doc->dump(2) << std::endl;
  }
  if (service->failed()) {
    app_log()->critical("Service failed: {}", service->fatal_error());
    return 1;
  }
  if (!record || record->status != ReviewStatus::Done) {
    return 1;
  }
  return 0;
}

int App::run_status() {
  const auto results = std::filesystem::path(config_.results_path());
  const auto db = results / "metadata.db";
  if (!std::filesystem::exists(db)) {
    app_log()->error("No result database at {}", db.string());
    return 1;
  }
  ResultStore store(db.string());
  const auto &status = options_.status;
  if (!status.id.empty()) {
    auto record = store.get(status.id);
    if (!record) {
      app_log()->error("Unknown review {}", status.id);
      return 1;
    }
    auto doc = record->to_json();
    if (!status.format.empty() && is_terminal(record->status)) {
      ReviewArtifacts artifacts(results);
      const auto format = parse_review_format(status.format);
      nlohmann::json reviews = nlohmann::json::array();
      for (const auto &patch : record->patches) {
        auto text = patch.state == PatchState::Done
                        ? artifacts.read_review(record->owner, record->id,
                                                patch.index, format)
                        : std::nullopt;
        reviews.push_back(text ? nlohmann::json(*text) : nlohmann::json());
      }
      doc["review"] = std::move(reviews);
    }
    std::cout << doc.dump(2) << std::endl;
    return 0;
  }
  if (status.list) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto &record : store.list(status.owner, status.limit)) {
      out.push_back({{"review_id", record.id},
                     {"status", to_string(record.status)},
                     {"date", record.submitted_at},
                     {"tree", record.tree},
                     {"patch_count", record.patches.size()}});
    }
    std::cout << out.dump(2) << std::endl;
    return 0;
  }
  std::cout << store.summary().to_json().dump(2) << std::endl;
  return 0;
}

/**
 * Execute the main application flow.
 *
 * @param argc Argument count passed from @c main().
 * @param argv Argument vector passed from @c main().
 * @return Zero on success, non-zero if execution should terminate with an
 *         error code.
 */
int App::run(int argc, char **argv) {
  block_shutdown_signals();
  try {
    if (auto exit_code = configure(argc, argv)) {
      return *exit_code;
    }
    switch (options_.command) {
    case CliCommand::Run:
      app_log()->info("Running patchreview service");
      return run_service();
    case CliCommand::Review:
      return run_review();
    case CliCommand::Status:
      return run_status();
    }
  } catch (const ValidationError &e) {
    app_log()->error("Invalid request: {}", e.what());
    return 2;
  } catch (const ConfigError &e) {
    app_log()->critical("Configuration error: {}", e.what());
    return 1;
  } catch (const StorageError &e) {
    app_log()->critical("Storage error: {}", e.what());
    return 1;
  }
  return 1;
}

} // namespace prv
