/**
 * @file config.hpp
 * @brief Service configuration loaded from YAML, TOML or JSON files.
 */
#ifndef PATCHREVIEW_CONFIG_HPP
#define PATCHREVIEW_CONFIG_HPP

#include <algorithm>
#include <chrono>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace prv {

/// Application configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  /// Main git repository the work trees are attached to.
  const std::string &git_tree() const { return git_tree_; }
  void set_git_tree(const std::string &path) { git_tree_ = path; }

  /// Directory holding the queue, the database and review results.
  const std::string &results_path() const { return results_path_; }
  void set_results_path(const std::string &path) { results_path_ = path; }

  /// Number of setup workers, which is also the number of work trees.
  int setup_workers() const { return setup_workers_; }

  /// Set setup worker count (minimum 1).
  void set_setup_workers(int n) { setup_workers_ = n < 1 ? 1 : n; }

  /// Number of concurrent reviewer invocations.
  int reviewer_workers() const { return reviewer_workers_; }

  /// Set reviewer worker count (minimum 1).
  void set_reviewer_workers(int n) { reviewer_workers_ = n < 1 ? 1 : n; }

  /// Time a single reviewer invocation may take.
  std::chrono::milliseconds reviewer_timeout() const {
    return reviewer_timeout_;
  }
  void set_reviewer_timeout(std::chrono::milliseconds t) {
    reviewer_timeout_ = t;
  }

  /// Total reviewer invocations per patch.
  int reviewer_attempts() const { return reviewer_attempts_; }

  /// Set reviewer attempts (minimum 1).
  void set_reviewer_attempts(int n) { reviewer_attempts_ = n < 1 ? 1 : n; }

  /// Reviewer argv template.
  const std::vector<std::string> &reviewer_command() const {
    return reviewer_command_;
  }
  void set_reviewer_command(const std::vector<std::string> &argv) {
    reviewer_command_ = argv;
  }

  /// Directory copied into every snapshot before the reviewer runs.
  const std::string &prompt_dir() const { return prompt_dir_; }
  void set_prompt_dir(const std::string &dir) { prompt_dir_ = dir; }

  /// Prompt file inside the prompt directory.
  const std::string &prompt_file() const { return prompt_file_; }
  void set_prompt_file(const std::string &file) { prompt_file_ = file; }

  /// URL template for tree remotes; "{tree}" is replaced by the tree name.
  const std::string &remote_url_template() const {
    return remote_url_template_;
  }
  void set_remote_url_template(const std::string &tmpl) {
    remote_url_template_ = tmpl;
  }

  /// Indexing command run once per prepared request ("{range}" expanded).
  const std::vector<std::string> &indexer_command() const {
    return indexer_command_;
  }
  void set_indexer_command(const std::vector<std::string> &argv) {
    indexer_command_ = argv;
  }

  std::chrono::milliseconds index_timeout() const { return index_timeout_; }
  void set_index_timeout(std::chrono::milliseconds t) { index_timeout_ = t; }

  /// Whether the indexing step is skipped.
  bool skip_index() const { return skip_index_; }
  void set_skip_index(bool v) { skip_index_ = v; }

  /// Timeout applied to individual git commands.
  std::chrono::milliseconds git_timeout() const { return git_timeout_; }
  void set_git_timeout(std::chrono::milliseconds t) { git_timeout_ = t; }

  /// Keep snapshots after review for debugging.
  bool keep_snapshots() const { return keep_snapshots_; }
  void set_keep_snapshots(bool v) { keep_snapshots_ = v; }

  /// Base URL of the Patchwork instance, empty disables series support.
  const std::string &patchwork_url() const { return patchwork_url_; }
  void set_patchwork_url(const std::string &url) { patchwork_url_ = url; }

  /// HTTP request timeout.
  std::chrono::milliseconds http_timeout() const { return http_timeout_; }
  void set_http_timeout(std::chrono::milliseconds t) { http_timeout_ = t; }

  /// Number of HTTP retry attempts, clamped to 0..10.
  int http_retries() const { return http_retries_; }
  void set_http_retries(int r) { http_retries_ = std::clamp(r, 0, 10); }

  /// Get logging verbosity level.
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Get logging pattern.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logging pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Path to rotating log file.
  const std::string &log_file() const { return log_file_; }

  /// Set path for rotating log file.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to keep.
  int log_rotate() const { return log_rotate_; }
  void set_log_rotate(int n) { log_rotate_ = n < 0 ? 0 : n; }

  /// Whether rotated log files are gzip compressed.
  bool log_compress() const { return log_compress_; }
  void set_log_compress(bool v) { log_compress_ = v; }

  /// Per-category log level overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }
  void set_log_categories(
      const std::unordered_map<std::string, std::string> &categories) {
    log_categories_ = categories;
  }

  /**
   * Populate the configuration from a JSON object.
   *
   * Grouped sections (`core`, `pipeline`, `reviewer`, `git`, `patchwork`,
   * `logging`) are flattened before keys are read.
   *
   * @throws ConfigError for values of the wrong type or malformed durations.
   */
  void load_json(const nlohmann::json &j);

  /// Construct a configuration object from a JSON representation.
  static Config from_json(const nlohmann::json &j);

  /**
   * Load configuration from a file; the format follows the extension
   * (`.yaml`/`.yml`, `.toml`/`.tml` or `.json`).
   *
   * @throws ConfigError when the file cannot be read or parsed.
   */
  static Config from_file(const std::string &path);

private:
  std::string git_tree_;
  std::string results_path_{"results"};
  int setup_workers_{4};
  int reviewer_workers_{4};
  std::chrono::milliseconds reviewer_timeout_{std::chrono::seconds(800)};
  int reviewer_attempts_{3};
  std::vector<std::string> reviewer_command_{
      "claude", "-p",
      "review the top commit in this directory using prompt {prompt}",
      "--verbose", "--output-format=stream-json"};
  std::string prompt_dir_;
  std::string prompt_file_{"review-prompt.md"};
  std::string remote_url_template_{
      "git://git.kernel.org/pub/scm/linux/kernel/git/{tree}.git"};
  std::vector<std::string> indexer_command_;
  std::chrono::milliseconds index_timeout_{std::chrono::seconds(300)};
  bool skip_index_{false};
  std::chrono::milliseconds git_timeout_{std::chrono::minutes(30)};
  bool keep_snapshots_{false};
  std::string patchwork_url_;
  std::chrono::milliseconds http_timeout_{std::chrono::seconds(30)};
  int http_retries_{3};
  std::string log_level_{"info"};
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_{3};
  bool log_compress_{false};
  std::unordered_map<std::string, std::string> log_categories_;
};

} // namespace prv

#endif // PATCHREVIEW_CONFIG_HPP
