/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for patchreview.
 *
 * Declares CLI parsing helpers, option structures, and related exceptions for
 * the tool.
 */

#ifndef PATCHREVIEW_CLI_HPP
#define PATCHREVIEW_CLI_HPP

#include <chrono>
#include <cstddef>
#include <exception>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace prv {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Process exit code that should be returned to the caller.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Process exit code that triggered the exception.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/// Subcommand selected on the command line.
enum class CliCommand { Run, Review, Status };

/** Options of the `review` subcommand. */
struct ReviewCliOptions {
  std::string tree;
  std::string branch;
  std::string hash;
  std::string range;
  std::string series;
  std::vector<std::string> patch_files; ///< read in order as literal patches
  std::vector<bool> mask;
  std::string owner{"local"};
  std::string format{"markdown"}; ///< review documents included in the output
  std::chrono::milliseconds wait_timeout{0}; ///< 0 waits forever
};

/** Options of the `status` subcommand. */
struct StatusCliOptions {
  std::string id;    ///< empty prints the summary
  std::string owner; ///< filter for listings
  std::string format;
  bool list{false};
  std::size_t limit{50};
};

/**
 * Parsed command line options supplied via the CLI.
 *
 * Values that also exist in the configuration file are only applied when
 * given explicitly; empty strings, zero counts and unset optionals leave the
 * configured value in place.
 */
struct CliOptions {
  CliCommand command{CliCommand::Run};
  std::string config_file;
  bool verbose{false};

  std::string log_level;
  std::string log_pattern;
  std::string log_file;
  std::optional<int> log_rotate;
  std::optional<bool> log_compress;
  std::unordered_map<std::string, std::string> log_categories;

  std::string git_tree;
  std::string results_path;
  int setup_workers{0};
  int reviewer_workers{0};
  std::optional<std::chrono::milliseconds> reviewer_timeout;
  int reviewer_attempts{0};
  std::string prompt_dir;
  std::string patchwork_url;
  bool skip_index{false};
  bool keep_snapshots{false};

  ReviewCliOptions review;
  StatusCliOptions status;
};

/**
 * Parse command line arguments into a CliOptions structure.
 *
 * @throws CliParseExit when parsing requested an exit (help, version or an
 *         invalid argument); the exit code is carried by the exception.
 */
CliOptions parse_cli(int argc, char **argv);

/**
 * Parse a review mask such as "1,0,1" or "y,n,y".
 *
 * @throws std::invalid_argument for unknown entries.
 */
std::vector<bool> parse_mask(const std::string &text);

} // namespace prv

#endif // PATCHREVIEW_CLI_HPP
