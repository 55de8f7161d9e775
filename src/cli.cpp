#include "cli.hpp"
#include "log.hpp"
#include "util/duration.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string_view>

#include <spdlog/spdlog.h>

namespace prv {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string log_category_help_text() {
  static const std::array<std::string_view, 13> categories = {
      "app",     "cli",      "config",  "logging", "main",
      "patchwork", "process", "queue",  "reviewer", "service",
      "setup",   "store",    "worktree"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., "
         "worktree=debug).";
  oss << " Configuration files accept the same mapping under 'log_categories'.";
  return oss.str();
}

std::string trim_copy(const std::string &value) {
  auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) {
    return std::isspace(c);
  });
  auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) {
               return std::isspace(c);
             }).base();
  return begin < end ? std::string(begin, end) : std::string{};
}

std::chrono::milliseconds duration_option(const std::string &name,
                                          const std::string &value) {
  try {
    return parse_duration(value);
  } catch (const std::runtime_error &e) {
    throw CLI::ValidationError(name, e.what());
  }
}
} // namespace

std::vector<bool> parse_mask(const std::string &text) {
  std::vector<bool> mask;
  std::istringstream in(text);
  std::string item;
  while (std::getline(in, item, ',')) {
    std::string entry = trim_copy(item);
    std::transform(entry.begin(), entry.end(), entry.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (entry == "1" || entry == "y" || entry == "yes" || entry == "true") {
      mask.push_back(true);
    } else if (entry == "0" || entry == "n" || entry == "no" ||
               entry == "false") {
      mask.push_back(false);
    } else {
      throw std::invalid_argument("Invalid mask entry '" + item + "'");
    }
  }
  if (mask.empty()) {
    throw std::invalid_argument("Mask must not be empty");
  }
  return mask;
}

/**
 * Parse command line arguments into a CliOptions structure.
 *
 * @param argc Number of arguments supplied to the executable.
 * @param argv Argument vector supplied to the executable.
 * @return Fully populated options structure.
 */
CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"patchreview: two-stage patch review pipeline"};
  app.footer(log_category_help_text());
  app.require_subcommand(1);
  app.fallthrough();
  CliOptions options;

  app.add_flag("-v,--verbose", options.verbose, "Enable verbose output")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file")
      ->type_name("FILE")
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::size_t) {
           std::cout << "patchreview " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");

  app.add_option(
         "-G,--log-level", options.log_level,
         "Set logging level (trace, debug, info, warn, error, critical, off)")
      ->type_name("LEVEL")
      ->group("Logging");
  app.add_option("--log-pattern", options.log_pattern,
                 "spdlog pattern for log lines")
      ->type_name("PATTERN")
      ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to rotating log file")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<int>(
         "--log-rotate",
         [&options](int value) {
           if (value < 0) {
             throw CLI::ValidationError("--log-rotate",
                                        "rotation count must be non-negative");
           }
           options.log_rotate = value;
         },
         "Number of rotated log files to retain (0 disables rotation)")
      ->type_name("N")
      ->group("Logging");
  bool log_compress = false;
  auto *log_compress_flag =
      app.add_flag("--log-compress,!--no-log-compress", log_compress,
                   "Compress rotated log files with gzip")
          ->group("Logging");
  app.add_option_function<std::string>(
         "--log-category",
         [&options](const std::string &value) {
           auto pos = value.find('=');
           std::string name =
               pos == std::string::npos ? value : value.substr(0, pos);
           std::string level = pos == std::string::npos ? std::string{"debug"}
                                                        : value.substr(pos + 1);
           if (name.empty()) {
             throw CLI::ValidationError("--log-category",
                                        "category name must not be empty");
           }
           if (level.empty()) {
             level = "debug";
           }
           options.log_categories[name] = level;
         },
         "Enable a logging category (NAME or NAME=LEVEL). See help footer for "
         "available categories.")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");

  app.add_option("--git-tree", options.git_tree,
                 "Main git repository the work trees attach to")
      ->type_name("DIR")
      ->group("Pipeline");
  app.add_option("--results-path", options.results_path,
                 "Directory for the queue, database and review results")
      ->type_name("DIR")
      ->group("Pipeline");
  app.add_option("-S,--setup-workers", options.setup_workers,
                 "Number of setup workers and work trees")
      ->type_name("N")
      ->check(CLI::Range(1, std::numeric_limits<int>::max()))
      ->group("Pipeline");
  app.add_option("-R,--reviewer-workers", options.reviewer_workers,
                 "Number of concurrent reviewer invocations")
      ->type_name("N")
      ->check(CLI::Range(1, std::numeric_limits<int>::max()))
      ->group("Pipeline");
  app.add_option_function<std::string>(
         "--reviewer-timeout",
         [&options](const std::string &value) {
           options.reviewer_timeout =
               duration_option("--reviewer-timeout", value);
         },
         "Timeout of one reviewer invocation (e.g. 800s, 13m20s)")
      ->type_name("DURATION")
      ->group("Pipeline");
  app.add_option("--reviewer-attempts", options.reviewer_attempts,
                 "Reviewer invocations per patch")
      ->type_name("N")
      ->check(CLI::Range(1, std::numeric_limits<int>::max()))
      ->group("Pipeline");
  app.add_option("--prompt-dir", options.prompt_dir,
                 "Directory copied into every snapshot")
      ->type_name("DIR")
      ->group("Pipeline");
  app.add_option("--patchwork-url", options.patchwork_url,
                 "Base URL of the Patchwork instance")
      ->type_name("URL")
      ->group("Pipeline");
  app.add_flag("--skip-index", options.skip_index,
               "Skip the indexing step during setup")
      ->group("Debugging");
  app.add_flag("--keep-snapshots", options.keep_snapshots,
               "Keep snapshots after their review finished")
      ->group("Debugging");

  auto *run_cmd = app.add_subcommand(
      "run", "Process the persisted queue until SIGINT or SIGTERM");
  run_cmd->callback([&options] { options.command = CliCommand::Run; });

  auto *review_cmd = app.add_subcommand(
      "review", "Submit one request, wait for it and print the result");
  review_cmd->callback([&options] { options.command = CliCommand::Review; });
  auto &review = options.review;
  review_cmd->add_option("-t,--tree", review.tree, "Source tree name")
      ->required()
      ->type_name("NAME");
  review_cmd->add_option("-b,--branch", review.branch,
                         "Branch the patches apply to")
      ->type_name("BRANCH");
  auto *hash_opt = review_cmd->add_option("--hash", review.hash,
                                          "Commit, or base..tip range")
                       ->type_name("REV");
  auto *range_opt =
      review_cmd->add_option("--range", review.range, "Commit range base..tip")
          ->type_name("RANGE");
  auto *series_opt = review_cmd->add_option("--series", review.series,
                                            "Patchwork series id")
                         ->type_name("ID");
  auto *patch_opt =
      review_cmd
          ->add_option("--patch", review.patch_files,
                       "Patch file in mbox format (repeatable, in order)")
          ->type_name("FILE")
          ->check(CLI::ExistingFile);
  hash_opt->excludes(range_opt)->excludes(series_opt)->excludes(patch_opt);
  range_opt->excludes(series_opt)->excludes(patch_opt);
  series_opt->excludes(patch_opt);
  review_cmd->add_option_function<std::string>(
      "--mask",
      [&review](const std::string &value) {
        try {
          review.mask = parse_mask(value);
        } catch (const std::invalid_argument &e) {
          throw CLI::ValidationError("--mask", e.what());
        }
      },
      "Patches to review, e.g. 1,0,1 (0 skips a patch)")
      ->type_name("LIST");
  review_cmd->add_option("--owner", review.owner, "Owner recorded on the request")
      ->type_name("NAME");
  review_cmd
      ->add_option("--format", review.format,
                   "Review documents to print (json, markdown, inline)")
      ->type_name("FORMAT")
      ->check(CLI::IsMember({"json", "markup", "md", "markdown", "inline"}));
  review_cmd->add_option_function<std::string>(
      "--wait-timeout",
      [&review](const std::string &value) {
        review.wait_timeout = duration_option("--wait-timeout", value);
      },
      "Give up waiting after this long (default: wait forever)")
      ->type_name("DURATION");

  auto *status_cmd =
      app.add_subcommand("status", "Print a stored review or the summary");
  status_cmd->callback([&options] { options.command = CliCommand::Status; });
  auto &status = options.status;
  status_cmd->add_option("-i,--id", status.id, "Review id")->type_name("ID");
  status_cmd->add_flag("-l,--list", status.list, "List recent reviews");
  status_cmd->add_option("--owner", status.owner, "Only list this owner")
      ->type_name("NAME");
  status_cmd->add_option("--limit", status.limit, "Maximum listed reviews")
      ->type_name("N")
      ->check(CLI::Range(1, 100000));
  status_cmd
      ->add_option("--format", status.format,
                   "Include review documents (json, markdown, inline)")
      ->type_name("FORMAT")
      ->check(CLI::IsMember({"json", "markup", "md", "markdown", "inline"}));

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }
  if (log_compress_flag->count() > 0U) {
    options.log_compress = log_compress;
  }
  if (options.command == CliCommand::Review && review.hash.empty() &&
      review.range.empty() && review.series.empty() &&
      review.patch_files.empty()) {
    std::cerr << "review: one of --hash, --range, --series or --patch is "
                 "required"
              << std::endl;
    throw CliParseExit(2);
  }
  cli_log()->debug("Parsed command line, subcommand {}",
                   run_cmd->parsed()      ? "run"
                   : review_cmd->parsed() ? "review"
                                          : "status");
  return options;
}

} // namespace prv
