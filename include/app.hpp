/**
 * @file app.hpp
 * @brief Main application entry point and orchestrator for patchreview.
 *
 * Declares the App class, which manages high-level application flow,
 * configuration loading, and CLI parsing for the patchreview tool.
 */

#ifndef PATCHREVIEW_APP_HPP
#define PATCHREVIEW_APP_HPP

#include "cli.hpp"
#include "config.hpp"

#include <memory>
#include <optional>

namespace prv {

class ReviewService;

/**
 * Main application entry point responsible for orchestrating high level
 * application flow, configuration loading, and CLI parsing.
 */
class App {
public:
  /**
   * Run the application with the given command line arguments.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Null-terminated array containing the raw CLI arguments.
   * @return Zero on success, non-zero when execution should terminate due to
   *         an error.
   */
  int run(int argc, char **argv);

  /// Parsed command line options.
  const CliOptions &options() const { return options_; }

  /// Configuration after command line overrides were applied.
  const Config &config() const { return config_; }

  /**
   * Parse the command line, load the configuration and apply overrides.
   *
   * @return Exit code when the program should stop right away.
   */
  std::optional<int> configure(int argc, char **argv);

  /**
   * Build the service from the current configuration.
   *
   * @throws ConfigError when the configuration is unusable.
   * @throws StorageError when the result directory cannot be opened.
   */
  std::unique_ptr<ReviewService> build_service() const;

private:
  int run_service();
  int run_review();
  int run_status();

  CliOptions options_;
  Config config_;
};

} // namespace prv

#endif // PATCHREVIEW_APP_HPP
