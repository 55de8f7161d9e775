/**
 * @file process.hpp
 * @brief Synchronous subprocess execution with timeout and output capture.
 */
#ifndef PATCHREVIEW_PROCESS_HPP
#define PATCHREVIEW_PROCESS_HPP

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace prv {

/** Description of a subprocess invocation. */
struct ProcessSpec {
  std::vector<std::string> argv; ///< argv[0] is looked up in PATH
  std::string cwd;               ///< empty keeps the current directory
  std::map<std::string, std::string> env; ///< added to the inherited env
  std::chrono::milliseconds timeout{0};   ///< 0 disables the timeout
  std::string stdout_path; ///< when set stdout goes to this file instead
  std::string stdin_path;  ///< when set stdin reads this file, else /dev/null
  std::size_t max_output_bytes{1u << 20}; ///< per captured stream
};

/** Outcome of run_process(). */
struct ProcessResult {
  int exit_code{-1}; ///< 124 on timeout, 128+N when killed by signal N
  bool timed_out{false};
  std::string spawn_error; ///< non-empty when the program never ran
  std::string stdout_text; ///< empty when redirected to a file
  std::string stderr_text;
  bool stdout_truncated{false};
  bool stderr_truncated{false};

  /// Exited normally with status zero.
  bool ok() const { return spawn_error.empty() && !timed_out && exit_code == 0; }
};

/**
 * Run a subprocess to completion.
 *
 * The child runs in its own session so a timeout can kill the whole process
 * group. Captured streams are truncated at ProcessSpec::max_output_bytes.
 *
 * @param spec Invocation description.
 * @return Exit status and captured output. Failures to start are reported
 *         through ProcessResult::spawn_error rather than thrown.
 */
ProcessResult run_process(const ProcessSpec &spec);

/// Render argv as a shell-like string for logs and diagnostics.
std::string join_command(const std::vector<std::string> &argv);

/// Best available one-line diagnostic for a failed run.
std::string describe_failure(const ProcessResult &result);

} // namespace prv

#endif // PATCHREVIEW_PROCESS_HPP
