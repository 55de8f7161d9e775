/**
 * @file errors.hpp
 * @brief Exception taxonomy shared by the review pipeline.
 *
 * Validation failures are rejected before a request enters the queue,
 * preparation failures abort a single request, review failures are scoped to
 * one patch and storage or configuration failures are fatal for the process.
 */

#ifndef PATCHREVIEW_ERRORS_HPP
#define PATCHREVIEW_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace prv {

/// Malformed submission; never reaches the pipeline.
class ValidationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * Git level failure while realizing a request's origin (fetch, apply,
 * checkout, indexing). Fatal for the whole request.
 */
class PreparationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Base class for failures of a single reviewer invocation.
class ReviewError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// The reviewer subprocess exceeded its configured timeout.
class ReviewTimeoutError : public ReviewError {
public:
  using ReviewError::ReviewError;
};

/// The reviewer subprocess could not be started or exited non-zero.
class ReviewExecutionError : public ReviewError {
public:
  /**
   * Construct an execution error.
   *
   * @param message Diagnostic assembled from the captured output.
   * @param exit_code Exit status reported by the subprocess (-1 if it never
   *        ran).
   */
  explicit ReviewExecutionError(const std::string &message, int exit_code = -1)
      : ReviewError(message), exit_code_(exit_code) {}

  /// Exit status of the failed invocation.
  int exit_code() const noexcept { return exit_code_; }

private:
  int exit_code_;
};

/**
 * Durable write or read of review state failed. Losing a completed review is
 * worse than crashing, so callers treat this as fatal.
 */
class StorageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Invalid or unusable configuration detected at start-up.
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Connection level failure that is worth retrying.
class TransientNetworkError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Non-2xx HTTP response.
class HttpStatusError : public std::runtime_error {
public:
  HttpStatusError(int status_code, const std::string &message)
      : std::runtime_error(message), status(status_code) {}

  int status; ///< HTTP status code returned by the server
};

} // namespace prv

#endif // PATCHREVIEW_ERRORS_HPP
