/**
 * @file review_request.hpp
 * @brief Review request and patch entities.
 *
 * A ReviewRequest is one submitted unit of work. Its origin is a variant over
 * the four ways a series of patches can be described; submissions are
 * validated into requests before they enter the queue.
 */

#ifndef PATCHREVIEW_REVIEW_REQUEST_HPP
#define PATCHREVIEW_REVIEW_REQUEST_HPP

#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace prv {

/// Stored lifecycle of a request.
enum class ReviewStatus { Queued, SetupInProgress, Reviewing, Done, Error };

/// Result state of a single patch.
enum class PatchState { Pending, Skipped, Done, Error };

std::string to_string(ReviewStatus status);
std::string to_string(PatchState state);

/**
 * Parse a stored status string.
 *
 * @throws std::invalid_argument for unknown names.
 */
ReviewStatus parse_review_status(const std::string &name);

/// Parse a stored patch state string; throws std::invalid_argument.
PatchState parse_patch_state(const std::string &name);

/// Done and error are terminal.
bool is_terminal(ReviewStatus status);

/// Review of a single commit.
struct CommitOrigin {
  std::string hash;
};

/// Review of every commit in `base..tip`.
struct RangeOrigin {
  std::string base;
  std::string tip;
};

/// Review of an externally hosted patch series.
struct SeriesOrigin {
  std::string series_id;
};

/// Review of literal mail formatted patch bodies applied in order.
struct PatchesOrigin {
  std::vector<std::string> bodies;
};

using Origin =
    std::variant<CommitOrigin, RangeOrigin, SeriesOrigin, PatchesOrigin>;

/// "commit", "range", "series" or "patches".
std::string origin_kind(const Origin &origin);

/// Human readable origin ("abc123", "v1..v2", "series 42", "3 patches").
std::string describe_origin(const Origin &origin);

/**
 * Number of patches implied by @p origin before any git work.
 *
 * @return Count for commit and literal origins, empty for range and series.
 */
std::optional<std::size_t> known_patch_count(const Origin &origin);

/**
 * Raw submission as received at the boundary. Every field is optional so
 * validation can report exactly what is missing or conflicting.
 */
struct ReviewSubmission {
  std::string tree;
  std::string branch;
  std::optional<std::string> hash;  ///< single commit or "base..tip"
  std::optional<std::string> range; ///< explicit "base..tip"
  std::optional<std::string> series_id;
  std::optional<std::vector<std::string>> patches;
  std::optional<std::vector<bool>> mask;

  /**
   * Read a submission from JSON. Accepts the keys `tree`, `branch`, `hash`,
   * `range`, `series` (or `patchwork_series_id`), `patches` and `mask`.
   *
   * @throws ValidationError when a key has the wrong type.
   */
  static ReviewSubmission from_json(const nlohmann::json &j);
};

/**
 * A validated review request.
 */
struct ReviewRequest {
  std::string id;
  std::string owner;
  std::string tree;
  std::string branch; ///< empty selects the remote's default branch
  Origin origin;
  std::vector<bool> mask; ///< empty means "review everything"
  std::string submitted_at;
  std::size_t estimated_patches{1}; ///< used for queue position reporting

  /// True when patch @p index (1-based) is masked out.
  bool is_skipped(std::size_t index) const;

  /// Whether the mask, if any, covers exactly @p patch_count patches.
  bool mask_matches(std::size_t patch_count) const;

  nlohmann::json to_json() const;

  /**
   * Rebuild a request persisted with to_json().
   *
   * @throws ValidationError when the document is malformed.
   */
  static ReviewRequest from_json(const nlohmann::json &j);
};

/// Safe git remote name: `[A-Za-z0-9._/-]+` without "..".
bool is_valid_tree_name(const std::string &tree);

/**
 * Validate a submission and turn it into a request with a fresh identity.
 *
 * @param submission Raw submission.
 * @param owner Owning principal recorded with the request.
 * @return Request ready to be enqueued.
 * @throws ValidationError when zero or several origins are given, the tree is
 *         missing or unsafe, or a known patch count disagrees with the mask.
 */
ReviewRequest validate_submission(const ReviewSubmission &submission,
                                  const std::string &owner);

} // namespace prv

#endif // PATCHREVIEW_REVIEW_REQUEST_HPP
