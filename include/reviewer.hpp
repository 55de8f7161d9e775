/**
 * @file reviewer.hpp
 * @brief Invocation of the external reviewer on one snapshot.
 */

#ifndef PATCHREVIEW_REVIEWER_HPP
#define PATCHREVIEW_REVIEWER_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace prv {

/** Everything a reviewer needs to know about one attempt. */
struct ReviewJob {
  std::string review_id;
  std::size_t patch_index{0}; ///< 1-based
  std::string commit;
  std::filesystem::path workdir;   ///< snapshot checked out at @ref commit
  std::filesystem::path patch_dir; ///< where review documents are written
  int attempt{1};                  ///< 1-based attempt number
};

/**
 * Abstract reviewer.
 *
 * A successful call leaves `review.json` and `review.md` in the job's patch
 * directory. Implementations must be safe to call from several reviewer
 * workers at once.
 */
class Reviewer {
public:
  virtual ~Reviewer() = default;

  /**
   * Review the top commit of @p job.workdir.
   *
   * @throws ReviewTimeoutError when the reviewer ran out of time.
   * @throws ReviewExecutionError for every other failure of the attempt.
   */
  virtual void review(const ReviewJob &job) = 0;
};

/** Settings of the command line reviewer. */
struct ReviewerSettings {
  /// argv template; "{workdir}", "{prompt}", "{commit}" and "{patch_dir}"
  /// are replaced per job.
  std::vector<std::string> command;
  std::filesystem::path prompt_dir; ///< copied into every snapshot
  std::string prompt_file{"review-prompt.md"};
  std::chrono::milliseconds timeout{std::chrono::seconds(800)};
  std::map<std::string, std::string> env;
};

/**
 * Reviewer that runs a configurable subprocess in the snapshot.
 *
 * Standard output is streamed to `review.json` and converted to `review.md`
 * afterwards. A `review-inline.txt` left behind in the snapshot is copied to
 * the patch directory. Failed attempts leave their stderr, timeout details
 * and partial output next to the results, suffixed with the attempt number.
 */
class CommandReviewer : public Reviewer {
public:
  /// @throws ConfigError when the command template is empty.
  explicit CommandReviewer(ReviewerSettings settings);

  void review(const ReviewJob &job) override;

  /// argv for @p job with every placeholder substituted.
  std::vector<std::string> expand_command(const ReviewJob &job,
                                          const std::string &prompt) const;

  const ReviewerSettings &settings() const { return settings_; }

private:
  std::filesystem::path install_prompt(const std::filesystem::path &workdir) const;
  void save_partial_output(const ReviewJob &job) const;

  ReviewerSettings settings_;
};

/// Replace every "{name}" in @p text with the mapped value.
std::string substitute_placeholders(
    const std::string &text, const std::map<std::string, std::string> &values);

} // namespace prv

#endif // PATCHREVIEW_REVIEWER_HPP
