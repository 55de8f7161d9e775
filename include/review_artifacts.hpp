/**
 * @file review_artifacts.hpp
 * @brief On-disk layout of review results.
 *
 * @code
 * <results>/<owner>/<review_id>/message
 * <results>/<owner>/<review_id>/<n>/patch
 * <results>/<owner>/<review_id>/<n>/review.json
 * <results>/<owner>/<review_id>/<n>/review.md
 * <results>/<owner>/<review_id>/<n>/review-inline.txt
 * @endcode
 */
#ifndef PATCHREVIEW_REVIEW_ARTIFACTS_HPP
#define PATCHREVIEW_REVIEW_ARTIFACTS_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace prv {

/// Review document flavours that can be read back.
enum class ReviewFormat { Json, Markdown, Inline };

/**
 * Parse a format name: "json", "markup" (or "md"/"markdown"), "inline".
 *
 * @throws std::invalid_argument for anything else.
 */
ReviewFormat parse_review_format(const std::string &name);

/// File name holding @p format inside a patch directory.
const char *review_file_name(ReviewFormat format);

/**
 * Paths and I/O helpers for the results directory.
 *
 * Write failures raise StorageError since a lost result must not go
 * unnoticed.
 */
class ReviewArtifacts {
public:
  explicit ReviewArtifacts(std::filesystem::path root);

  const std::filesystem::path &root() const { return root_; }

  std::filesystem::path review_dir(const std::string &owner,
                                   const std::string &id) const;
  std::filesystem::path patch_dir(const std::string &owner,
                                  const std::string &id,
                                  std::size_t index) const;

  /// Create the review directory.
  void create_review_dir(const std::string &owner, const std::string &id) const;

  /// Create (if needed) and return the directory of patch @p index.
  std::filesystem::path ensure_patch_dir(const std::string &owner,
                                         const std::string &id,
                                         std::size_t index) const;

  void write_message(const std::string &owner, const std::string &id,
                     const std::string &message) const;
  std::optional<std::string> read_message(const std::string &owner,
                                          const std::string &id) const;

  /// Store the patch text the review was produced from.
  void write_patch_input(const std::string &owner, const std::string &id,
                         std::size_t index, const std::string &content) const;

  std::filesystem::path review_file(const std::string &owner,
                                    const std::string &id, std::size_t index,
                                    ReviewFormat format) const;

  /// Contents of a review document, empty when it does not exist.
  std::optional<std::string> read_review(const std::string &owner,
                                         const std::string &id,
                                         std::size_t index,
                                         ReviewFormat format) const;

  /// Path of a per-attempt diagnostic such as "reviewer-stderr-attempt2.txt".
  std::filesystem::path diagnostic_path(const std::string &owner,
                                        const std::string &id,
                                        std::size_t index,
                                        const std::string &name) const;

private:
  std::filesystem::path root_;
};

/// Replace characters that are unsafe in a single path component.
std::string safe_path_component(const std::string &name);

/// Write @p content to @p path, raising StorageError on failure.
void write_text_file(const std::filesystem::path &path,
                     const std::string &content);

/// Read a whole file, empty when it cannot be opened.
std::optional<std::string> read_text_file(const std::filesystem::path &path);

} // namespace prv

#endif // PATCHREVIEW_REVIEW_ARTIFACTS_HPP
