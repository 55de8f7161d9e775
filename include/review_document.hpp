/**
 * @file review_document.hpp
 * @brief Conversion of the reviewer's stream-json output into markdown.
 */
#ifndef PATCHREVIEW_REVIEW_DOCUMENT_HPP
#define PATCHREVIEW_REVIEW_DOCUMENT_HPP

#include <filesystem>
#include <istream>
#include <string>

namespace prv {

/**
 * Concatenate the text carried by a stream-json transcript.
 *
 * Each line is one JSON object. Text blocks of `assistant` messages and the
 * text of `content_block_delta` events are kept in order; blank and malformed
 * lines are skipped.
 *
 * @param in Transcript stream.
 * @return Extracted text, possibly empty.
 */
std::string extract_review_text(std::istream &in);

/**
 * Convert the transcript at @p json_path and write it to @p markdown_path.
 *
 * @return Number of characters written.
 * @throws StorageError when either file cannot be accessed.
 */
std::size_t convert_review_document(const std::filesystem::path &json_path,
                                    const std::filesystem::path &markdown_path);

} // namespace prv

#endif // PATCHREVIEW_REVIEW_DOCUMENT_HPP
