/**
 * @file ids.hpp
 * @brief Identifier and timestamp helpers.
 */
#ifndef PATCHREVIEW_UTIL_IDS_HPP
#define PATCHREVIEW_UTIL_IDS_HPP

#include <chrono>
#include <string>

namespace prv {

/// Random RFC 4122 version 4 identifier in canonical dashed form.
std::string generate_uuid();

/// True when @p text is a canonical lowercase or uppercase dashed UUID.
bool is_uuid(const std::string &text);

/**
 * Format a time point as an ISO-8601 UTC timestamp ("2024-05-01T12:00:00Z").
 *
 * @param tp Time point to format.
 * @return Second resolution UTC timestamp.
 */
std::string iso_timestamp(std::chrono::system_clock::time_point tp);

/// iso_timestamp() of the current time.
std::string now_timestamp();

} // namespace prv

#endif // PATCHREVIEW_UTIL_IDS_HPP
