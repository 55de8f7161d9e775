/**
 * @file duration.hpp
 * @brief Human-readable duration parsing utilities.
 *
 * Provides functions to parse duration strings (e.g. "250ms", "800s", "13m20s")
 * into std::chrono::milliseconds for timeouts read from configuration and the
 * command line.
 */
#ifndef PATCHREVIEW_UTIL_DURATION_HPP
#define PATCHREVIEW_UTIL_DURATION_HPP

#include <chrono>
#include <string>

namespace prv {

/**
 * Parse a human-readable duration string into milliseconds.
 *
 * Supported units are "ms", "s", "m", "h" and "d"; several number/unit pairs
 * can be combined ("1h30m"). A pure number is interpreted as seconds.
 *
 * @param str Duration string; empty string returns zero.
 * @return Parsed duration.
 * @throws std::runtime_error if an invalid format or suffix is provided.
 */
std::chrono::milliseconds parse_duration(const std::string &str);

/**
 * Format a duration the way parse_duration accepts it ("13m20s", "250ms").
 *
 * @param value Duration to format.
 * @return Compact duration string, "0s" for zero.
 */
std::string format_duration(std::chrono::milliseconds value);

} // namespace prv

#endif // PATCHREVIEW_UTIL_DURATION_HPP
