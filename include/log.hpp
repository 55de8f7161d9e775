/**
 * @file log.hpp
 * @brief Logging setup for patchreview.
 *
 * All loggers are asynchronous spdlog loggers sharing one thread pool and the
 * sinks of the default "prv" logger. Each subsystem logs through a category
 * logger named "prv.<category>" whose level can be overridden independently.
 */

#ifndef PATCHREVIEW_LOG_HPP
#define PATCHREVIEW_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace prv {

/** Output configuration for the default logger. */
struct LogSettings {
  spdlog::level::level_enum level{spdlog::level::info};
  std::string pattern;       ///< spdlog pattern; empty keeps the default
  std::string file;          ///< Optional log file path
  std::size_t rotate_files{3};        ///< Rotated files kept (0 = no rotation)
  std::size_t max_file_size{5u << 20}; ///< Rotation threshold in bytes
  bool compress_rotations{false};     ///< gzip files once rotated out
};

/**
 * Create (or reconfigure) the default logger.
 *
 * The console sink is always attached. When @p settings names a file a
 * rotating sink is attached as well; with compression enabled each rotated
 * file is gzip'ed before the sink reopens the active file.
 *
 * @param settings Output configuration.
 */
void init_logger(const LogSettings &settings);

/**
 * Retrieve or lazily create the logger for @p category.
 *
 * @param category Subsystem name such as "queue" or "reviewer".
 * @return Shared category logger writing to the default sinks.
 */
std::shared_ptr<spdlog::logger> category_logger(const std::string &category);

/**
 * Apply level overrides to category loggers.
 *
 * @param overrides Category name to level.
 */
void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides);

/// Initialize the default logger with console output if nobody did yet.
void ensure_default_logger();

/**
 * Parse a level name ("trace" ... "off").
 *
 * @param name Level name, case sensitive as spdlog expects.
 * @param fallback Level returned for unknown names.
 */
spdlog::level::level_enum parse_log_level(const std::string &name,
                                          spdlog::level::level_enum fallback);

} // namespace prv

#endif // PATCHREVIEW_LOG_HPP
