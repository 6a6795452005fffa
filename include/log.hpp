/**
 * @file log.hpp
 * @brief Logging utilities for autopullreview.
 *
 * Declares logger initialization, category loggers, and log category
 * configuration.
 */

#ifndef AUTOPULLREVIEW_LOG_HPP
#define AUTOPULLREVIEW_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace apr {

/**
 * Initialize the global logger with a console sink and an optional file sink.
 *
 * @param level Logging verbosity level to use for all loggers.
 * @param pattern Log message pattern. Provide an empty string to keep the
 *        underlying spdlog default.
 * @param file Optional log file path. When empty no file output is
 *        configured.
 * @param rotate_files Maximum number of rotated files to retain when @p file
 *        is provided. Zero writes a single non-rotating file.
 */
void init_logger(spdlog::level::level_enum level,
                 const std::string &pattern = "", const std::string &file = "",
                 std::size_t rotate_files = 3);

/**
 * Retrieve or create a logger dedicated to a specific category.
 *
 * Category loggers share sinks with the default logger so messages appear in
 * the same destinations while allowing per-category level overrides.
 *
 * @param category Category name, registered as `apr.<category>`.
 * @return Shared pointer to the category logger.
 */
std::shared_ptr<spdlog::logger> category_logger(const std::string &category);

/**
 * Apply log level overrides for specific categories.
 *
 * @param overrides Mapping of category name to desired log level.
 */
void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides);

/**
 * Ensure a default logger exists before logging.
 *
 * Library code may log before the application called init_logger(); this
 * creates an info level logger on demand.
 */
void ensure_default_logger();

} // namespace apr

#endif // AUTOPULLREVIEW_LOG_HPP
