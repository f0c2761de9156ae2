/**
 * @file Logging.hpp
 * @brief Access to the "docpatch" spdlog logger
 */

#ifndef DOCPATCH_LOGGING_HPP
#define DOCPATCH_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <memory>

namespace docpatch {

/// Name under which the library logger is registered with spdlog.
inline constexpr const char* kLoggerName = "docpatch";

/**
 * @brief Get the library logger
 *
 * Returns the logger registered as "docpatch". If the application has not
 * registered one, a logger writing to stderr is created and registered on
 * first use, with its level taken from the SPDLOG_LEVEL environment
 * variable (default: warn).
 *
 * Applications that want the output elsewhere register their own
 * spdlog::logger named "docpatch" before calling into the library.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the level of the library logger
 *
 * Used by the CLI for --verbose.
 */
void set_log_level(spdlog::level::level_enum level);

} // namespace docpatch

#endif // DOCPATCH_LOGGING_HPP
