/**
 * @file log.hpp
 * @brief Leveled diagnostics on stderr.
 *
 * Lines are written as "<UTC timestamp> <LEVEL> <message>". A single
 * process-wide level gates output; messages above it are discarded before
 * formatting.
 */

#ifndef TEMPEST_LOG_HPP
#define TEMPEST_LOG_HPP

#include <cstdarg>
#include <string_view>

#include "error.hpp"

namespace tempest {

/**
 * @brief Log verbosity levels, most severe first.
 */
enum class LogLevel {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

/**
 * @brief Parse a level name ("error", "warn", "info", "debug").
 *
 * @param name Level name, case-sensitive
 * @param[out] level Parsed level
 * @return Error::Ok, or Error::InvalidArg for an unknown name
 */
Error parse_log_level(std::string_view name, LogLevel& level) noexcept;

void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

void log_message(LogLevel level, const char* fmt, va_list args);

} // namespace tempest

#endif // TEMPEST_LOG_HPP
