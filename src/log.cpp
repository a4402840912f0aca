/**
 * @file log.cpp
 * @brief Leveled diagnostics on stderr.
 */

#include <tempest/log.hpp>

#include <atomic>
#include <cstdio>
#include <ctime>
#include <string>

namespace tempest {

namespace {

constexpr std::size_t MAX_MESSAGE_LEN = 1024;

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

const char* level_name(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Warn:
        return "WARN ";
    case LogLevel::Info:
        return "INFO ";
    case LogLevel::Debug:
        return "DEBUG";
    default:
        return "?????";
    }
}

} // namespace

void set_log_level(LogLevel level) noexcept {
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() noexcept {
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

Error parse_log_level(std::string_view name, LogLevel& level) noexcept {
    if (name == "error") {
        level = LogLevel::Error;
    } else if (name == "warn") {
        level = LogLevel::Warn;
    } else if (name == "info") {
        level = LogLevel::Info;
    } else if (name == "debug") {
        level = LogLevel::Debug;
    } else {
        return Error::InvalidArg;
    }
    return Error::Ok;
}

void log_message(LogLevel level, const char* fmt, va_list args) {
    if (static_cast<int>(level) > g_level.load(std::memory_order_relaxed)) {
        return;
    }

    char buffer[MAX_MESSAGE_LEN];
    va_list retry;
    va_copy(retry, args);
    int n = std::vsnprintf(buffer, sizeof(buffer), fmt, args);
    if (n < 0) {
        va_end(retry);
        std::fprintf(stderr, "%s formatting error\n", level_name(level));
        return;
    }

    // Metric dumps and raw message renderings can outgrow the stack buffer
    std::string long_message;
    const char* message = buffer;
    if (static_cast<std::size_t>(n) >= sizeof(buffer)) {
        long_message.resize(static_cast<std::size_t>(n) + 1);
        std::vsnprintf(long_message.data(), long_message.size(), fmt, retry);
        long_message.resize(static_cast<std::size_t>(n));
        message = long_message.c_str();
    }
    va_end(retry);

    std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%SZ", &utc);

    std::fprintf(stderr, "%s %s %s\n", stamp, level_name(level), message);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(LogLevel::Error, fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(LogLevel::Warn, fmt, args);
    va_end(args);
}

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(LogLevel::Info, fmt, args);
    va_end(args);
}

void log_debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(LogLevel::Debug, fmt, args);
    va_end(args);
}

} // namespace tempest
