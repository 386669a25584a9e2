#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace httpsink {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Request and response details
    Debug = 1,  // Flush start, credential refresh
    Info  = 2,  // Retries and delivered batches
    Warn  = 3,  // Network failures that will be retried
    Error = 4,  // Terminal delivery failures
    Off   = 5
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Case-insensitive; accepts "warning" for Warn.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

// ─────────────────────────────────────────────────────────────────────────────
// Log Record
// ─────────────────────────────────────────────────────────────────────────────
// component names the emitting subsystem ("delivery", "auth", "writer", ...)
// so a backend can tag or filter on it.

struct LogRecord {
    LogLevel level;
    std::string_view component;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string_view comp,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , component(comp)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger Interface
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void write(
        LogLevel level,
        std::string_view component,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) {
        if (should_log(level)) {
            log(LogRecord(level, component, std::move(message), loc));
        }
    }

    template<typename... Args>
    void debug_fmt(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Debug)) {
            log(LogRecord(LogLevel::Debug, component, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void info_fmt(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Info)) {
            log(LogRecord(LogLevel::Info, component, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void warn_fmt(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Warn)) {
            log(LogRecord(LogLevel::Warn, component, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void error_fmt(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Error)) {
            log(LogRecord(LogLevel::Error, component, std::format(fmt, std::forward<Args>(args)...)));
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger
// ─────────────────────────────────────────────────────────────────────────────
// Default backend. should_log() is always false, so the macros below never
// format a message.

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────

/// Process-wide logger (NullLogger until set_logger() installs one).
[[nodiscard]] ILogger& get_logger() noexcept;

/// Install a backend. nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// Format arguments are only evaluated when the level is enabled.
// Usage: HTTPSINK_LOG_INFO("delivery", "retry {} in {}ms", attempt, delay.count());

#define HTTPSINK_LOG_AT(level, component, ...) \
    do { \
        auto& httpsink_logger_ = ::httpsink::get_logger(); \
        if (httpsink_logger_.should_log(level)) { \
            httpsink_logger_.write(level, component, std::format(__VA_ARGS__)); \
        } \
    } while (false)

#define HTTPSINK_LOG_TRACE(component, ...) HTTPSINK_LOG_AT(::httpsink::LogLevel::Trace, component, __VA_ARGS__)
#define HTTPSINK_LOG_DEBUG(component, ...) HTTPSINK_LOG_AT(::httpsink::LogLevel::Debug, component, __VA_ARGS__)
#define HTTPSINK_LOG_INFO(component, ...)  HTTPSINK_LOG_AT(::httpsink::LogLevel::Info, component, __VA_ARGS__)
#define HTTPSINK_LOG_WARN(component, ...)  HTTPSINK_LOG_AT(::httpsink::LogLevel::Warn, component, __VA_ARGS__)
#define HTTPSINK_LOG_ERROR(component, ...) HTTPSINK_LOG_AT(::httpsink::LogLevel::Error, component, __VA_ARGS__)

}  // namespace httpsink
