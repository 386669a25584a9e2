#include "httpsink/log/logger.hpp"
#include "httpsink/http/http_types.hpp"

#include <mutex>

namespace httpsink {

std::optional<LogLevel> parse_log_level(std::string_view name) {
    if (iequals(name, "trace"))   return LogLevel::Trace;
    if (iequals(name, "debug"))   return LogLevel::Debug;
    if (iequals(name, "info"))    return LogLevel::Info;
    if (iequals(name, "warn"))    return LogLevel::Warn;
    if (iequals(name, "warning")) return LogLevel::Warn;
    if (iequals(name, "error"))   return LogLevel::Error;
    if (iequals(name, "off"))     return LogLevel::Off;
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────
// Install the backend before creating writers; replacing it while a flush is
// logging is not supported.

namespace {

std::unique_ptr<ILogger>& logger_instance() {
    static std::unique_ptr<ILogger> instance = std::make_unique<NullLogger>();
    return instance;
}

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

ILogger& get_logger() noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    return *logger_instance();
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    if (logger == nullptr) {
        logger_instance() = std::make_unique<NullLogger>();
        return;
    }
    logger_instance() = std::move(logger);
}

}  // namespace httpsink
