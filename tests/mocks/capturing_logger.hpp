#ifndef HTTPSINK_TESTS_MOCKS_CAPTURING_LOGGER_HPP
#define HTTPSINK_TESTS_MOCKS_CAPTURING_LOGGER_HPP

#include "httpsink/log/logger.hpp"

#include <memory>
#include <string>
#include <vector>

namespace httpsink::testing {

struct CapturedLog {
    LogLevel level;
    std::string component;
    std::string message;
};

// ─────────────────────────────────────────────────────────────────────────────
// CapturingLogger - Records log events for verification
// ─────────────────────────────────────────────────────────────────────────────

class CapturingLogger final : public ILogger {
public:
    explicit CapturingLogger(std::shared_ptr<std::vector<CapturedLog>> sink,
                             LogLevel min_level = LogLevel::Trace)
        : sink_(std::move(sink))
        , min_level_(min_level)
    {}

    void log(const LogRecord& record) override {
        sink_->push_back(CapturedLog{record.level, std::string(record.component), record.message});
    }

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return level != LogLevel::Off &&
               static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
    }

private:
    std::shared_ptr<std::vector<CapturedLog>> sink_;
    LogLevel min_level_;
};

// Installs a CapturingLogger for the lifetime of the scope, then restores
// the NullLogger.
class ScopedLogCapture {
public:
    explicit ScopedLogCapture(LogLevel min_level = LogLevel::Trace)
        : logs_(std::make_shared<std::vector<CapturedLog>>())
    {
        set_logger(std::make_unique<CapturingLogger>(logs_, min_level));
    }

    ~ScopedLogCapture() {
        set_logger(nullptr);
    }

    ScopedLogCapture(const ScopedLogCapture&) = delete;
    ScopedLogCapture& operator=(const ScopedLogCapture&) = delete;

    [[nodiscard]] const std::vector<CapturedLog>& logs() const noexcept {
        return *logs_;
    }

    [[nodiscard]] std::size_t count(LogLevel level) const {
        std::size_t n = 0;
        for (const auto& entry : *logs_) {
            if (entry.level == level) {
                ++n;
            }
        }
        return n;
    }

    [[nodiscard]] bool any_contains(const std::string& text) const {
        for (const auto& entry : *logs_) {
            if (entry.message.find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

private:
    std::shared_ptr<std::vector<CapturedLog>> logs_;
};

}  // namespace httpsink::testing

#endif  // HTTPSINK_TESTS_MOCKS_CAPTURING_LOGGER_HPP
