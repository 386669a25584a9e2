#ifndef HTTPSINK_ERRORS_HPP
#define HTTPSINK_ERRORS_HPP

#include <tl/expected.hpp>

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace httpsink {

// ─────────────────────────────────────────────────────────────────────────────
// Error Categories
// ─────────────────────────────────────────────────────────────────────────────

enum class ErrorCategory {
    Configuration,      ///< Malformed URL, invalid regex, bad enum value, missing field
    TransientDelivery,  ///< Network failure or retryable status (only seen before exhaustion)
    TerminalDelivery,   ///< FAIL action or retry deadline exceeded
    Encoding            ///< Charset or placeholder substitution failure
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::Configuration:     return "ConfigurationError";
        case ErrorCategory::TransientDelivery: return "TransientDeliveryError";
        case ErrorCategory::TerminalDelivery:  return "TerminalDeliveryError";
        case ErrorCategory::Encoding:          return "EncodingError";
    }
    return "UnknownError";
}

// ─────────────────────────────────────────────────────────────────────────────
// SinkError
// ─────────────────────────────────────────────────────────────────────────────

struct SinkError {
    ErrorCategory category{ErrorCategory::Configuration};
    std::string message;
    std::optional<int> http_status;  // Last HTTP status, if a response was received
    std::string url;                 // Target URL of the failed delivery
    std::size_t attempts{0};         // Send attempts made during the flush

    [[nodiscard]] static SinkError configuration(std::string msg) {
        return {ErrorCategory::Configuration, std::move(msg), std::nullopt, {}, 0};
    }

    [[nodiscard]] static SinkError encoding(std::string msg) {
        return {ErrorCategory::Encoding, std::move(msg), std::nullopt, {}, 0};
    }

    [[nodiscard]] static SinkError transient(std::string msg) {
        return {ErrorCategory::TransientDelivery, std::move(msg), std::nullopt, {}, 0};
    }

    [[nodiscard]] static SinkError terminal(
        std::string msg,
        std::optional<int> status,
        std::string target_url,
        std::size_t attempt_count
    ) {
        return {ErrorCategory::TerminalDelivery, std::move(msg), status,
                std::move(target_url), attempt_count};
    }

    [[nodiscard]] bool is_configuration() const noexcept {
        return category == ErrorCategory::Configuration;
    }

    [[nodiscard]] bool is_terminal() const noexcept {
        return category == ErrorCategory::TerminalDelivery;
    }

    // Human-readable form including the delivery context when present.
    [[nodiscard]] std::string describe() const;
};

template <typename T>
using SinkResult = tl::expected<T, SinkError>;

// ─────────────────────────────────────────────────────────────────────────────
// SinkException
// ─────────────────────────────────────────────────────────────────────────────
// Thrown across the host boundary (HttpSinkWriter) so the pipeline can fail
// the record set. Everything below the writer returns SinkResult instead.

class SinkException : public std::runtime_error {
public:
    explicit SinkException(SinkError error)
        : std::runtime_error(error.describe())
        , error_(std::move(error))
    {}

    [[nodiscard]] const SinkError& error() const noexcept {
        return error_;
    }

    [[nodiscard]] ErrorCategory category() const noexcept {
        return error_.category;
    }

private:
    SinkError error_;
};

}  // namespace httpsink

#endif  // HTTPSINK_ERRORS_HPP
