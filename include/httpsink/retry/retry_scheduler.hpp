#pragma once

#include "httpsink/retry/backoff_policy.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string_view>
#include <optional>

namespace httpsink {

enum class RetryPolicyKind {
    Linear,      // Fixed interval between attempts
    Exponential  // 500ms, doubling
};

[[nodiscard]] constexpr std::string_view to_string(RetryPolicyKind kind) noexcept {
    switch (kind) {
        case RetryPolicyKind::Linear:      return "linear";
        case RetryPolicyKind::Exponential: return "exponential";
    }
    return "exponential";
}

[[nodiscard]] std::optional<RetryPolicyKind> parse_retry_policy_kind(std::string_view name);

// ─────────────────────────────────────────────────────────────────────────────
// RetryScheduler
// ─────────────────────────────────────────────────────────────────────────────
// Pairs a backoff policy with the maximum total retry duration of one flush.
// Stateless: attempt counting and elapsed time live in the engine's loop.

class RetryScheduler {
public:
    RetryScheduler(std::shared_ptr<const IBackoffPolicy> backoff,
                   std::chrono::milliseconds max_duration);

    /// Exponential (500ms base, doubling) bounded by max_duration.
    [[nodiscard]] static RetryScheduler exponential(std::chrono::milliseconds max_duration);

    /// Constant interval bounded by max_duration.
    [[nodiscard]] static RetryScheduler fixed(std::chrono::milliseconds interval,
                                              std::chrono::milliseconds max_duration);

    [[nodiscard]] std::chrono::milliseconds next_delay(std::size_t attempt_index) const;

    [[nodiscard]] bool has_exceeded_deadline(std::chrono::milliseconds elapsed) const noexcept {
        return elapsed > max_duration_;
    }

    /// True when waiting next_delay(attempt_index) after elapsed stays in budget.
    [[nodiscard]] bool can_retry(std::chrono::milliseconds elapsed,
                                 std::size_t attempt_index) const;

    [[nodiscard]] std::chrono::milliseconds max_duration() const noexcept {
        return max_duration_;
    }

private:
    std::shared_ptr<const IBackoffPolicy> backoff_;
    std::chrono::milliseconds max_duration_;
};

}  // namespace httpsink
