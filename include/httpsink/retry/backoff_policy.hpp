#ifndef HTTPSINK_RETRY_BACKOFF_POLICY_HPP
#define HTTPSINK_RETRY_BACKOFF_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace httpsink {

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Delay before a retry. Implementations are pure: the same attempt index
// always yields the same delay, so a scheduler can be queried ahead of time
// (the engine checks elapsed + next delay against the deadline).

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;

    // attempt: 0-indexed retry number (0 = first retry after initial failure)
    [[nodiscard]] virtual std::chrono::milliseconds next_delay(std::size_t attempt) const = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// ExponentialBackoff
// ─────────────────────────────────────────────────────────────────────────────
// delay = min(base * multiplier^attempt, max)
//
// Default: 500ms base, doubling, uncapped:
//   Attempt 0: 500ms
//   Attempt 1: 1000ms
//   Attempt 2: 2000ms
//   Attempt 3: 4000ms

class ExponentialBackoff : public IBackoffPolicy {
public:
    ExponentialBackoff()
        : ExponentialBackoff(std::chrono::milliseconds{500}, 2.0) {}

    ExponentialBackoff(
        std::chrono::milliseconds base,
        double multiplier,
        std::chrono::milliseconds max = std::chrono::milliseconds::max()
    )
        : base_(base)
        , multiplier_(multiplier)
        , max_(max)
    {}

    [[nodiscard]] std::chrono::milliseconds next_delay(std::size_t attempt) const override {
        const double exponent = static_cast<double>(attempt);
        const double base_ms = static_cast<double>(base_.count());
        const double delay_ms = base_ms * std::pow(multiplier_, exponent);

        const double max_ms = static_cast<double>(max_.count());
        const double capped_ms = std::min(delay_ms, max_ms);
        if (capped_ms >= max_ms) {
            return max_;
        }

        const auto result_ms = static_cast<std::int64_t>(std::max(0.0, capped_ms));
        return std::chrono::milliseconds{result_ms};
    }

    [[nodiscard]] std::chrono::milliseconds base() const noexcept {
        return base_;
    }

private:
    std::chrono::milliseconds base_;
    double multiplier_;
    std::chrono::milliseconds max_;
};

// ─────────────────────────────────────────────────────────────────────────────
// FixedBackoff
// ─────────────────────────────────────────────────────────────────────────────
// Same delay for every attempt (the "linear" retry policy).

class FixedBackoff : public IBackoffPolicy {
public:
    explicit FixedBackoff(std::chrono::milliseconds delay)
        : delay_(delay) {}

    [[nodiscard]] std::chrono::milliseconds next_delay(std::size_t /*attempt*/) const override {
        return delay_;
    }

private:
    std::chrono::milliseconds delay_;
};

// ─────────────────────────────────────────────────────────────────────────────
// NoBackoff
// ─────────────────────────────────────────────────────────────────────────────
// Zero delay; for tests that exercise retry counts without waiting.

class NoBackoff : public IBackoffPolicy {
public:
    [[nodiscard]] std::chrono::milliseconds next_delay(std::size_t /*attempt*/) const override {
        return std::chrono::milliseconds{0};
    }
};

}  // namespace httpsink

#endif  // HTTPSINK_RETRY_BACKOFF_POLICY_HPP
