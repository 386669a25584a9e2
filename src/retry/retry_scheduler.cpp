#include "httpsink/retry/retry_scheduler.hpp"
#include "httpsink/http/http_types.hpp"

namespace httpsink {

std::optional<RetryPolicyKind> parse_retry_policy_kind(std::string_view name) {
    if (iequals(name, "linear"))      return RetryPolicyKind::Linear;
    if (iequals(name, "exponential")) return RetryPolicyKind::Exponential;
    return std::nullopt;
}

RetryScheduler::RetryScheduler(std::shared_ptr<const IBackoffPolicy> backoff,
                               std::chrono::milliseconds max_duration)
    : backoff_(backoff ? std::move(backoff) : std::make_shared<ExponentialBackoff>())
    , max_duration_(max_duration)
{}

RetryScheduler RetryScheduler::exponential(std::chrono::milliseconds max_duration) {
    return RetryScheduler(std::make_shared<ExponentialBackoff>(), max_duration);
}

RetryScheduler RetryScheduler::fixed(std::chrono::milliseconds interval,
                                     std::chrono::milliseconds max_duration) {
    return RetryScheduler(std::make_shared<FixedBackoff>(interval), max_duration);
}

std::chrono::milliseconds RetryScheduler::next_delay(std::size_t attempt_index) const {
    return backoff_->next_delay(attempt_index);
}

bool RetryScheduler::can_retry(std::chrono::milliseconds elapsed,
                               std::size_t attempt_index) const {
    const auto delay = next_delay(attempt_index);
    // Also keeps elapsed + delay from overflowing.
    if (delay > max_duration_) {
        return false;
    }
    return has_exceeded_deadline(elapsed + delay) == false;
}

}  // namespace httpsink
