#ifndef HTTPSINK_RETRY_ERROR_POLICY_HPP
#define HTTPSINK_RETRY_ERROR_POLICY_HPP

#include "httpsink/errors.hpp"

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace httpsink {

// ─────────────────────────────────────────────────────────────────────────────
// Retry Action
// ─────────────────────────────────────────────────────────────────────────────

enum class RetryAction {
    Retry,    // Wait for the next backoff delay, then resend
    Success,  // Treat the response as delivered
    Fail      // Give up on the batch
};

[[nodiscard]] constexpr std::string_view to_string(RetryAction action) noexcept {
    switch (action) {
        case RetryAction::Retry:   return "retry";
        case RetryAction::Success: return "success";
        case RetryAction::Fail:    return "fail";
    }
    return "fail";
}

/// Case-insensitive: "retry", "success", "fail".
[[nodiscard]] std::optional<RetryAction> parse_retry_action(std::string_view name);

// ─────────────────────────────────────────────────────────────────────────────
// Non-Matching Status Policy
// ─────────────────────────────────────────────────────────────────────────────
// Applies when no rule of the table matches a status code.

enum class NonMatchingStatusPolicy {
    FailNonSuccess,     // 2xx success, everything else fail
    RetryServerErrors   // 2xx success, 5xx retry, everything else fail
};

[[nodiscard]] constexpr std::string_view to_string(NonMatchingStatusPolicy policy) noexcept {
    switch (policy) {
        case NonMatchingStatusPolicy::FailNonSuccess:    return "failNonSuccess";
        case NonMatchingStatusPolicy::RetryServerErrors: return "retryServerErrors";
    }
    return "failNonSuccess";
}

[[nodiscard]] std::optional<NonMatchingStatusPolicy>
parse_non_matching_status_policy(std::string_view name);

// ─────────────────────────────────────────────────────────────────────────────
// Error Policy Rule
// ─────────────────────────────────────────────────────────────────────────────
// Uncompiled form, as it comes from configuration.

struct ErrorPolicyRule {
    std::string pattern;
    std::string action;

    bool operator==(const ErrorPolicyRule&) const = default;
};

// ─────────────────────────────────────────────────────────────────────────────
// ErrorPolicyTable
// ─────────────────────────────────────────────────────────────────────────────
// Ordered (regex, action) pairs. A status code is rendered as its decimal
// string and must match a pattern in full; the first matching rule wins.
//
// Usage:
//   auto table = ErrorPolicyTable::compile({{"5\\d\\d", "retry"}, {"4\\d\\d", "fail"}});
//   if (table) {
//       table->resolve(503);  // RetryAction::Retry
//   }

class ErrorPolicyTable {
public:
    struct Entry {
        std::string pattern;
        std::regex regex;
        RetryAction action;
    };

    /// Empty table; every status goes through the fallback.
    explicit ErrorPolicyTable(
        NonMatchingStatusPolicy fallback = NonMatchingStatusPolicy::FailNonSuccess
    )
        : fallback_(fallback)
    {}

    /// Compile rules in order. An invalid pattern or action is a
    /// Configuration error naming the offending rule.
    [[nodiscard]] static SinkResult<ErrorPolicyTable> compile(
        const std::vector<ErrorPolicyRule>& rules,
        NonMatchingStatusPolicy fallback = NonMatchingStatusPolicy::FailNonSuccess
    );

    [[nodiscard]] RetryAction resolve(int status_code) const;

    /// Index of the first rule matching the status, if any.
    [[nodiscard]] std::optional<std::size_t> match_index(int status_code) const;

    [[nodiscard]] std::size_t size() const noexcept {
        return entries_.size();
    }

    [[nodiscard]] bool empty() const noexcept {
        return entries_.empty();
    }

    [[nodiscard]] const std::vector<Entry>& entries() const noexcept {
        return entries_;
    }

    [[nodiscard]] NonMatchingStatusPolicy fallback() const noexcept {
        return fallback_;
    }

private:
    NonMatchingStatusPolicy fallback_;
    std::vector<Entry> entries_;
};

}  // namespace httpsink

#endif  // HTTPSINK_RETRY_ERROR_POLICY_HPP
