#include "httpsink/retry/error_policy.hpp"
#include "httpsink/http/http_types.hpp"

#include <format>

namespace httpsink {

std::optional<RetryAction> parse_retry_action(std::string_view name) {
    if (iequals(name, "retry"))   return RetryAction::Retry;
    if (iequals(name, "success")) return RetryAction::Success;
    if (iequals(name, "fail"))    return RetryAction::Fail;
    return std::nullopt;
}

std::optional<NonMatchingStatusPolicy> parse_non_matching_status_policy(std::string_view name) {
    if (iequals(name, "failNonSuccess"))    return NonMatchingStatusPolicy::FailNonSuccess;
    if (iequals(name, "retryServerErrors")) return NonMatchingStatusPolicy::RetryServerErrors;
    return std::nullopt;
}

SinkResult<ErrorPolicyTable> ErrorPolicyTable::compile(
    const std::vector<ErrorPolicyRule>& rules,
    NonMatchingStatusPolicy fallback
) {
    ErrorPolicyTable table(fallback);
    table.entries_.reserve(rules.size());

    for (const auto& rule : rules) {
        const auto action = parse_retry_action(rule.action);
        if (action.has_value() == false) {
            return tl::unexpected(SinkError::configuration(std::format(
                "Invalid error handling action '{}' for pattern '{}': expected retry, success or fail",
                rule.action, rule.pattern)));
        }

        try {
            table.entries_.push_back(Entry{rule.pattern, std::regex(rule.pattern), *action});
        } catch (const std::regex_error& e) {
            return tl::unexpected(SinkError::configuration(std::format(
                "Invalid error handling pattern '{}': {}", rule.pattern, e.what())));
        }
    }

    return table;
}

std::optional<std::size_t> ErrorPolicyTable::match_index(int status_code) const {
    const std::string status = std::to_string(status_code);
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (std::regex_match(status, entries_[i].regex)) {
            return i;
        }
    }
    return std::nullopt;
}

RetryAction ErrorPolicyTable::resolve(int status_code) const {
    const auto index = match_index(status_code);
    if (index.has_value()) {
        return entries_[*index].action;
    }

    const bool is_success = (status_code >= 200 && status_code < 300);
    if (is_success) {
        return RetryAction::Success;
    }

    const bool is_server_error = (status_code >= 500 && status_code < 600);
    if (is_server_error && fallback_ == NonMatchingStatusPolicy::RetryServerErrors) {
        return RetryAction::Retry;
    }
    return RetryAction::Fail;
}

}  // namespace httpsink
