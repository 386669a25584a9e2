#ifndef HTTPSINK_CONFIG_SINK_CONFIG_HPP
#define HTTPSINK_CONFIG_SINK_CONFIG_HPP

#include "httpsink/auth/oauth2_token_source.hpp"
#include "httpsink/errors.hpp"
#include "httpsink/format/charset.hpp"
#include "httpsink/format/message_format.hpp"
#include "httpsink/http/http_client.hpp"
#include "httpsink/http/http_types.hpp"
#include "httpsink/placeholder/placeholder_resolver.hpp"
#include "httpsink/record.hpp"
#include "httpsink/retry/error_policy.hpp"
#include "httpsink/retry/retry_scheduler.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace httpsink {

// ─────────────────────────────────────────────────────────────────────────────
// Sink Configuration
// ─────────────────────────────────────────────────────────────────────────────
// Everything a writer needs. Validated once when the writer is constructed;
// the writer keeps its own copy afterwards.

struct SinkConfig {
    // ─────────────────────────────────────────────────────────────────────────
    // Target
    // ─────────────────────────────────────────────────────────────────────────

    // May contain #field placeholders (substituted for PUT/DELETE).
    std::string url;

    HttpMethod method{HttpMethod::Post};

    // Records per request. A partial batch is sent on close().
    std::size_t batch_size{1};

    // ─────────────────────────────────────────────────────────────────────────
    // Payload
    // ─────────────────────────────────────────────────────────────────────────

    MessageFormat message_format{MessageFormat::Json};
    bool write_json_as_array{true};
    std::string json_batch_key;
    std::string delimiter_for_messages{"\n"};

    // Required for MessageFormat::Custom.
    std::optional<std::string> body;

    // Raw "name:value" lines separated by '\n'.
    std::string request_headers;

    std::string charset{"UTF-8"};

    MissingFieldPolicy url_placeholder_missing_field{MissingFieldPolicy::LeaveToken};

    // ─────────────────────────────────────────────────────────────────────────
    // Connection
    // ─────────────────────────────────────────────────────────────────────────

    bool follow_redirects{true};
    bool disable_ssl_validation{false};

    // 0 = no limit
    std::chrono::milliseconds connect_timeout{60'000};
    std::chrono::milliseconds read_timeout{60'000};

    std::optional<ProxySettings> proxy;

    // ─────────────────────────────────────────────────────────────────────────
    // Error Handling & Retry
    // ─────────────────────────────────────────────────────────────────────────

    // Evaluated in order; first full match wins.
    std::vector<ErrorPolicyRule> http_errors_handling;
    NonMatchingStatusPolicy non_matching_status_policy{NonMatchingStatusPolicy::FailNonSuccess};

    RetryPolicyKind retry_policy{RetryPolicyKind::Exponential};

    // Required when retry_policy is Linear.
    std::optional<std::chrono::seconds> linear_retry_interval;

    std::chrono::seconds max_retry_duration{600};

    // ─────────────────────────────────────────────────────────────────────────
    // OAuth2
    // ─────────────────────────────────────────────────────────────────────────

    bool oauth2_enabled{false};
    OAuth2Config oauth2;

    // ─────────────────────────────────────────────────────────────────────────
    // Validation
    // ─────────────────────────────────────────────────────────────────────────

    /// Check every property; all problems are reported in one
    /// Configuration error, separated by "; ".
    [[nodiscard]] SinkResult<void> validate() const;

    /// Check the configuration against the record schema.
    [[nodiscard]] SinkResult<void> validate_schema(const Schema& schema) const;

    // ─────────────────────────────────────────────────────────────────────────
    // Derived Values
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] SinkResult<HeaderMap> request_headers_map() const;

    [[nodiscard]] SinkResult<ErrorPolicyTable> error_policy_table() const;

    [[nodiscard]] RetryScheduler retry_scheduler() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Loading
    // ─────────────────────────────────────────────────────────────────────────

    /// Read connector property names ("url", "batchSize", ...). Unknown keys
    /// are ignored; wrong types and unknown enum values are errors.
    [[nodiscard]] static SinkResult<SinkConfig> from_json(const nlohmann::ordered_json& properties);

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────

    SinkConfig& with_url(std::string target);
    SinkConfig& with_method(HttpMethod m);
    SinkConfig& with_batch_size(std::size_t size);
    SinkConfig& with_format(MessageFormat format);
    SinkConfig& with_body(std::string template_text);
    SinkConfig& with_header(const std::string& name, const std::string& value);
    SinkConfig& with_error_rule(std::string pattern, std::string action);
    SinkConfig& with_linear_retry(std::chrono::seconds interval);
    SinkConfig& with_max_retry_duration(std::chrono::seconds duration);
    SinkConfig& with_oauth2(OAuth2Config settings);
};

/// Parse "name:value" lines separated by '\n'. Each line is split at its
/// first ':'; blank lines are skipped.
[[nodiscard]] SinkResult<HeaderMap> parse_request_headers(std::string_view text);

/// Parse the "regex:action,regex:action" form. Each entry is split at its
/// last ':' so patterns may contain ':'.
[[nodiscard]] SinkResult<std::vector<ErrorPolicyRule>> parse_error_rules(std::string_view text);

/// Schema from {"fields": [{"name": "id", "type": "long", "nullable": false}, ...]}
/// or a bare array of field objects. type defaults to "string".
[[nodiscard]] SinkResult<Schema> schema_from_json(const nlohmann::ordered_json& document);

}  // namespace httpsink

#endif  // HTTPSINK_CONFIG_SINK_CONFIG_HPP
