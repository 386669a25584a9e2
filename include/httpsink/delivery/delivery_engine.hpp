#ifndef HTTPSINK_DELIVERY_DELIVERY_ENGINE_HPP
#define HTTPSINK_DELIVERY_DELIVERY_ENGINE_HPP

#include "httpsink/auth/credential_provider.hpp"
#include "httpsink/config/sink_config.hpp"
#include "httpsink/errors.hpp"
#include "httpsink/format/message_buffer.hpp"
#include "httpsink/http/http_client.hpp"
#include "httpsink/http/http_types.hpp"
#include "httpsink/retry/error_policy.hpp"
#include "httpsink/retry/retry_scheduler.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace httpsink {

// ─────────────────────────────────────────────────────────────────────────────
// Delivery State
// ─────────────────────────────────────────────────────────────────────────────
///
///   Idle ─▶ BuildingRequest ─▶ Sending ─▶ EvaluatingResponse ─┬─▶ Done
///                                 ▲                           │
///                                 └──────── RetryWait ◀───────┼─▶ Failed
///
/// Every flush starts from Idle and ends in Done or Failed.
enum class DeliveryState {
    Idle,
    BuildingRequest,
    Sending,
    EvaluatingResponse,
    RetryWait,
    Done,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(DeliveryState state) noexcept {
    switch (state) {
        case DeliveryState::Idle:               return "Idle";
        case DeliveryState::BuildingRequest:    return "BuildingRequest";
        case DeliveryState::Sending:            return "Sending";
        case DeliveryState::EvaluatingResponse: return "EvaluatingResponse";
        case DeliveryState::RetryWait:          return "RetryWait";
        case DeliveryState::Done:               return "Done";
        case DeliveryState::Failed:             return "Failed";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Delivery Settings
// ─────────────────────────────────────────────────────────────────────────────
// The part of SinkConfig the engine reads on every request.

struct DeliverySettings {
    HttpMethod method{HttpMethod::Post};
    HeaderMap request_headers;
    std::string charset{"UTF-8"};
    std::chrono::milliseconds connect_timeout{60'000};
    std::chrono::milliseconds read_timeout{60'000};
    bool follow_redirects{true};
    bool verify_ssl{true};
    std::optional<ProxySettings> proxy;

    [[nodiscard]] static SinkResult<DeliverySettings> from_config(const SinkConfig& config);
};

// ─────────────────────────────────────────────────────────────────────────────
// Delivery Report
// ─────────────────────────────────────────────────────────────────────────────

struct DeliveryReport {
    std::size_t attempts{0};
    int status_code{0};                  // Final status; 0 when nothing was sent
    std::chrono::milliseconds elapsed{0};
    std::string url;
};

// ─────────────────────────────────────────────────────────────────────────────
// DeliveryEngine
// ─────────────────────────────────────────────────────────────────────────────
// Sends one buffered batch per flush():
//   - builds the request (headers, optional bearer token, body for POST/PUT)
//   - classifies each outcome through the error policy table
//   - retries while elapsed + next delay stays within the retry budget
//
// The buffer is cleared on success and on terminal failure, so a failed
// batch is never resent by a later flush.
//
// Single-threaded: one engine per writer. Blocks during send and backoff.

class DeliveryEngine {
public:
    using SleepFunction = std::function<void(std::chrono::milliseconds)>;
    using StateChangeCallback = std::function<void(DeliveryState old_state, DeliveryState new_state)>;

    /// Called before each backoff wait with the failure being retried
    /// (category TransientDelivery) and the delay about to be slept.
    using RetryCallback = std::function<void(const SinkError& cause, std::chrono::milliseconds delay)>;

    DeliveryEngine(
        DeliverySettings settings,
        ErrorPolicyTable error_policy,
        RetryScheduler scheduler,
        std::shared_ptr<IHttpClient> http_client,
        std::shared_ptr<CredentialProvider> credentials = nullptr,
        NowFunction now = {},
        SleepFunction sleep = {}
    );

    /// Deliver the buffered batch to url. An empty buffer is a no-op that
    /// reports zero attempts.
    [[nodiscard]] SinkResult<DeliveryReport> flush(MessageBuffer& buffer, const std::string& url);

    /// Request for one attempt. Fetches or refreshes the bearer token when
    /// credentials are configured.
    [[nodiscard]] SinkResult<HttpRequest> build_request(
        const std::string& url,
        const std::optional<std::string>& body,
        std::string_view content_type
    );

    [[nodiscard]] DeliveryState state() const noexcept {
        return state_;
    }

    void on_state_change(StateChangeCallback callback) {
        state_change_callback_ = std::move(callback);
    }

    void on_retry(RetryCallback callback) {
        retry_callback_ = std::move(callback);
    }

    [[nodiscard]] const DeliverySettings& settings() const noexcept {
        return settings_;
    }

    [[nodiscard]] const ErrorPolicyTable& error_policy() const noexcept {
        return error_policy_;
    }

    [[nodiscard]] const RetryScheduler& scheduler() const noexcept {
        return scheduler_;
    }

private:
    void transition_to(DeliveryState new_state);

    [[nodiscard]] SinkError fail_batch(
        MessageBuffer& buffer,
        SinkError error,
        const std::string& url,
        std::size_t attempts,
        std::optional<int> status
    );

    DeliverySettings settings_;
    ErrorPolicyTable error_policy_;
    RetryScheduler scheduler_;
    std::shared_ptr<IHttpClient> http_client_;
    std::shared_ptr<CredentialProvider> credentials_;
    NowFunction now_;
    SleepFunction sleep_;

    DeliveryState state_{DeliveryState::Idle};
    StateChangeCallback state_change_callback_;
    RetryCallback retry_callback_;
};

}  // namespace httpsink

#endif  // HTTPSINK_DELIVERY_DELIVERY_ENGINE_HPP
