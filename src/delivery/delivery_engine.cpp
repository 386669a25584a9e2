#include "httpsink/delivery/delivery_engine.hpp"
#include "httpsink/log/logger.hpp"

#include <format>
#include <stdexcept>
#include <thread>

namespace httpsink {

namespace {

std::chrono::milliseconds elapsed_since(Clock::time_point start, Clock::time_point now) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - start);
}

bool is_retryable(HttpClientError::Code code) {
    switch (code) {
        case HttpClientError::Code::ConnectionFailed:
        case HttpClientError::Code::Timeout:
            return true;
        case HttpClientError::Code::SslError:
        case HttpClientError::Code::InvalidRequest:
        case HttpClientError::Code::Unknown:
            return false;
    }
    return false;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// DeliverySettings
// ─────────────────────────────────────────────────────────────────────────────

SinkResult<DeliverySettings> DeliverySettings::from_config(const SinkConfig& config) {
    auto headers = config.request_headers_map();
    if (!headers) {
        return tl::unexpected(headers.error());
    }

    DeliverySettings settings;
    settings.method = config.method;
    settings.request_headers = std::move(*headers);
    settings.charset = config.charset;
    settings.connect_timeout = config.connect_timeout;
    settings.read_timeout = config.read_timeout;
    settings.follow_redirects = config.follow_redirects;
    settings.verify_ssl = (config.disable_ssl_validation == false);
    settings.proxy = config.proxy;
    return settings;
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

DeliveryEngine::DeliveryEngine(
    DeliverySettings settings,
    ErrorPolicyTable error_policy,
    RetryScheduler scheduler,
    std::shared_ptr<IHttpClient> http_client,
    std::shared_ptr<CredentialProvider> credentials,
    NowFunction now,
    SleepFunction sleep
)
    : settings_(std::move(settings))
    , error_policy_(std::move(error_policy))
    , scheduler_(std::move(scheduler))
    , http_client_(std::move(http_client))
    , credentials_(std::move(credentials))
    , now_(now ? std::move(now) : NowFunction([] { return Clock::now(); }))
    , sleep_(sleep ? std::move(sleep) : SleepFunction([](std::chrono::milliseconds delay) {
          std::this_thread::sleep_for(delay);
      }))
{
    if (!http_client_) {
        throw std::invalid_argument("DeliveryEngine: http_client cannot be null");
    }

    http_client_->set_connect_timeout(settings_.connect_timeout);
    http_client_->set_read_timeout(settings_.read_timeout);
    http_client_->set_verify_ssl(settings_.verify_ssl);
    http_client_->set_follow_redirects(settings_.follow_redirects);
    http_client_->set_proxy(settings_.proxy);
}

// ─────────────────────────────────────────────────────────────────────────────
// Request Building
// ─────────────────────────────────────────────────────────────────────────────

SinkResult<HttpRequest> DeliveryEngine::build_request(
    const std::string& url,
    const std::optional<std::string>& body,
    std::string_view content_type
) {
    HttpRequest request;
    request.method = settings_.method;
    request.url = url;
    request.headers = settings_.request_headers;

    if (credentials_) {
        auto authorization = credentials_->authorization_header();
        if (!authorization) {
            return tl::unexpected(authorization.error());
        }
        request.headers["Authorization"] = std::move(*authorization);
    }

    request.with_header("Request-Method", to_string(settings_.method))
           .with_header("Connect-Timeout", std::to_string(settings_.connect_timeout.count()))
           .with_header("Read-Timeout", std::to_string(settings_.read_timeout.count()))
           .with_header("Instance-Follow-Redirects", settings_.follow_redirects ? "true" : "false")
           .with_header("charset", settings_.charset);

    if (carries_body(settings_.method)) {
        const bool has_content_type = (find_header(request.headers, "Content-Type") != request.headers.end());
        if (has_content_type == false) {
            request.with_header("Content-Type", std::string(content_type));
        }
        if (body.has_value()) {
            request.with_body(*body);
        }
    }

    return request;
}

// ─────────────────────────────────────────────────────────────────────────────
// Flush
// ─────────────────────────────────────────────────────────────────────────────

SinkResult<DeliveryReport> DeliveryEngine::flush(MessageBuffer& buffer, const std::string& url) {
    transition_to(DeliveryState::Idle);

    if (buffer.empty()) {
        return DeliveryReport{0, 0, std::chrono::milliseconds{0}, url};
    }

    transition_to(DeliveryState::BuildingRequest);
    HTTPSINK_LOG_DEBUG("delivery", "Flushing {} record(s) with {} {}",
                       buffer.size(), to_string(settings_.method), url);

    std::optional<std::string> body;
    if (carries_body(settings_.method)) {
        auto rendered = buffer.message();
        if (!rendered) {
            return tl::unexpected(fail_batch(buffer, rendered.error(), url, 0, std::nullopt));
        }
        body = std::move(*rendered);
    }

    const auto start = now_();
    std::size_t attempts = 0;
    std::size_t retry_index = 0;

    while (true) {
        auto request = build_request(url, body, buffer.content_type());
        if (!request) {
            return tl::unexpected(fail_batch(buffer, request.error(), url, attempts, std::nullopt));
        }

        transition_to(DeliveryState::Sending);
        ++attempts;
        auto response = http_client_->send(*request);

        transition_to(DeliveryState::EvaluatingResponse);
        const auto elapsed = elapsed_since(start, now_());

        RetryAction action = RetryAction::Fail;
        std::optional<int> status;
        std::string cause;

        if (!response) {
            const auto& failure = response.error();
            // Header values may carry credentials; never log them.
            HTTPSINK_LOG_WARN("delivery", "{} {} failed on attempt {}: {} ({})",
                              to_string(settings_.method), url, attempts,
                              to_string(failure.code), failure.message);

            cause = std::format("{}: {}", to_string(failure.code), failure.message);
            if (is_retryable(failure.code) == false) {
                return tl::unexpected(fail_batch(
                    buffer,
                    SinkError::terminal(std::format("Request failed: {}", cause), std::nullopt, url, attempts),
                    url, attempts, std::nullopt));
            }
            action = RetryAction::Retry;
        } else {
            status = response->status_code;
            action = error_policy_.resolve(response->status_code);
            cause = std::format("HTTP {}", response->status_code);
        }

        switch (action) {
            case RetryAction::Success: {
                buffer.clear();
                transition_to(DeliveryState::Done);
                HTTPSINK_LOG_INFO("delivery", "Delivered batch to {} with HTTP {} after {} attempt(s)",
                                  url, status.value_or(0), attempts);
                return DeliveryReport{attempts, status.value_or(0), elapsed, url};
            }

            case RetryAction::Fail: {
                return tl::unexpected(fail_batch(
                    buffer,
                    SinkError::terminal(std::format("{} {} returned {}, classified as fail",
                                                    to_string(settings_.method), url, cause),
                                        status, url, attempts),
                    url, attempts, status));
            }

            case RetryAction::Retry:
                break;
        }

        if (scheduler_.can_retry(elapsed, retry_index) == false) {
            return tl::unexpected(fail_batch(
                buffer,
                SinkError::terminal(std::format("Retry budget of {}s exhausted; last outcome {}",
                                                std::chrono::duration_cast<std::chrono::seconds>(
                                                    scheduler_.max_duration()).count(),
                                                cause),
                                    status, url, attempts),
                url, attempts, status));
        }

        const auto delay = scheduler_.next_delay(retry_index);
        ++retry_index;

        HTTPSINK_LOG_INFO("delivery", "Retrying {} {} in {}ms after {} (attempt {})",
                          to_string(settings_.method), url, delay.count(), cause, attempts);

        if (retry_callback_) {
            auto transient = SinkError::transient(cause);
            transient.http_status = status;
            transient.url = url;
            transient.attempts = attempts;
            retry_callback_(transient, delay);
        }

        transition_to(DeliveryState::RetryWait);
        sleep_(delay);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

SinkError DeliveryEngine::fail_batch(
    MessageBuffer& buffer,
    SinkError error,
    const std::string& url,
    std::size_t attempts,
    std::optional<int> status
) {
    const auto dropped = buffer.size();
    buffer.clear();
    transition_to(DeliveryState::Failed);

    if (error.url.empty()) {
        error.url = url;
    }
    if (error.attempts == 0) {
        error.attempts = attempts;
    }
    if (error.http_status.has_value() == false) {
        error.http_status = status;
    }

    HTTPSINK_LOG_ERROR("delivery", "Dropping batch of {} record(s): {}", dropped, error.describe());
    return error;
}

void DeliveryEngine::transition_to(DeliveryState new_state) {
    const auto old_state = state_;
    state_ = new_state;
    if (state_change_callback_ && (old_state != new_state)) {
        state_change_callback_(old_state, new_state);
    }
}

}  // namespace httpsink
