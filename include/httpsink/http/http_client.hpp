#pragma once

#include "httpsink/http/http_types.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace httpsink {

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Error
// ─────────────────────────────────────────────────────────────────────────────
// A request that never produced an HTTP status. Kept apart from real status
// codes so the delivery engine can classify it without inventing one.

struct HttpClientError {
    enum class Code {
        ConnectionFailed,
        Timeout,
        SslError,
        InvalidRequest,
        Unknown
    };

    Code code;
    std::string message;

    static HttpClientError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg};
    }
    static HttpClientError timeout(const std::string& msg) {
        return {Code::Timeout, msg};
    }
    static HttpClientError ssl_error(const std::string& msg) {
        return {Code::SslError, msg};
    }
    static HttpClientError invalid_request(const std::string& msg) {
        return {Code::InvalidRequest, msg};
    }
    static HttpClientError unknown(const std::string& msg) {
        return {Code::Unknown, msg};
    }
};

[[nodiscard]] constexpr std::string_view to_string(HttpClientError::Code code) noexcept {
    switch (code) {
        case HttpClientError::Code::ConnectionFailed: return "ConnectionFailed";
        case HttpClientError::Code::Timeout:          return "Timeout";
        case HttpClientError::Code::SslError:         return "SslError";
        case HttpClientError::Code::InvalidRequest:   return "InvalidRequest";
        case HttpClientError::Code::Unknown:          return "Unknown";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Response
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientResponse {
    int status_code{0};
    HeaderMap headers;
    std::string body;

    [[nodiscard]] bool is_success() const {
        return (status_code >= 200) && (status_code < 300);
    }
};

template <typename T>
using HttpClientResult = tl::expected<T, HttpClientError>;

// ─────────────────────────────────────────────────────────────────────────────
// Proxy Settings
// ─────────────────────────────────────────────────────────────────────────────

struct ProxySettings {
    std::string url;       // e.g. "http://proxy.internal:3128"
    std::string username;  // Basic auth, empty for none
    std::string password;

    [[nodiscard]] bool has_credentials() const {
        return username.empty() == false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// IHttpClient Interface
// ─────────────────────────────────────────────────────────────────────────────
// One blocking call per attempt. Implementations must release the response
// (and its connection) before send() returns, on success and on failure.

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────────────────────────

    // Maximum time to establish the connection. 0 = no limit.
    virtual void set_connect_timeout(std::chrono::milliseconds timeout) = 0;

    // Maximum time for the whole exchange once sent, including reading the
    // response body. It is not an inactivity timer. 0 = no limit.
    virtual void set_read_timeout(std::chrono::milliseconds timeout) = 0;

    // Disable to skip certificate and hostname validation.
    virtual void set_verify_ssl(bool verify) = 0;

    virtual void set_follow_redirects(bool follow) = 0;

    // nullopt removes a previously configured proxy.
    virtual void set_proxy(std::optional<ProxySettings> proxy) = 0;

    // ─────────────────────────────────────────────────────────────────────────
    // Operations
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> send(const HttpRequest& request) = 0;
};

// libcurl reads a connect timeout of 0 as its built-in default (300 s), so
// "no limit" is passed down as kNoConnectTimeoutLimit instead.
inline constexpr std::chrono::milliseconds kNoConnectTimeoutLimit = std::chrono::hours{24 * 365};

[[nodiscard]] constexpr std::chrono::milliseconds transport_connect_timeout(
    std::chrono::milliseconds timeout) noexcept {
    return (timeout.count() <= 0) ? kNoConnectTimeoutLimit : timeout;
}

// Creates the default implementation (cpr).
std::unique_ptr<IHttpClient> make_http_client();

}  // namespace httpsink
