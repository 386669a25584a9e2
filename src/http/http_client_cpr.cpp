#include "httpsink/http/http_client.hpp"

#include <cpr/cpr.h>

namespace httpsink {

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient Implementation
// ─────────────────────────────────────────────────────────────────────────────
// Uses cpr (C++ Requests), a wrapper around libcurl. A fresh cpr::Session is
// built for every attempt and destroyed before send() returns, so the
// response body and handle are released even when the attempt fails.

class CprHttpClient : public IHttpClient {
public:
    CprHttpClient() = default;
    ~CprHttpClient() override = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────────────────────────

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        connect_timeout_ = timeout;
    }

    void set_read_timeout(std::chrono::milliseconds timeout) override {
        read_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        verify_ssl_ = verify;
    }

    void set_follow_redirects(bool follow) override {
        follow_redirects_ = follow;
    }

    void set_proxy(std::optional<ProxySettings> proxy) override {
        proxy_ = std::move(proxy);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Operations
    // ─────────────────────────────────────────────────────────────────────────

    HttpClientResult<HttpClientResponse> send(const HttpRequest& request) override {
        if (request.url.empty()) {
            return tl::unexpected(HttpClientError::invalid_request("Request URL is empty"));
        }

        cpr::Session session;
        configure_session(session, request);

        cpr::Response response;
        switch (request.method) {
            case HttpMethod::Get:
                response = session.Get();
                break;
            case HttpMethod::Post:
                response = session.Post();
                break;
            case HttpMethod::Put:
                response = session.Put();
                break;
            case HttpMethod::Delete:
                response = session.Delete();
                break;
        }
        return convert_response(response);
    }

private:
    void configure_session(cpr::Session& session, const HttpRequest& request) const {
        session.SetUrl(cpr::Url{request.url});
        session.SetHeader(build_headers(request.headers));
        session.SetConnectTimeout(cpr::ConnectTimeout{transport_connect_timeout(connect_timeout_)});
        // CURLOPT_TIMEOUT_MS: bounds the whole transfer; 0 already means none.
        session.SetTimeout(cpr::Timeout{read_timeout_});
        session.SetVerifySsl(cpr::VerifySsl{verify_ssl_});
        session.SetRedirect(cpr::Redirect{follow_redirects_});

        if (request.body.has_value()) {
            session.SetBody(cpr::Body{*request.body});
        }

        if (proxy_.has_value()) {
            session.SetProxies(cpr::Proxies{
                {"http", proxy_->url},
                {"https", proxy_->url}
            });
            if (proxy_->has_credentials()) {
                session.SetProxyAuth(cpr::ProxyAuthentication{
                    {"http", cpr::EncodedAuthentication{proxy_->username, proxy_->password}},
                    {"https", cpr::EncodedAuthentication{proxy_->username, proxy_->password}}
                });
            }
        }
    }

    static cpr::Header build_headers(const HeaderMap& headers) {
        cpr::Header cpr_headers;
        for (const auto& [name, value] : headers) {
            cpr_headers[name] = value;
        }
        return cpr_headers;
    }

    static HttpClientResult<HttpClientResponse> convert_response(const cpr::Response& response) {
        const bool has_error = (response.error.code != cpr::ErrorCode::OK);
        if (has_error) {
            return tl::unexpected(map_error(response.error));
        }

        HttpClientResponse result;
        result.status_code = static_cast<int>(response.status_code);
        result.body = response.text;
        for (const auto& [name, value] : response.header) {
            result.headers[name] = value;
        }
        return result;
    }

    static HttpClientError map_error(const cpr::Error& error) {
        const std::string& msg = error.message;
        const bool is_ssl_error =
            (msg.find("SSL") != std::string::npos) ||
            (msg.find("ssl") != std::string::npos) ||
            (msg.find("certificate") != std::string::npos) ||
            (msg.find("TLS") != std::string::npos);

        if (is_ssl_error) {
            return HttpClientError::ssl_error(msg);
        }

        switch (error.code) {
            case cpr::ErrorCode::OK:
                return HttpClientError::unknown("No error");

            case cpr::ErrorCode::OPERATION_TIMEDOUT:
                return HttpClientError::timeout(msg);

            case cpr::ErrorCode::SSL_CONNECT_ERROR:
                return HttpClientError::ssl_error(msg);

            default:
                return HttpClientError::connection_failed(msg);
        }
    }

    std::chrono::milliseconds connect_timeout_{60'000};
    std::chrono::milliseconds read_timeout_{60'000};
    bool verify_ssl_{true};
    bool follow_redirects_{true};
    std::optional<ProxySettings> proxy_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Factory Function
// ─────────────────────────────────────────────────────────────────────────────

std::unique_ptr<IHttpClient> make_http_client() {
    return std::make_unique<CprHttpClient>();
}

}  // namespace httpsink
