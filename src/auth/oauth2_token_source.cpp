#include "httpsink/auth/oauth2_token_source.hpp"
#include "httpsink/format/charset.hpp"
#include "httpsink/log/logger.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <format>
#include <limits>
#include <utility>
#include <vector>

namespace httpsink {

namespace {

SinkResult<void> append_param(std::string& body, std::string_view name, const std::string& value) {
    auto encoded = url_encode(value, Charset::Utf8);
    if (!encoded) {
        return tl::unexpected(SinkError::configuration(
            std::format("OAuth2 parameter '{}' is not valid UTF-8", name)));
    }
    if (body.empty() == false) {
        body.push_back('&');
    }
    body += name;
    body.push_back('=');
    body += *encoded;
    return {};
}

SinkError token_error(std::string msg, std::optional<int> status, const std::string& url) {
    return SinkError::terminal(std::move(msg), status, url, 1);
}

// expires_in comes from the token server; clamp it so now + lifetime cannot
// overflow the clock. A negative lifetime expires immediately.
Clock::time_point expiry_after(Clock::time_point now, std::int64_t expires_in) {
    if (expires_in <= 0) {
        return now;
    }
    const auto headroom = std::chrono::duration_cast<std::chrono::seconds>(Clock::time_point::max() - now);
    if (expires_in >= headroom.count()) {
        return Clock::time_point::max();
    }
    return now + std::chrono::seconds{expires_in};
}

}  // namespace

OAuth2TokenSource::OAuth2TokenSource(OAuth2Config config, std::shared_ptr<IHttpClient> http_client)
    : config_(std::move(config))
    , http_client_(std::move(http_client))
{}

SinkResult<std::string> OAuth2TokenSource::request_body() const {
    std::vector<std::pair<std::string_view, std::string>> params{
        {"grant_type", "refresh_token"},
        {"client_id", config_.client_id},
        {"client_secret", config_.client_secret},
        {"refresh_token", config_.refresh_token},
    };
    if (config_.scopes.empty() == false) {
        params.emplace_back("scope", config_.scopes);
    }

    std::string body;
    for (const auto& [name, value] : params) {
        auto appended = append_param(body, name, value);
        if (!appended) {
            return tl::unexpected(appended.error());
        }
    }
    return body;
}

SinkResult<AccessToken> OAuth2TokenSource::fetch_token(Clock::time_point now) {
    if (!http_client_) {
        return tl::unexpected(SinkError::configuration("OAuth2 token source has no HTTP client"));
    }

    auto body = request_body();
    if (!body) {
        return tl::unexpected(body.error());
    }

    HttpRequest request;
    request.method = HttpMethod::Post;
    request.url = config_.token_url;
    request.with_header("Content-Type", "application/x-www-form-urlencoded")
           .with_header("Accept", "application/json")
           .with_body(*body);

    auto response = http_client_->send(request);
    if (!response) {
        HTTPSINK_LOG_WARN("auth", "Token request to {} failed: {}",
                          config_.token_url, to_string(response.error().code));
        return tl::unexpected(token_error(
            std::format("Token request failed: {}", response.error().message),
            std::nullopt, config_.token_url));
    }

    if (response->is_success() == false) {
        return tl::unexpected(token_error(
            std::format("Token endpoint returned HTTP {}", response->status_code),
            response->status_code, config_.token_url));
    }

    nlohmann::json reply;
    try {
        reply = nlohmann::json::parse(response->body);
    } catch (const nlohmann::json::parse_error& e) {
        return tl::unexpected(token_error(
            std::format("Token endpoint reply is not JSON: {}", e.what()),
            response->status_code, config_.token_url));
    }

    const auto token_it = reply.find("access_token");
    const bool has_token = reply.is_object() && (token_it != reply.end()) && token_it->is_string();
    if (has_token == false) {
        return tl::unexpected(token_error(
            "Token endpoint reply has no access_token", response->status_code, config_.token_url));
    }

    std::int64_t expires_in = kDefaultExpiresIn.count();
    const auto expires_it = reply.find("expires_in");
    if (expires_it != reply.end()) {
        if (expires_it->is_number_unsigned()) {
            const auto value = expires_it->get<std::uint64_t>();
            const auto limit = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
            expires_in = (value > limit) ? std::numeric_limits<std::int64_t>::max()
                                         : static_cast<std::int64_t>(value);
        } else if (expires_it->is_number_integer()) {
            expires_in = expires_it->get<std::int64_t>();
        } else if (expires_it->is_string()) {
            try {
                expires_in = std::stoll(expires_it->get<std::string>());
            } catch (const std::exception&) {
                return tl::unexpected(token_error(
                    "Token endpoint reply has a non-numeric expires_in",
                    response->status_code, config_.token_url));
            }
        } else {
            return tl::unexpected(token_error(
                "Token endpoint reply has a non-numeric expires_in",
                response->status_code, config_.token_url));
        }
    }

    return AccessToken{token_it->get<std::string>(), expiry_after(now, expires_in)};
}

}  // namespace httpsink
