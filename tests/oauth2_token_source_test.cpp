#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "httpsink/auth/oauth2_token_source.hpp"
#include "mocks/fake_clock.hpp"
#include "mocks/mock_http_client.hpp"

#include <chrono>
#include <memory>

using namespace httpsink;
using namespace httpsink::testing;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;

namespace {

OAuth2Config make_config() {
    OAuth2Config config;
    config.token_url = "https://auth.example.com/oauth/token";
    config.client_id = "client";
    config.client_secret = "s3cr&t";
    config.refresh_token = "refresh";
    return config;
}

}  // namespace

TEST_CASE("OAuth2TokenSource request body", "[auth][oauth2]") {
    SECTION("Refresh token grant with encoded values") {
        OAuth2TokenSource source(make_config(), std::make_shared<MockHttpClient>());

        auto body = source.request_body();
        REQUIRE(body.has_value());
        REQUIRE(*body ==
                "grant_type=refresh_token&client_id=client&client_secret=s3cr%26t&refresh_token=refresh");
    }

    SECTION("Scopes are appended when configured") {
        auto config = make_config();
        config.scopes = "read write";
        OAuth2TokenSource source(config, std::make_shared<MockHttpClient>());

        REQUIRE_THAT(*source.request_body(), ContainsSubstring("&scope=read+write"));
    }
}

TEST_CASE("OAuth2TokenSource posts to the token endpoint", "[auth][oauth2]") {
    auto client = std::make_shared<MockHttpClient>();
    client->queue_json_response(200, R"({"access_token":"abc","expires_in":120})");
    OAuth2TokenSource source(make_config(), client);
    FakeClock clock;

    auto token = source.fetch_token(clock.current());

    REQUIRE(token.has_value());
    REQUIRE(token->value == "abc");
    REQUIRE(token->expires_at == clock.current() + 120s);

    REQUIRE(client->request_count() == 1);
    const auto request = *client->last_request();
    REQUIRE(request.method == HttpMethod::Post);
    REQUIRE(request.url == "https://auth.example.com/oauth/token");
    REQUIRE(get_header(request.headers, "content-type") == std::string("application/x-www-form-urlencoded"));
    REQUIRE(get_header(request.headers, "accept") == std::string("application/json"));
    REQUIRE(request.body.has_value());
    REQUIRE_THAT(*request.body, ContainsSubstring("grant_type=refresh_token"));
}

TEST_CASE("OAuth2TokenSource expires_in handling", "[auth][oauth2]") {
    auto client = std::make_shared<MockHttpClient>();
    OAuth2TokenSource source(make_config(), client);
    FakeClock clock;

    SECTION("Missing expires_in uses the default lifetime") {
        client->queue_response(200, R"({"access_token":"abc"})");
        auto token = source.fetch_token(clock.current());
        REQUIRE(token.has_value());
        REQUIRE(token->expires_at == clock.current() + OAuth2TokenSource::kDefaultExpiresIn);
    }

    SECTION("Numeric string is accepted") {
        client->queue_response(200, R"({"access_token":"abc","expires_in":"30"})");
        auto token = source.fetch_token(clock.current());
        REQUIRE(token.has_value());
        REQUIRE(token->expires_at == clock.current() + 30s);
    }

    SECTION("Non-numeric value is rejected") {
        client->queue_response(200, R"({"access_token":"abc","expires_in":"soon"})");
        auto token = source.fetch_token(clock.current());
        REQUIRE_FALSE(token.has_value());
        REQUIRE_THAT(token.error().message, ContainsSubstring("expires_in"));
    }

    SECTION("Huge lifetime saturates instead of wrapping") {
        client->queue_response(200, R"({"access_token":"abc","expires_in":99999999999999})");
        auto token = source.fetch_token(clock.current());
        REQUIRE(token.has_value());
        REQUIRE(token->expires_at == Clock::time_point::max());
        REQUIRE(token->expires_at > clock.current());
    }

    SECTION("Lifetime beyond int64 saturates") {
        client->queue_response(200, R"({"access_token":"abc","expires_in":18446744073709551615})");
        auto token = source.fetch_token(clock.current());
        REQUIRE(token.has_value());
        REQUIRE(token->expires_at == Clock::time_point::max());
    }

    SECTION("Negative lifetime expires immediately") {
        client->queue_response(200, R"({"access_token":"abc","expires_in":-5})");
        auto token = source.fetch_token(clock.current());
        REQUIRE(token.has_value());
        REQUIRE(token->expires_at == clock.current());
    }
}

TEST_CASE("OAuth2TokenSource failures are terminal", "[auth][oauth2]") {
    auto client = std::make_shared<MockHttpClient>();
    OAuth2TokenSource source(make_config(), client);
    FakeClock clock;

    SECTION("Endpoint rejects the grant") {
        client->queue_response(401, R"({"error":"invalid_grant"})");
        auto token = source.fetch_token(clock.current());

        REQUIRE_FALSE(token.has_value());
        REQUIRE(token.error().is_terminal());
        REQUIRE(token.error().http_status == 401);
        REQUIRE(token.error().url == "https://auth.example.com/oauth/token");
        REQUIRE(token.error().attempts == 1);
    }

    SECTION("Network failure") {
        client->queue_connection_error();
        auto token = source.fetch_token(clock.current());

        REQUIRE_FALSE(token.has_value());
        REQUIRE(token.error().is_terminal());
        REQUIRE_FALSE(token.error().http_status.has_value());
    }

    SECTION("Reply is not JSON") {
        client->queue_response(200, "<html>");
        auto token = source.fetch_token(clock.current());

        REQUIRE_FALSE(token.has_value());
        REQUIRE_THAT(token.error().message, ContainsSubstring("not JSON"));
    }

    SECTION("Reply has no access_token") {
        client->queue_response(200, R"({"token_type":"bearer"})");
        auto token = source.fetch_token(clock.current());

        REQUIRE_FALSE(token.has_value());
        REQUIRE_THAT(token.error().message, ContainsSubstring("access_token"));
    }
}
