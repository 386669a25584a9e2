#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "httpsink/sink/http_sink_writer.hpp"
#include "mocks/fake_clock.hpp"
#include "mocks/mock_http_client.hpp"
#include "mocks/mock_token_source.hpp"

#include <chrono>
#include <memory>
#include <vector>

using namespace httpsink;
using namespace httpsink::testing;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;

namespace {

struct WriterFixture {
    FakeClock clock;
    std::shared_ptr<MockHttpClient> client = std::make_shared<MockHttpClient>();
    std::shared_ptr<MockTokenSource> tokens = std::make_shared<MockTokenSource>();

    WriterDependencies dependencies(bool with_tokens = false) const {
        WriterDependencies deps;
        deps.http_client = client;
        if (with_tokens) {
            deps.token_source = tokens;
        }
        deps.now = clock.now();
        deps.sleep = clock.sleep();
        return deps;
    }
};

SinkConfig base_config() {
    SinkConfig config;
    config.url = "https://x/in";
    return config;
}

Schema id_schema() {
    return Schema{{{"id", FieldType::String}}};
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("HttpSinkWriter rejects invalid configuration", "[writer]") {
    WriterFixture fx;

    SECTION("Invalid config") {
        auto config = base_config();
        config.batch_size = 0;
        try {
            HttpSinkWriter writer(config, std::nullopt, fx.dependencies());
            FAIL("expected SinkException");
        } catch (const SinkException& e) {
            REQUIRE(e.category() == ErrorCategory::Configuration);
            REQUIRE_THAT(e.error().message, ContainsSubstring("Batch size"));
        }
    }

    SECTION("URL placeholder missing from the schema") {
        auto config = base_config();
        config.with_url("https://x/#name").with_method(HttpMethod::Put);
        REQUIRE_THROWS_AS(HttpSinkWriter(config, id_schema(), fx.dependencies()), SinkException);
    }

    SECTION("Empty schema") {
        REQUIRE_THROWS_AS(HttpSinkWriter(base_config(), Schema{}, fx.dependencies()), SinkException);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Batching
// ═══════════════════════════════════════════════════════════════════════════

SCENARIO("Records are delivered in batches of the configured size", "[writer][batch]") {
    GIVEN("A writer with batch size 3") {
        WriterFixture fx;
        HttpSinkWriter writer(base_config().with_batch_size(3), std::nullopt, fx.dependencies());

        WHEN("Two records are written") {
            writer.write(Record{{"a", 1}});
            writer.write(Record{{"a", 2}});

            THEN("Nothing is sent yet") {
                REQUIRE(fx.client->request_count() == 0);
                REQUIRE(writer.pending() == 2);
            }
        }

        WHEN("The third record is written") {
            writer.write(Record{{"a", 1}});
            writer.write(Record{{"a", 2}});
            writer.write(Record{{"a", 3}});

            THEN("One request carries all three") {
                REQUIRE(fx.client->request_count() == 1);
                REQUIRE(fx.client->last_request()->body == std::string(R"([{"a":1},{"a":2},{"a":3}])"));
                REQUIRE(writer.pending() == 0);
                REQUIRE(writer.batches_delivered() == 1);
                REQUIRE(writer.records_delivered() == 3);
            }
        }

        WHEN("The writer is closed with a partial batch") {
            writer.write(Record{{"a", 1}});
            writer.close();

            THEN("The remainder is flushed") {
                REQUIRE(fx.client->request_count() == 1);
                REQUIRE(fx.client->last_request()->body == std::string(R"([{"a":1}])"));
                REQUIRE(writer.is_closed());
            }
        }
    }
}

TEST_CASE("HttpSinkWriter close", "[writer]") {
    WriterFixture fx;
    HttpSinkWriter writer(base_config().with_batch_size(5), std::nullopt, fx.dependencies());

    SECTION("Closing an empty writer sends nothing") {
        writer.close();
        REQUIRE(fx.client->request_count() == 0);
    }

    SECTION("Close is idempotent") {
        writer.write(Record{{"a", 1}});
        writer.close();
        writer.close();
        REQUIRE(fx.client->request_count() == 1);
    }

    SECTION("Writing after close throws") {
        writer.close();
        REQUIRE_THROWS_AS(writer.write(Record{{"a", 1}}), SinkException);
    }
}

TEST_CASE("HttpSinkWriter close surfaces a failed final flush", "[writer][retry]") {
    WriterFixture fx;
    fx.client->queue_response(404);
    auto config = base_config().with_batch_size(5).with_error_rule("4\\d\\d", "fail");
    HttpSinkWriter writer(config, std::nullopt, fx.dependencies());

    writer.write(Record{{"a", 1}});
    REQUIRE(fx.client->request_count() == 0);

    try {
        writer.close();
        FAIL("expected SinkException");
    } catch (const SinkException& e) {
        REQUIRE(e.category() == ErrorCategory::TerminalDelivery);
        REQUIRE(e.error().http_status == 404);
    }

    REQUIRE(fx.client->request_count() == 1);
    REQUIRE(writer.pending() == 0);
    REQUIRE(writer.is_closed());
    REQUIRE(writer.batches_delivered() == 0);
}

TEST_CASE("HttpSinkWriter wraps the JSON batch under a key", "[writer][json]") {
    WriterFixture fx;
    auto config = base_config().with_batch_size(2);
    config.json_batch_key = "events";
    HttpSinkWriter writer(config, std::nullopt, fx.dependencies());

    writer.write(Record{{"a", 1}});
    writer.write(Record{{"a", 2}});

    REQUIRE(fx.client->last_request()->body == std::string(R"({"events":[{"a":1},{"a":2}]})"));
}

TEST_CASE("HttpSinkWriter sends user headers", "[writer][headers]") {
    WriterFixture fx;
    auto config = base_config().with_header("X-Api-Key", "abc").with_header("Content-Type", "text/json");
    HttpSinkWriter writer(config, std::nullopt, fx.dependencies());

    writer.write(Record{{"a", 1}});

    const auto request = *fx.client->last_request();
    REQUIRE(request.headers.at("X-Api-Key") == "abc");
    REQUIRE(request.headers.at("Content-Type") == "text/json");
    REQUIRE(request.headers.at("Request-Method") == "POST");
}

// ═══════════════════════════════════════════════════════════════════════════
// Retry and Failure
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("HttpSinkWriter retries a 503 and then succeeds", "[writer][retry]") {
    WriterFixture fx;
    fx.client->queue_response(503);
    fx.client->queue_response(200);
    auto config = base_config().with_batch_size(2).with_error_rule("5\\d\\d", "retry");
    HttpSinkWriter writer(config, std::nullopt, fx.dependencies());

    writer.write(Record{{"a", 1}});
    writer.write(Record{{"a", 2}});

    REQUIRE(fx.client->request_count() == 2);
    REQUIRE(fx.client->requests()[0].body == std::string(R"([{"a":1},{"a":2}])"));
    REQUIRE(fx.clock.sleeps() == std::vector<std::chrono::milliseconds>{500ms});
    REQUIRE(writer.pending() == 0);
    REQUIRE(writer.engine().state() == DeliveryState::Done);
}

TEST_CASE("HttpSinkWriter surfaces a terminal failure", "[writer][retry]") {
    WriterFixture fx;
    fx.client->queue_response(404);
    auto config = base_config()
        .with_error_rule("5\\d\\d", "retry")
        .with_error_rule("4\\d\\d", "fail");
    HttpSinkWriter writer(config, std::nullopt, fx.dependencies());

    try {
        writer.write(Record{{"a", 1}});
        FAIL("expected SinkException");
    } catch (const SinkException& e) {
        REQUIRE(e.category() == ErrorCategory::TerminalDelivery);
        REQUIRE(e.error().http_status == 404);
        REQUIRE(e.error().attempts == 1);
    }

    REQUIRE(fx.client->request_count() == 1);
    REQUIRE(writer.pending() == 0);
    REQUIRE(writer.batches_delivered() == 0);

    SECTION("The writer keeps accepting records after a dropped batch") {
        writer.write(Record{{"a", 2}});
        REQUIRE(fx.client->request_count() == 2);
        REQUIRE(writer.batches_delivered() == 1);
    }
}

TEST_CASE("HttpSinkWriter drops a batch that cannot be encoded", "[writer][encoding]") {
    WriterFixture fx;
    HttpSinkWriter writer(base_config().with_batch_size(1), std::nullopt, fx.dependencies());

    try {
        writer.write(Record{{"a", std::string("\xff")}});
        FAIL("expected SinkException");
    } catch (const SinkException& e) {
        REQUIRE(e.category() == ErrorCategory::Encoding);
    }

    REQUIRE(fx.client->request_count() == 0);
    REQUIRE(writer.pending() == 0);
    REQUIRE(writer.engine().state() == DeliveryState::Failed);

    writer.write(Record{{"a", 2}});
    REQUIRE(fx.client->request_count() == 1);
    REQUIRE(fx.client->last_request()->body == std::string(R"([{"a":2}])"));
    REQUIRE(writer.batches_delivered() == 1);
}

TEST_CASE("HttpSinkWriter gives up when the retry deadline passes", "[writer][retry]") {
    WriterFixture fx;
    fx.client->set_response_handler([](const HttpRequest&) -> HttpClientResult<HttpClientResponse> {
        return HttpClientResponse{500, {}, ""};
    });
    auto config = base_config()
        .with_error_rule("5\\d\\d", "retry")
        .with_linear_retry(1s)
        .with_max_retry_duration(3s);
    HttpSinkWriter writer(config, std::nullopt, fx.dependencies());

    REQUIRE_THROWS_AS(writer.write(Record{{"a", 1}}), SinkException);
    REQUIRE(fx.client->request_count() == 4);
    REQUIRE(fx.clock.sleeps().size() == 3);
}

// ═══════════════════════════════════════════════════════════════════════════
// URL Placeholders
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("HttpSinkWriter DELETE resolves the URL per record", "[writer][placeholder]") {
    WriterFixture fx;
    auto config = base_config().with_url("https://x/#id").with_method(HttpMethod::Delete);
    HttpSinkWriter writer(config, id_schema(), fx.dependencies());

    writer.write(Record{{"id", "7"}});

    const auto request = *fx.client->last_request();
    REQUIRE(request.method == HttpMethod::Delete);
    REQUIRE(request.url == "https://x/7");
    REQUIRE_FALSE(request.body.has_value());
    REQUIRE(writer.current_url() == "https://x/7");
}

TEST_CASE("HttpSinkWriter GET batches count toward the batch size", "[writer]") {
    WriterFixture fx;
    auto config = base_config().with_method(HttpMethod::Get).with_batch_size(2);
    HttpSinkWriter writer(config, std::nullopt, fx.dependencies());

    writer.write(Record{{"id", "1"}});
    REQUIRE(fx.client->request_count() == 0);

    writer.write(Record{{"id", "2"}});
    REQUIRE(fx.client->request_count() == 1);
    REQUIRE(fx.client->last_request()->method == HttpMethod::Get);
    REQUIRE_FALSE(fx.client->last_request()->body.has_value());
    REQUIRE(writer.pending() == 0);
}

TEST_CASE("HttpSinkWriter PUT resolves the URL and sends a body", "[writer][placeholder]") {
    WriterFixture fx;
    auto config = base_config().with_url("https://x/items/#id").with_method(HttpMethod::Put);
    HttpSinkWriter writer(config, id_schema(), fx.dependencies());

    writer.write(Record{{"id", "a b"}});

    const auto request = *fx.client->last_request();
    REQUIRE(request.url == "https://x/items/a+b");
    REQUIRE(request.body == std::string(R"([{"id":"a b"}])"));
}

TEST_CASE("HttpSinkWriter POST leaves placeholders in the URL", "[writer][placeholder]") {
    WriterFixture fx;
    HttpSinkWriter writer(base_config().with_url("https://x/#id"), std::nullopt, fx.dependencies());

    writer.write(Record{{"id", "7"}});

    REQUIRE(fx.client->last_request()->url == "https://x/#id");
}

// ═══════════════════════════════════════════════════════════════════════════
// OAuth2
// ═══════════════════════════════════════════════════════════════════════════

namespace {

OAuth2Config oauth_settings() {
    return OAuth2Config{"https://auth/token", "client", "secret", "refresh", ""};
}

}  // namespace

TEST_CASE("HttpSinkWriter with OAuth2 fetches one token for many batches", "[writer][auth]") {
    WriterFixture fx;
    auto config = base_config().with_oauth2(oauth_settings());
    HttpSinkWriter writer(config, std::nullopt, fx.dependencies(true));

    writer.write(Record{{"a", 1}});
    writer.write(Record{{"a", 2}});

    REQUIRE(fx.client->request_count() == 2);
    REQUIRE(fx.tokens->fetch_count() == 1);
    REQUIRE(fx.client->requests()[1].headers.at("Authorization") == "Bearer token-1");
    REQUIRE(writer.credentials() != nullptr);
    REQUIRE(writer.credentials()->refresh_count() == 1);
}

TEST_CASE("HttpSinkWriter without OAuth2 sends no Authorization header", "[writer][auth]") {
    WriterFixture fx;
    HttpSinkWriter writer(base_config(), std::nullopt, fx.dependencies(true));

    writer.write(Record{{"a", 1}});

    REQUIRE(fx.tokens->fetch_count() == 0);
    REQUIRE(writer.credentials() == nullptr);
    REQUIRE_FALSE(get_header(fx.client->last_request()->headers, "Authorization").has_value());
}

TEST_CASE("HttpSinkWriter default token source calls the token endpoint", "[writer][auth]") {
    WriterFixture fx;
    fx.client->set_response_handler([](const HttpRequest& request) -> HttpClientResult<HttpClientResponse> {
        if (request.url == "https://auth/token") {
            return HttpClientResponse{200, {}, R"({"access_token":"live","expires_in":3600})"};
        }
        return HttpClientResponse{200, {}, ""};
    });
    auto config = base_config().with_oauth2(oauth_settings());
    HttpSinkWriter writer(config, std::nullopt, fx.dependencies());

    writer.write(Record{{"a", 1}});

    REQUIRE(fx.client->request_count() == 2);
    REQUIRE(fx.client->requests()[0].url == "https://auth/token");
    REQUIRE(fx.client->requests()[1].headers.at("Authorization") == "Bearer live");
}
