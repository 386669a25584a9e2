#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "httpsink/retry/error_policy.hpp"

using namespace httpsink;
using Catch::Matchers::ContainsSubstring;

// ═══════════════════════════════════════════════════════════════════════════
// Compilation
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ErrorPolicyTable compiles rules in declaration order", "[retry][error-policy]") {
    auto table = ErrorPolicyTable::compile({
        {"5\\d\\d", "retry"},
        {"4\\d\\d", "fail"},
        {"2\\d\\d", "success"},
    });

    REQUIRE(table.has_value());
    REQUIRE(table->size() == 3);
    REQUIRE(table->entries()[0].pattern == "5\\d\\d");
    REQUIRE(table->entries()[0].action == RetryAction::Retry);
    REQUIRE(table->entries()[1].action == RetryAction::Fail);
    REQUIRE(table->entries()[2].action == RetryAction::Success);
}

TEST_CASE("ErrorPolicyTable accepts actions case-insensitively", "[retry][error-policy]") {
    auto table = ErrorPolicyTable::compile({{"503", "RETRY"}, {"404", "Success"}});

    REQUIRE(table.has_value());
    REQUIRE(table->resolve(503) == RetryAction::Retry);
    REQUIRE(table->resolve(404) == RetryAction::Success);
}

TEST_CASE("ErrorPolicyTable rejects an invalid regex", "[retry][error-policy]") {
    auto table = ErrorPolicyTable::compile({{"5\\d\\d", "retry"}, {"4(\\d", "fail"}});

    REQUIRE_FALSE(table.has_value());
    REQUIRE(table.error().category == ErrorCategory::Configuration);
    REQUIRE_THAT(table.error().message, ContainsSubstring("4(\\d"));
}

TEST_CASE("ErrorPolicyTable rejects an unknown action", "[retry][error-policy]") {
    auto table = ErrorPolicyTable::compile({{"5\\d\\d", "explode"}});

    REQUIRE_FALSE(table.has_value());
    REQUIRE(table.error().is_configuration());
    REQUIRE_THAT(table.error().message, ContainsSubstring("explode"));
    REQUIRE_THAT(table.error().message, ContainsSubstring("5\\d\\d"));
}

// ═══════════════════════════════════════════════════════════════════════════
// Resolution
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ErrorPolicyTable first matching rule wins", "[retry][error-policy]") {
    auto table = ErrorPolicyTable::compile({
        {"503", "fail"},
        {"5\\d\\d", "retry"},
    });
    REQUIRE(table.has_value());

    SECTION("Specific rule declared first takes precedence") {
        REQUIRE(table->resolve(503) == RetryAction::Fail);
        REQUIRE(table->match_index(503) == 0u);
    }

    SECTION("Other server errors fall to the broader rule") {
        REQUIRE(table->resolve(500) == RetryAction::Retry);
        REQUIRE(table->resolve(599) == RetryAction::Retry);
        REQUIRE(table->match_index(502) == 1u);
    }
}

TEST_CASE("ErrorPolicyTable patterns must match the whole status", "[retry][error-policy]") {
    auto table = ErrorPolicyTable::compile({{"50", "retry"}, {"3..", "success"}});
    REQUIRE(table.has_value());

    REQUIRE_FALSE(table->match_index(503).has_value());
    REQUIRE_FALSE(table->match_index(150).has_value());
    REQUIRE(table->match_index(302) == 1u);
}

TEST_CASE("ErrorPolicyTable fallback without a matching rule", "[retry][error-policy]") {
    SECTION("FailNonSuccess: 2xx succeeds, everything else fails") {
        ErrorPolicyTable table(NonMatchingStatusPolicy::FailNonSuccess);

        REQUIRE(table.empty());
        REQUIRE(table.resolve(200) == RetryAction::Success);
        REQUIRE(table.resolve(204) == RetryAction::Success);
        REQUIRE(table.resolve(301) == RetryAction::Fail);
        REQUIRE(table.resolve(404) == RetryAction::Fail);
        REQUIRE(table.resolve(503) == RetryAction::Fail);
    }

    SECTION("RetryServerErrors: 5xx retries") {
        ErrorPolicyTable table(NonMatchingStatusPolicy::RetryServerErrors);

        REQUIRE(table.resolve(201) == RetryAction::Success);
        REQUIRE(table.resolve(500) == RetryAction::Retry);
        REQUIRE(table.resolve(503) == RetryAction::Retry);
        REQUIRE(table.resolve(429) == RetryAction::Fail);
    }

    SECTION("Rules take precedence over the fallback") {
        auto table = ErrorPolicyTable::compile({{"2\\d\\d", "fail"}},
                                               NonMatchingStatusPolicy::RetryServerErrors);
        REQUIRE(table.has_value());
        REQUIRE(table->resolve(200) == RetryAction::Fail);
        REQUIRE(table->resolve(502) == RetryAction::Retry);
    }
}

TEST_CASE("ErrorPolicyTable resolution is deterministic", "[retry][error-policy]") {
    auto table = ErrorPolicyTable::compile({{"4\\d\\d", "fail"}, {"5\\d\\d", "retry"}});
    REQUIRE(table.has_value());

    for (int i = 0; i < 3; ++i) {
        REQUIRE(table->resolve(404) == RetryAction::Fail);
        REQUIRE(table->resolve(500) == RetryAction::Retry);
    }
}

TEST_CASE("Policy names round-trip through parse and to_string", "[retry][error-policy]") {
    REQUIRE(parse_retry_action("fail") == RetryAction::Fail);
    REQUIRE_FALSE(parse_retry_action("skip").has_value());
    REQUIRE(to_string(RetryAction::Success) == "success");

    REQUIRE(parse_non_matching_status_policy("retryServerErrors") == NonMatchingStatusPolicy::RetryServerErrors);
    REQUIRE(parse_non_matching_status_policy(to_string(NonMatchingStatusPolicy::FailNonSuccess)) ==
            NonMatchingStatusPolicy::FailNonSuccess);
    REQUIRE_FALSE(parse_non_matching_status_policy("ignore").has_value());
}
