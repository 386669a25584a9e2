// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "httpsink/log/spdlog_logger.hpp"
#include "httpsink/log/logger.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace httpsink;

namespace {

std::unique_ptr<SpdlogLogger> make_stream_logger(std::ostringstream& out, LogLevel level) {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto logger = std::make_unique<SpdlogLogger>(std::vector<spdlog::sink_ptr>{sink}, level);
    logger->set_pattern("%l %v");
    return logger;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Basic Functionality Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger can be created with console sink", "[log][spdlog]") {
    auto logger = make_spdlog_console_logger(LogLevel::Debug);
    REQUIRE(logger != nullptr);

    REQUIRE(logger->should_log(LogLevel::Debug));
    REQUIRE(logger->should_log(LogLevel::Info));
    REQUIRE_FALSE(logger->should_log(LogLevel::Trace));
    REQUIRE_FALSE(logger->should_log(LogLevel::Off));
}

TEST_CASE("SpdlogLogger can change log level", "[log][spdlog]") {
    auto logger = make_spdlog_console_logger(LogLevel::Info);
    REQUIRE_FALSE(logger->should_log(LogLevel::Debug));

    logger->set_level(LogLevel::Debug);

    REQUIRE(logger->should_log(LogLevel::Debug));
    REQUIRE(logger->spdlog_logger()->level() == spdlog::level::debug);
}

TEST_CASE("SpdlogLogger level conversion", "[log][spdlog]") {
    REQUIRE(SpdlogLogger::to_spdlog_level(LogLevel::Warn) == spdlog::level::warn);
    REQUIRE(SpdlogLogger::to_spdlog_level(LogLevel::Error) == spdlog::level::err);
    REQUIRE(SpdlogLogger::from_spdlog_level(spdlog::level::critical) == LogLevel::Error);
    REQUIRE(SpdlogLogger::from_spdlog_level(spdlog::level::trace) == LogLevel::Trace);
}

TEST_CASE("SpdlogLogger writes the component tag", "[log][spdlog]") {
    std::ostringstream out;
    auto logger = make_stream_logger(out, LogLevel::Info);

    logger->info_fmt("delivery", "delivered {} records", 2);
    logger->debug_fmt("delivery", "hidden");
    logger->flush();

    const auto text = out.str();
    REQUIRE(text.find("info [delivery] delivered 2 records") != std::string::npos);
    REQUIRE(text.find("hidden") == std::string::npos);
}

TEST_CASE("SpdlogLogger wraps an existing spdlog logger", "[log][spdlog]") {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto inner = std::make_shared<spdlog::logger>("wrapped", sink);
    inner->set_level(spdlog::level::warn);
    inner->set_pattern("%v");

    SpdlogLogger logger(inner);
    REQUIRE_FALSE(logger.should_log(LogLevel::Info));
    REQUIRE(logger.should_log(LogLevel::Warn));

    logger.warn_fmt("auth", "token refresh failed");
    logger.flush();
    REQUIRE(out.str().find("[auth] token refresh failed") != std::string::npos);
}

TEST_CASE("SpdlogLogger rejects a null spdlog logger", "[log][spdlog]") {
    REQUIRE_THROWS_AS(SpdlogLogger(std::shared_ptr<spdlog::logger>{}), std::invalid_argument);
}

TEST_CASE("SpdlogLogger receives HTTPSINK_LOG macros once installed", "[log][spdlog]") {
    std::ostringstream out;
    auto logger = make_stream_logger(out, LogLevel::Info);
    auto* raw = logger.get();
    set_logger(std::move(logger));

    HTTPSINK_LOG_INFO("writer", "closing with {} pending", 4);
    raw->flush();
    set_logger(nullptr);

    REQUIRE(out.str().find("[writer] closing with 4 pending") != std::string::npos);
}

// ═══════════════════════════════════════════════════════════════════════════
// File Logging Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger can log to file", "[log][spdlog][file]") {
    const std::string test_file = "test_httpsink_spdlog.log";
    std::filesystem::remove(test_file);

    {
        auto logger = make_spdlog_file_logger(test_file, LogLevel::Warn);
        logger->info_fmt("delivery", "This should not appear");
        logger->warn_fmt("delivery", "Connection refused, retrying");
        logger->flush();
    }

    REQUIRE(std::filesystem::exists(test_file));

    std::ifstream file(test_file);
    REQUIRE(file.is_open());
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    REQUIRE(content.find("Connection refused, retrying") != std::string::npos);
    REQUIRE(content.find("This should not appear") == std::string::npos);

    file.close();
    std::filesystem::remove(test_file);
}
