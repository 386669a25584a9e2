// ─────────────────────────────────────────────────────────────────────────────
// httpsink-cli - Deliver newline-delimited JSON records to an HTTP endpoint
// ─────────────────────────────────────────────────────────────────────────────
// Reads one JSON object per line (file or stdin), writes each through an
// HttpSinkWriter and closes it, so every batch is delivered with the
// configured format, retry policy and error handling.
//
// Usage:
//   # Properties file using connector names (url, batchSize, httpErrorsHandling, ...)
//   httpsink-cli --config sink.json --input events.ndjson
//
//   # Flags override the file
//   cat events.ndjson | httpsink-cli -u https://api.example.com/events -b 50 \
//       -H "X-Api-Key: secret" --errors "5\\d\\d:retry,4\\d\\d:fail"
//
//   # PUT each record to its own resource
//   httpsink-cli -u "https://api.example.com/users/#id" -m PUT -i users.ndjson
//
// Exit status is 0 when every batch was delivered, 1 otherwise.

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "httpsink/config/sink_config.hpp"
#include "httpsink/log/spdlog_logger.hpp"
#include "httpsink/sink/http_sink_writer.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace httpsink;
using Json = nlohmann::ordered_json;

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset = "\033[0m";
    const char* dim   = "\033[2m";
    const char* red   = "\033[31m";
    const char* green = "\033[32m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_success(const std::string& msg) {
    std::cout << color::c(color::green) << "✓ " << color::c(color::reset) << msg << "\n";
}

void print_info(const std::string& msg) {
    std::cerr << color::c(color::dim) << msg << color::c(color::reset) << "\n";
}

// ═══════════════════════════════════════════════════════════════════════════
// Input
// ═══════════════════════════════════════════════════════════════════════════

std::optional<Json> load_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        print_error("Cannot open " + path);
        return std::nullopt;
    }
    try {
        return Json::parse(in);
    } catch (const Json::parse_error& e) {
        print_error(path + " is not valid JSON: " + e.what());
        return std::nullopt;
    }
}

// Flags take precedence over the properties file.
void apply_overrides(Json& properties, const cxxopts::ParseResult& result) {
    const auto set_string = [&](const char* flag, const char* property) {
        if (result.count(flag)) {
            properties[property] = result[flag].as<std::string>();
        }
    };

    set_string("url", "url");
    set_string("method", "method");
    set_string("format", "messageFormat");
    set_string("body", "body");
    set_string("charset", "charset");
    set_string("errors", "httpErrorsHandling");
    set_string("non-matching", "nonMatchingStatusPolicy");
    set_string("retry-policy", "retryPolicy");
    set_string("proxy", "proxyUrl");
    set_string("proxy-user", "proxyUsername");
    set_string("proxy-password", "proxyPassword");
    set_string("batch-key", "jsonBatchKey");

    if (result.count("batch-size")) {
        properties["batchSize"] = result["batch-size"].as<int>();
    }
    if (result.count("linear-interval")) {
        properties["linearRetryInterval"] = result["linear-interval"].as<long>();
    }
    if (result.count("max-retry-duration")) {
        properties["maxRetryDuration"] = result["max-retry-duration"].as<long>();
    }
    if (result.count("connect-timeout")) {
        properties["connectTimeout"] = result["connect-timeout"].as<long>();
    }
    if (result.count("read-timeout")) {
        properties["readTimeout"] = result["read-timeout"].as<long>();
    }
    if (result.count("insecure")) {
        properties["disableSSLValidation"] = true;
    }
    if (result.count("no-redirects")) {
        properties["followRedirects"] = false;
    }

    const auto headers = result["header"].as<std::vector<std::string>>();
    std::string joined = properties.contains("requestHeaders") && properties["requestHeaders"].is_string()
        ? properties["requestHeaders"].get<std::string>()
        : std::string{};
    for (const auto& header : headers) {
        if (header.empty()) {
            continue;
        }
        if (joined.empty() == false) {
            joined += "\n";
        }
        joined += header;
    }
    if (joined.empty() == false) {
        properties["requestHeaders"] = joined;
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Delivery
// ═══════════════════════════════════════════════════════════════════════════

int report_failure(const SinkException& e, const HttpSinkWriter* writer, bool json_output) {
    const auto& error = e.error();
    if (json_output) {
        Json output;
        output["status"] = "failed";
        output["category"] = std::string(to_string(error.category));
        output["message"] = error.message;
        if (error.http_status.has_value()) {
            output["http_status"] = *error.http_status;
        }
        if (error.url.empty() == false) {
            output["url"] = error.url;
        }
        output["attempts"] = error.attempts;
        if (writer != nullptr) {
            output["batches_delivered"] = writer->batches_delivered();
            output["records_delivered"] = writer->records_delivered();
        }
        std::cout << output.dump(2) << "\n";
    } else {
        print_error(e.what());
        if (writer != nullptr) {
            print_info("Delivered before failure: " + std::to_string(writer->records_delivered()) +
                       " record(s) in " + std::to_string(writer->batches_delivered()) + " batch(es)");
        }
    }
    return 1;
}

int run(HttpSinkWriter& writer, std::istream& input, bool json_output) {
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        Json record;
        try {
            record = Json::parse(line);
        } catch (const Json::parse_error& e) {
            print_error("Line " + std::to_string(line_number) + " is not valid JSON: " + e.what());
            return 1;
        }
        if (record.is_object() == false) {
            print_error("Line " + std::to_string(line_number) + " is not a JSON object");
            return 1;
        }

        try {
            writer.write(std::move(record));
        } catch (const SinkException& e) {
            return report_failure(e, &writer, json_output);
        }
    }

    try {
        writer.close();
    } catch (const SinkException& e) {
        return report_failure(e, &writer, json_output);
    }

    if (json_output) {
        Json output;
        output["status"] = "ok";
        output["batches_delivered"] = writer.batches_delivered();
        output["records_delivered"] = writer.records_delivered();
        std::cout << output.dump(2) << "\n";
    } else {
        print_success("Delivered " + std::to_string(writer.records_delivered()) + " record(s) in " +
                      std::to_string(writer.batches_delivered()) + " batch(es)");
    }
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("httpsink-cli", "Batched HTTP delivery of newline-delimited JSON records");

    options.add_options()
        // Configuration sources
        ("c,config", "Sink properties file (JSON, connector property names)", cxxopts::value<std::string>())
        ("s,schema", "Record schema file (JSON)", cxxopts::value<std::string>())
        ("i,input", "Records file, one JSON object per line ('-' for stdin)", cxxopts::value<std::string>()->default_value("-"))

        // Target
        ("u,url", "Target URL; #field placeholders are resolved for PUT/DELETE", cxxopts::value<std::string>())
        ("m,method", "GET, POST, PUT or DELETE", cxxopts::value<std::string>())
        ("H,header", "Request header (can be repeated, format: 'Name: Value')", cxxopts::value<std::vector<std::string>>()->default_value(""))

        // Payload
        ("b,batch-size", "Records per request", cxxopts::value<int>())
        ("f,format", "json, form, csv, tsv or custom", cxxopts::value<std::string>())
        ("batch-key", "Wrap the JSON array as {\"<key>\": [...]}", cxxopts::value<std::string>())
        ("body", "Body template for the custom format", cxxopts::value<std::string>())
        ("charset", "Charset for URL and form encoding", cxxopts::value<std::string>())

        // Retry & error handling
        ("errors", "Status handling, e.g. '5\\d\\d:retry,4\\d\\d:fail'", cxxopts::value<std::string>())
        ("non-matching", "failNonSuccess or retryServerErrors", cxxopts::value<std::string>())
        ("retry-policy", "linear or exponential", cxxopts::value<std::string>())
        ("linear-interval", "Seconds between linear retries", cxxopts::value<long>())
        ("max-retry-duration", "Maximum seconds spent retrying one batch", cxxopts::value<long>())

        // Connection
        ("connect-timeout", "Connect timeout in ms (0 = none)", cxxopts::value<long>())
        ("read-timeout", "Read timeout in ms (0 = none)", cxxopts::value<long>())
        ("no-redirects", "Do not follow redirects")
        ("insecure", "Skip TLS certificate validation")
        ("proxy", "Proxy URL", cxxopts::value<std::string>())
        ("proxy-user", "Proxy username", cxxopts::value<std::string>())
        ("proxy-password", "Proxy password", cxxopts::value<std::string>())

        // Output
        ("j,json", "Print the delivery report as JSON")
        ("no-color", "Disable colored output")
        ("v,verbose", "Log delivery progress to stderr (debug level)")
        ("log-level", "trace, debug, info, warn, error or off", cxxopts::value<std::string>())
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        color::enabled = !result.count("no-color");
        const bool json_output = result.count("json") > 0;

        // Logging
        std::optional<LogLevel> level;
        if (result.count("verbose")) {
            level = LogLevel::Debug;
        }
        if (result.count("log-level")) {
            level = parse_log_level(result["log-level"].as<std::string>());
            if (level.has_value() == false) {
                print_error("Unknown log level '" + result["log-level"].as<std::string>() + "'");
                return 1;
            }
        }
        if (result.count("log-file")) {
            set_logger(make_spdlog_console_file_logger(result["log-file"].as<std::string>(),
                                                       level.value_or(LogLevel::Info)));
        } else if (level.has_value()) {
            set_logger(make_spdlog_console_logger(*level));
        }

        // Configuration
        Json properties = Json::object();
        if (result.count("config")) {
            auto loaded = load_json_file(result["config"].as<std::string>());
            if (loaded.has_value() == false) {
                return 1;
            }
            properties = std::move(*loaded);
            if (properties.is_object() == false) {
                print_error("Sink properties file must contain a JSON object");
                return 1;
            }
        }
        apply_overrides(properties, result);

        auto config = SinkConfig::from_json(properties);
        if (!config) {
            print_error(config.error().describe());
            return 1;
        }

        std::optional<Schema> schema;
        if (result.count("schema")) {
            auto loaded = load_json_file(result["schema"].as<std::string>());
            if (loaded.has_value() == false) {
                return 1;
            }
            auto parsed = schema_from_json(*loaded);
            if (!parsed) {
                print_error(parsed.error().describe());
                return 1;
            }
            schema = std::move(*parsed);
        }

        std::unique_ptr<HttpSinkWriter> writer;
        try {
            writer = std::make_unique<HttpSinkWriter>(std::move(*config), std::move(schema));
        } catch (const SinkException& e) {
            return report_failure(e, nullptr, json_output);
        }

        const auto input_path = result["input"].as<std::string>();
        if (input_path == "-") {
            return run(*writer, std::cin, json_output);
        }

        std::ifstream input(input_path);
        if (!input) {
            print_error("Cannot open " + input_path);
            return 1;
        }
        return run(*writer, input, json_output);

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}
