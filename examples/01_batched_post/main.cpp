// Example 01: Batched POST
//
// Sends a handful of records to an HTTP endpoint in JSON batches, retrying
// server errors with exponential backoff.

#include <httpsink/log/spdlog_logger.hpp>
#include <httpsink/sink/http_sink_writer.hpp>

#include <chrono>
#include <iostream>
#include <string>

using namespace httpsink;

int main(int argc, char* argv[]) {
    std::string url = "http://localhost:8080/ingest";

    // Simple arg parsing
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--url" && i + 1 < argc) {
            url = argv[++i];
        }
    }

    std::cout << "=== Batched POST Example ===\n\n";

    // 1. Log delivery progress to stderr
    set_logger(make_spdlog_console_logger(LogLevel::Info));

    // 2. Configure the sink
    SinkConfig config;
    config.with_url(url)
          .with_batch_size(3)
          .with_header("X-Source", "httpsink-example")
          .with_error_rule("5\\d\\d", "retry")
          .with_error_rule("4\\d\\d", "fail")
          .with_max_retry_duration(std::chrono::seconds{30});

    try {
        // 3. Create the writer
        HttpSinkWriter writer(config);

        // 4. Write records; every third one triggers a request
        for (int i = 1; i <= 7; ++i) {
            Record record;
            record["id"] = i;
            record["name"] = "record-" + std::to_string(i);
            writer.write(std::move(record));
            std::cout << "Wrote record " << i << " (pending: " << writer.pending() << ")\n";
        }

        // 5. Close flushes the final partial batch
        writer.close();

        std::cout << "\nDelivered " << writer.records_delivered() << " record(s) in "
                  << writer.batches_delivered() << " batch(es)\n";
    } catch (const SinkException& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        set_logger(nullptr);
        return 1;
    }

    set_logger(nullptr);
    return 0;
}
