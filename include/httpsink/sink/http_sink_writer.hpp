#ifndef HTTPSINK_SINK_HTTP_SINK_WRITER_HPP
#define HTTPSINK_SINK_HTTP_SINK_WRITER_HPP

#include "httpsink/auth/credential_provider.hpp"
#include "httpsink/config/sink_config.hpp"
#include "httpsink/delivery/delivery_engine.hpp"
#include "httpsink/format/message_buffer.hpp"
#include "httpsink/http/http_client.hpp"
#include "httpsink/placeholder/placeholder_resolver.hpp"
#include "httpsink/record.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace httpsink {

// ─────────────────────────────────────────────────────────────────────────────
// Writer Dependencies
// ─────────────────────────────────────────────────────────────────────────────
// Collaborators the writer would otherwise create itself. Tests inject mocks
// and a fake clock here.

struct WriterDependencies {
    std::shared_ptr<IHttpClient> http_client;     // Default: make_http_client()
    std::shared_ptr<ITokenSource> token_source;   // Default: OAuth2TokenSource when OAuth2 is enabled
    NowFunction now;
    DeliveryEngine::SleepFunction sleep;
};

// ─────────────────────────────────────────────────────────────────────────────
// HttpSinkWriter
// ─────────────────────────────────────────────────────────────────────────────
// Host-facing sink. Buffers records and flushes a batch every batch_size
// writes; close() sends the remaining partial batch.
//
// For PUT and DELETE the target URL is re-resolved from each written record,
// so a batch goes to the URL of its last record.
//
// Errors cross this boundary as SinkException: configuration problems from
// the constructor, delivery and encoding failures from write() and close().
//
// Usage:
//   HttpSinkWriter writer(SinkConfig{}.with_url("https://api.example.com/events")
//                                     .with_batch_size(100));
//   for (auto& record : records) {
//       writer.write(std::move(record));
//   }
//   writer.close();

class HttpSinkWriter {
public:
    explicit HttpSinkWriter(
        SinkConfig config,
        std::optional<Schema> schema = std::nullopt,
        WriterDependencies dependencies = {}
    );

    HttpSinkWriter(const HttpSinkWriter&) = delete;
    HttpSinkWriter& operator=(const HttpSinkWriter&) = delete;

    void write(Record record);

    /// Flush the partial batch. Later calls are no-ops.
    void close();

    [[nodiscard]] bool is_closed() const noexcept {
        return closed_;
    }

    [[nodiscard]] std::size_t pending() const noexcept {
        return buffer_.size();
    }

    [[nodiscard]] std::size_t batches_delivered() const noexcept {
        return batches_delivered_;
    }

    [[nodiscard]] std::size_t records_delivered() const noexcept {
        return records_delivered_;
    }

    /// URL the next flush will target.
    [[nodiscard]] const std::string& current_url() const noexcept {
        return current_url_;
    }

    [[nodiscard]] const SinkConfig& config() const noexcept {
        return config_;
    }

    [[nodiscard]] DeliveryEngine& engine() noexcept {
        return *engine_;
    }

    [[nodiscard]] const CredentialProvider* credentials() const noexcept {
        return credentials_.get();
    }

private:
    void flush();

    SinkConfig config_;
    std::optional<Schema> schema_;
    MessageBuffer buffer_;
    std::optional<PlaceholderResolver> resolver_;
    std::shared_ptr<CredentialProvider> credentials_;
    std::unique_ptr<DeliveryEngine> engine_;

    std::string current_url_;
    std::size_t batches_delivered_{0};
    std::size_t records_delivered_{0};
    bool closed_{false};
};

}  // namespace httpsink

#endif  // HTTPSINK_SINK_HTTP_SINK_WRITER_HPP
