#include "httpsink/sink/http_sink_writer.hpp"
#include "httpsink/auth/oauth2_token_source.hpp"
#include "httpsink/log/logger.hpp"

namespace httpsink {

namespace {

template <typename T>
T value_or_throw(SinkResult<T> result) {
    if (!result) {
        throw SinkException(std::move(result.error()));
    }
    return std::move(*result);
}

SinkConfig validated(SinkConfig config) {
    if (auto valid = config.validate(); !valid) {
        throw SinkException(valid.error());
    }
    return config;
}

MessageBufferOptions buffer_options(const SinkConfig& config, const std::optional<Schema>& schema) {
    MessageBufferOptions options;
    options.format = config.message_format;
    options.write_json_as_array = config.write_json_as_array;
    options.json_batch_key = config.json_batch_key;
    options.delimiter = config.delimiter_for_messages;
    options.charset = value_or_throw(parse_charset(config.charset));
    options.body_template = config.body;
    options.schema = schema;
    return options;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

HttpSinkWriter::HttpSinkWriter(
    SinkConfig config,
    std::optional<Schema> schema,
    WriterDependencies dependencies
)
    : config_(validated(std::move(config)))
    , schema_(std::move(schema))
    , buffer_(buffer_options(config_, schema_))
    , current_url_(config_.url)
{
    if (schema_.has_value()) {
        if (auto valid = config_.validate_schema(*schema_); !valid) {
            throw SinkException(valid.error());
        }
    }

    if (addresses_resource(config_.method)) {
        PlaceholderResolver resolver(config_.url, buffer_.options().charset,
                                     config_.url_placeholder_missing_field);
        if (resolver.has_placeholders()) {
            resolver_.emplace(std::move(resolver));
        }
    }

    std::shared_ptr<IHttpClient> http_client = dependencies.http_client;
    if (!http_client) {
        http_client = make_http_client();
    }

    if (config_.oauth2_enabled) {
        std::shared_ptr<ITokenSource> source = dependencies.token_source;
        if (!source) {
            source = std::make_shared<OAuth2TokenSource>(config_.oauth2, http_client);
        }
        credentials_ = std::make_shared<CredentialProvider>(std::move(source), dependencies.now);
    }

    engine_ = std::make_unique<DeliveryEngine>(
        value_or_throw(DeliverySettings::from_config(config_)),
        value_or_throw(config_.error_policy_table()),
        config_.retry_scheduler(),
        std::move(http_client),
        credentials_,
        dependencies.now,
        dependencies.sleep
    );

    HTTPSINK_LOG_DEBUG("writer", "Writer ready: {} {} batch={} format={}",
                       to_string(config_.method), config_.url, config_.batch_size,
                       to_string(config_.message_format));
}

// ─────────────────────────────────────────────────────────────────────────────
// Operations
// ─────────────────────────────────────────────────────────────────────────────

void HttpSinkWriter::write(Record record) {
    if (closed_) {
        throw SinkException(SinkError::configuration("Cannot write to a closed writer"));
    }

    if (resolver_.has_value()) {
        current_url_ = value_or_throw(resolver_->resolve(record));
    }

    buffer_.add(std::move(record));

    if (buffer_.size() >= config_.batch_size) {
        flush();
    }
}

void HttpSinkWriter::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    if (buffer_.empty() == false) {
        flush();
    }
    HTTPSINK_LOG_DEBUG("writer", "Writer closed after {} batch(es), {} record(s)",
                       batches_delivered_, records_delivered_);
}

void HttpSinkWriter::flush() {
    const auto records = buffer_.size();
    const auto report = value_or_throw(engine_->flush(buffer_, current_url_));
    if (report.attempts > 0) {
        ++batches_delivered_;
        records_delivered_ += records;
    }
}

}  // namespace httpsink
