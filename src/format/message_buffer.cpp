#include "httpsink/format/message_buffer.hpp"
#include "httpsink/http/http_types.hpp"

#include <format>

namespace httpsink {

std::optional<MessageFormat> parse_message_format(std::string_view name) {
    if (iequals(name, "json"))      return MessageFormat::Json;
    if (iequals(name, "form"))      return MessageFormat::Form;
    if (iequals(name, "csv"))       return MessageFormat::Csv;
    if (iequals(name, "delimited")) return MessageFormat::Csv;
    if (iequals(name, "tsv"))       return MessageFormat::Tsv;
    if (iequals(name, "custom"))    return MessageFormat::Custom;
    return std::nullopt;
}

namespace {

// RFC 4180: quote when the value holds the separator, a quote or a line break.
std::string quote_field(const std::string& value, char separator) {
    const bool needs_quotes =
        (value.find(separator) != std::string::npos) ||
        (value.find('"') != std::string::npos) ||
        (value.find('\n') != std::string::npos) ||
        (value.find('\r') != std::string::npos);
    if (needs_quotes == false) {
        return value;
    }

    std::string quoted;
    quoted.reserve(value.size() + 2);
    quoted.push_back('"');
    for (const char c : value) {
        if (c == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

MessageBuffer::MessageBuffer(MessageBufferOptions options)
    : options_(std::move(options))
{
    const bool is_custom = (options_.format == MessageFormat::Custom);
    if (is_custom && options_.body_template.has_value()) {
        body_bindings_ = extract_placeholders(*options_.body_template);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Buffer Operations
// ─────────────────────────────────────────────────────────────────────────────

void MessageBuffer::add(Record record) {
    records_.push_back(std::move(record));
    rendered_.reset();
}

void MessageBuffer::clear() noexcept {
    records_.clear();
    rendered_.reset();
}

SinkResult<std::optional<std::string>> MessageBuffer::message() const {
    if (records_.empty()) {
        return std::optional<std::string>{};
    }

    if (rendered_.has_value()) {
        return rendered_;
    }

    auto body = render();
    if (!body) {
        return tl::unexpected(body.error());
    }
    rendered_ = std::move(*body);
    return rendered_;
}

// ─────────────────────────────────────────────────────────────────────────────
// Rendering
// ─────────────────────────────────────────────────────────────────────────────

// Serializing a string field that is not valid UTF-8 throws type_error 316.
SinkResult<std::string> MessageBuffer::render() const {
    try {
        switch (options_.format) {
            case MessageFormat::Json:   return render_json();
            case MessageFormat::Csv:    return render_delimited(',');
            case MessageFormat::Tsv:    return render_delimited('\t');
            case MessageFormat::Form:   return render_form();
            case MessageFormat::Custom: return render_custom();
        }
    } catch (const nlohmann::json::type_error& e) {
        return tl::unexpected(SinkError::encoding(
            std::format("Batch of {} record(s) cannot be serialized: {}", records_.size(), e.what())));
    }
    return tl::unexpected(SinkError::configuration("Unknown message format"));
}

std::string MessageBuffer::render_json() const {
    if (options_.write_json_as_array == false) {
        std::string joined;
        for (std::size_t i = 0; i < records_.size(); ++i) {
            if (i > 0) {
                joined += options_.delimiter;
            }
            joined += records_[i].dump();
        }
        return joined;
    }

    Record batch = Record::array();
    for (const auto& record : records_) {
        batch.push_back(record);
    }

    const bool wrap = (options_.json_batch_key.empty() == false);
    if (wrap) {
        Record wrapper = Record::object();
        wrapper[options_.json_batch_key] = std::move(batch);
        return wrapper.dump();
    }
    return batch.dump();
}

std::vector<std::string> MessageBuffer::field_order(const Record& record) const {
    const bool has_schema = options_.schema.has_value() && (options_.schema->empty() == false);
    if (has_schema) {
        return options_.schema->field_names();
    }

    std::vector<std::string> names;
    if (record.is_object()) {
        for (const auto& [key, value] : record.items()) {
            names.push_back(key);
        }
    }
    return names;
}

std::string MessageBuffer::render_delimited(char separator) const {
    std::string body;
    for (std::size_t i = 0; i < records_.size(); ++i) {
        if (i > 0) {
            body += options_.delimiter;
        }

        const auto& record = records_[i];
        const auto names = field_order(record);
        std::string line;
        for (std::size_t f = 0; f < names.size(); ++f) {
            if (f > 0) {
                line.push_back(separator);
            }
            const auto value = get_field(record, names[f]);
            const std::string text = value.has_value() ? value_to_text(*value) : std::string{};
            line += quote_field(text, separator);
        }
        body += line;
    }
    return body;
}

SinkResult<std::string> MessageBuffer::render_form() const {
    std::string body;
    for (std::size_t i = 0; i < records_.size(); ++i) {
        if (i > 0) {
            body += options_.delimiter;
        }

        const auto& record = records_[i];
        const auto names = field_order(record);
        std::string line;
        for (std::size_t f = 0; f < names.size(); ++f) {
            const auto value = get_field(record, names[f]);
            const std::string text = value.has_value() ? value_to_text(*value) : std::string{};

            auto key = url_encode(names[f], options_.charset);
            if (!key) {
                return tl::unexpected(key.error());
            }
            auto encoded = url_encode(text, options_.charset);
            if (!encoded) {
                return tl::unexpected(encoded.error());
            }

            if (f > 0) {
                line.push_back('&');
            }
            line += *key;
            line.push_back('=');
            line += *encoded;
        }
        body += line;
    }
    return body;
}

SinkResult<std::string> MessageBuffer::render_custom() const {
    const bool has_template = options_.body_template.has_value();
    if (has_template == false) {
        return tl::unexpected(SinkError::configuration(
            "Custom message format requires a body template"));
    }
    const std::string& body_template = *options_.body_template;

    std::string body;
    for (std::size_t i = 0; i < records_.size(); ++i) {
        if (i > 0) {
            body += options_.delimiter;
        }

        std::string message = body_template;
        for (auto it = body_bindings_.rbegin(); it != body_bindings_.rend(); ++it) {
            const auto value = get_field(records_[i], it->field);
            if (value.has_value() == false) {
                return tl::unexpected(SinkError::encoding(std::format(
                    "Custom message template references '#{}' but record {} of the batch has no such field",
                    it->field, i)));
            }
            message.replace(it->start, it->end - it->start, value_to_text(*value));
        }
        body += message;
    }
    return body;
}

}  // namespace httpsink
