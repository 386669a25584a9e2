#pragma once

#include "httpsink/errors.hpp"
#include "httpsink/format/charset.hpp"
#include "httpsink/format/message_format.hpp"
#include "httpsink/placeholder/placeholder_resolver.hpp"
#include "httpsink/record.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace httpsink {

// ─────────────────────────────────────────────────────────────────────────────
// MessageBuffer Options
// ─────────────────────────────────────────────────────────────────────────────

struct MessageBufferOptions {
    MessageFormat format{MessageFormat::Json};

    // JSON only: render the batch as one array. When false, each record is
    // its own document and documents are joined by the delimiter.
    bool write_json_as_array{true};

    // JSON only: wrap the array as {"<key>": [...]}. Empty = no wrapping.
    std::string json_batch_key;

    // Separator between per-record messages (all formats except JSON arrays).
    std::string delimiter{"\n"};

    // Used by the Form format for escaping.
    Charset charset{Charset::Utf8};

    // Custom only: template with #field placeholders.
    std::optional<std::string> body_template;

    // Field order for CSV/TSV/Form. Without it, record order is used.
    std::optional<Schema> schema;
};

// ─────────────────────────────────────────────────────────────────────────────
// MessageBuffer
// ─────────────────────────────────────────────────────────────────────────────
// Pending records of one batch plus a cache of the rendered body, so retries
// of the same flush send byte-identical payloads without re-rendering.
//
// Owned by a single writer; not thread-safe.

class MessageBuffer {
public:
    explicit MessageBuffer(MessageBufferOptions options = {});

    void add(Record record);

    [[nodiscard]] std::size_t size() const noexcept {
        return records_.size();
    }

    [[nodiscard]] bool empty() const noexcept {
        return records_.empty();
    }

    [[nodiscard]] const std::vector<Record>& records() const noexcept {
        return records_;
    }

    /// Render the batch body. Empty optional when no records are buffered.
    /// A Custom template naming a field a record lacks is an Encoding error.
    [[nodiscard]] SinkResult<std::optional<std::string>> message() const;

    [[nodiscard]] std::string content_type() const {
        return std::string(content_type_for(options_.format));
    }

    [[nodiscard]] const MessageBufferOptions& options() const noexcept {
        return options_;
    }

    /// Drop all records. Safe to call on an empty buffer.
    void clear() noexcept;

private:
    [[nodiscard]] SinkResult<std::string> render() const;
    [[nodiscard]] std::string render_json() const;
    [[nodiscard]] std::string render_delimited(char separator) const;
    [[nodiscard]] SinkResult<std::string> render_form() const;
    [[nodiscard]] SinkResult<std::string> render_custom() const;

    [[nodiscard]] std::vector<std::string> field_order(const Record& record) const;

    MessageBufferOptions options_;
    std::vector<PlaceholderBinding> body_bindings_;
    std::vector<Record> records_;
    mutable std::optional<std::string> rendered_;
};

}  // namespace httpsink
