#pragma once

#include <optional>
#include <string_view>

namespace httpsink {

// ─────────────────────────────────────────────────────────────────────────────
// Message Format
// ─────────────────────────────────────────────────────────────────────────────

enum class MessageFormat {
    Json,    // JSON array / wrapped array / one document per record
    Form,    // application/x-www-form-urlencoded, one line per record
    Csv,     // Comma-separated, one line per record
    Tsv,     // Tab-separated, one line per record
    Custom   // Body template with #field placeholders, one message per record
};

[[nodiscard]] constexpr std::string_view to_string(MessageFormat format) noexcept {
    switch (format) {
        case MessageFormat::Json:   return "JSON";
        case MessageFormat::Form:   return "Form";
        case MessageFormat::Csv:    return "CSV";
        case MessageFormat::Tsv:    return "TSV";
        case MessageFormat::Custom: return "Custom";
    }
    return "JSON";
}

[[nodiscard]] constexpr std::string_view content_type_for(MessageFormat format) noexcept {
    switch (format) {
        case MessageFormat::Json:   return "application/json";
        case MessageFormat::Form:   return "application/x-www-form-urlencoded";
        case MessageFormat::Csv:    return "text/csv";
        case MessageFormat::Tsv:    return "text/tab-separated-values";
        case MessageFormat::Custom: return "text/plain";
    }
    return "text/plain";
}

/// Case-insensitive; "delimited" is accepted as an alias for CSV.
[[nodiscard]] std::optional<MessageFormat> parse_message_format(std::string_view name);

}  // namespace httpsink
