#pragma once

#include "httpsink/errors.hpp"

#include <string>
#include <string_view>

namespace httpsink {

// ─────────────────────────────────────────────────────────────────────────────
// Charset
// ─────────────────────────────────────────────────────────────────────────────
// Charsets accepted for URL and form encoding. Input text is always UTF-8;
// encoding transcodes it to the target charset before percent-escaping.

enum class Charset {
    Utf8,
    UsAscii,
    Iso8859_1
};

[[nodiscard]] constexpr std::string_view to_string(Charset charset) noexcept {
    switch (charset) {
        case Charset::Utf8:      return "UTF-8";
        case Charset::UsAscii:   return "US-ASCII";
        case Charset::Iso8859_1: return "ISO-8859-1";
    }
    return "UTF-8";
}

/// Resolve a charset name ("UTF-8", "utf8", "ISO-8859-1", "latin1", ...).
/// Unknown names are an Encoding error.
[[nodiscard]] SinkResult<Charset> parse_charset(std::string_view name);

/// Transcode UTF-8 text into the target charset. Code points the charset
/// cannot represent become '?'. Malformed UTF-8 is an Encoding error.
[[nodiscard]] SinkResult<std::string> transcode(std::string_view utf8, Charset charset);

/// application/x-www-form-urlencoded escaping: [A-Za-z0-9.*_-] kept, space
/// as '+', every other byte of the transcoded text as %XX.
[[nodiscard]] SinkResult<std::string> url_encode(std::string_view value, Charset charset);

[[nodiscard]] SinkResult<std::string> url_encode(std::string_view value, std::string_view charset_name);

}  // namespace httpsink
