#include "httpsink/format/charset.hpp"
#include "httpsink/http/http_types.hpp"

#include <array>
#include <cstdint>
#include <format>

namespace httpsink {

namespace {

struct CharsetAlias {
    std::string_view name;
    Charset charset;
};

constexpr std::array<CharsetAlias, 9> kCharsetAliases{{
    {"UTF-8", Charset::Utf8},
    {"UTF8", Charset::Utf8},
    {"US-ASCII", Charset::UsAscii},
    {"ASCII", Charset::UsAscii},
    {"US_ASCII", Charset::UsAscii},
    {"ISO-8859-1", Charset::Iso8859_1},
    {"ISO8859-1", Charset::Iso8859_1},
    {"ISO_8859_1", Charset::Iso8859_1},
    {"LATIN1", Charset::Iso8859_1},
}};

// Decode one UTF-8 sequence starting at pos. Returns false on malformed input.
bool decode_code_point(std::string_view text, std::size_t& pos, std::uint32_t& code_point) {
    const auto lead = static_cast<unsigned char>(text[pos]);

    std::size_t length = 0;
    if (lead < 0x80) {
        code_point = lead;
        length = 1;
    } else if ((lead & 0xE0) == 0xC0) {
        code_point = lead & 0x1F;
        length = 2;
    } else if ((lead & 0xF0) == 0xE0) {
        code_point = lead & 0x0F;
        length = 3;
    } else if ((lead & 0xF8) == 0xF0) {
        code_point = lead & 0x07;
        length = 4;
    } else {
        return false;
    }

    const bool truncated = (pos + length > text.size());
    if (truncated) {
        return false;
    }

    for (std::size_t i = 1; i < length; ++i) {
        const auto continuation = static_cast<unsigned char>(text[pos + i]);
        const bool valid = ((continuation & 0xC0) == 0x80);
        if (valid == false) {
            return false;
        }
        code_point = (code_point << 6) | (continuation & 0x3F);
    }

    pos += length;
    return true;
}

bool is_unreserved(unsigned char c) {
    const bool alpha = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    const bool digit = (c >= '0' && c <= '9');
    return alpha || digit || c == '.' || c == '-' || c == '*' || c == '_';
}

}  // namespace

SinkResult<Charset> parse_charset(std::string_view name) {
    for (const auto& alias : kCharsetAliases) {
        if (iequals(alias.name, name)) {
            return alias.charset;
        }
    }
    return tl::unexpected(SinkError::encoding(
        std::format("Unsupported charset '{}'", name)));
}

SinkResult<std::string> transcode(std::string_view utf8, Charset charset) {
    if (charset == Charset::Utf8) {
        return std::string(utf8);
    }

    const std::uint32_t max_code_point = (charset == Charset::UsAscii) ? 0x7F : 0xFF;

    std::string out;
    out.reserve(utf8.size());
    std::size_t pos = 0;
    while (pos < utf8.size()) {
        std::uint32_t code_point = 0;
        const std::size_t start = pos;
        const bool decoded = decode_code_point(utf8, pos, code_point);
        if (decoded == false) {
            return tl::unexpected(SinkError::encoding(
                std::format("Malformed UTF-8 at byte {} while encoding to {}", start, to_string(charset))));
        }
        const bool representable = (code_point <= max_code_point);
        out.push_back(representable ? static_cast<char>(code_point) : '?');
    }
    return out;
}

SinkResult<std::string> url_encode(std::string_view value, Charset charset) {
    auto bytes = transcode(value, charset);
    if (!bytes) {
        return tl::unexpected(bytes.error());
    }

    static constexpr std::string_view kHex = "0123456789ABCDEF";

    std::string encoded;
    encoded.reserve(bytes->size() * 3);
    for (const char ch : *bytes) {
        const auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            encoded.push_back(ch);
        } else if (c == ' ') {
            encoded.push_back('+');
        } else {
            encoded.push_back('%');
            encoded.push_back(kHex[c >> 4]);
            encoded.push_back(kHex[c & 0x0F]);
        }
    }
    return encoded;
}

SinkResult<std::string> url_encode(std::string_view value, std::string_view charset_name) {
    const auto charset = parse_charset(charset_name);
    if (!charset) {
        return tl::unexpected(charset.error());
    }
    return url_encode(value, *charset);
}

}  // namespace httpsink
