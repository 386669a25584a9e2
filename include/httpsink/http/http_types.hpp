#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>

namespace httpsink {

// ─────────────────────────────────────────────────────────────────────────────
// Case-Insensitive Header Lookup
// ─────────────────────────────────────────────────────────────────────────────
// HTTP header names are case-insensitive per RFC 7230.

using HeaderMap = std::unordered_map<std::string, std::string>;

[[nodiscard]] inline bool iequals(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size() &&
           std::ranges::equal(lhs, rhs,
               [](char a, char b) {
                   return std::tolower(static_cast<unsigned char>(a)) ==
                          std::tolower(static_cast<unsigned char>(b));
               });
}

/// Find a header by name (case-insensitive).
inline HeaderMap::const_iterator find_header(
    const HeaderMap& headers,
    std::string_view name
) {
    return std::ranges::find_if(headers,
        [&name](const auto& pair) {
            return iequals(pair.first, name);
        });
}

/// Get header value by name (case-insensitive).
inline std::optional<std::string> get_header(
    const HeaderMap& headers,
    std::string_view name
) {
    const auto it = find_header(headers, name);
    const bool found = (it != headers.end());
    if (found) {
        return it->second;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Method
// ─────────────────────────────────────────────────────────────────────────────

enum class HttpMethod {
    Get,
    Post,
    Put,
    Delete
};

inline std::string to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:    return "GET";
        case HttpMethod::Post:   return "POST";
        case HttpMethod::Put:    return "PUT";
        case HttpMethod::Delete: return "DELETE";
    }
    return "UNKNOWN";
}

/// Parse a method name (case-insensitive). nullopt for anything outside
/// GET/POST/PUT/DELETE.
[[nodiscard]] inline std::optional<HttpMethod> parse_method(std::string_view name) {
    if (iequals(name, "GET"))    return HttpMethod::Get;
    if (iequals(name, "POST"))   return HttpMethod::Post;
    if (iequals(name, "PUT"))    return HttpMethod::Put;
    if (iequals(name, "DELETE")) return HttpMethod::Delete;
    return std::nullopt;
}

/// POST and PUT carry the rendered batch as request body.
[[nodiscard]] constexpr bool carries_body(HttpMethod method) noexcept {
    return method == HttpMethod::Post || method == HttpMethod::Put;
}

/// PUT and DELETE address a single resource, so the URL may hold placeholders.
[[nodiscard]] constexpr bool addresses_resource(HttpMethod method) noexcept {
    return method == HttpMethod::Put || method == HttpMethod::Delete;
}

// ─────────────────────────────────────────────────────────────────────────────
// HttpRequest
// ─────────────────────────────────────────────────────────────────────────────

struct HttpRequest {
    HttpMethod method{HttpMethod::Post};
    std::string url;                  // Fully resolved target URL
    HeaderMap headers;
    std::optional<std::string> body;  // Only for POST/PUT

    HttpRequest& with_header(const std::string& name, const std::string& value) {
        headers[name] = value;
        return *this;
    }

    HttpRequest& with_body(const std::string& content) {
        body = content;
        return *this;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// URL Components
// ─────────────────────────────────────────────────────────────────────────────
// Parsed with ada-url (WHATWG-compliant URL parser).

struct UrlComponents {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::uint16_t port;   // Explicit port or scheme default
    std::string path;     // Includes leading slash
    std::string query;    // Includes "?" when present
    std::string username;
    std::string password;

    [[nodiscard]] bool is_secure() const {
        return scheme == "https";
    }

    [[nodiscard]] std::string host_with_port() const {
        return host + ":" + std::to_string(port);
    }
};

/// Parse an http/https URL. Returns nullopt for malformed URLs, other schemes
/// or an empty host.
std::optional<UrlComponents> parse_url(const std::string& url);

}  // namespace httpsink
