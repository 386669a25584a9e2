#include "httpsink/http/http_types.hpp"

#include <ada.h>

#include <charconv>

namespace httpsink {

namespace {

// ada reports the protocol with its trailing colon ("https:").
std::string_view scheme_of(std::string_view protocol) {
    if (protocol.ends_with(':')) {
        protocol.remove_suffix(1);
    }
    return protocol;
}

std::optional<std::uint16_t> port_of(std::string_view explicit_port, bool secure) {
    if (explicit_port.empty()) {
        return secure ? std::uint16_t{443} : std::uint16_t{80};
    }
    std::uint16_t port = 0;
    const auto* last = explicit_port.data() + explicit_port.size();
    const auto [end, ec] = std::from_chars(explicit_port.data(), last, port);
    if (ec != std::errc{} || end != last) {
        return std::nullopt;
    }
    return port;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// URL Parser (ada-url)
// ─────────────────────────────────────────────────────────────────────────────
// Delivery targets and token endpoints are http(s) only. The fragment is not
// part of UrlComponents, so "https://x/#id" parses with path "/".

std::optional<UrlComponents> parse_url(const std::string& url) {
    const auto parsed = ada::parse<ada::url>(url);
    if (!parsed) {
        return std::nullopt;
    }

    const std::string protocol(parsed->get_protocol());
    const std::string_view scheme = scheme_of(protocol);
    if (scheme != "http" && scheme != "https") {
        return std::nullopt;
    }

    std::string host(parsed->get_hostname());
    if (host.empty()) {
        return std::nullopt;
    }

    const std::string explicit_port(parsed->get_port());
    const auto port = port_of(explicit_port, scheme == "https");
    if (port.has_value() == false) {
        return std::nullopt;
    }

    UrlComponents components{
        std::string(scheme),
        std::move(host),
        *port,
        std::string(parsed->get_pathname()),
        std::string(parsed->get_search()),
        std::string(parsed->get_username()),
        std::string(parsed->get_password()),
    };
    if (components.path.empty()) {
        components.path = "/";
    }
    return components;
}

}  // namespace httpsink
