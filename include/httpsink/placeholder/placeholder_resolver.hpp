#ifndef HTTPSINK_PLACEHOLDER_PLACEHOLDER_RESOLVER_HPP
#define HTTPSINK_PLACEHOLDER_PLACEHOLDER_RESOLVER_HPP

#include "httpsink/errors.hpp"
#include "httpsink/format/charset.hpp"
#include "httpsink/record.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace httpsink {

// ─────────────────────────────────────────────────────────────────────────────
// Placeholder Bindings
// ─────────────────────────────────────────────────────────────────────────────
// A placeholder is "#" followed by one or more word characters, e.g. "#user_id".
// Offsets are byte offsets into the original template; [start, end) covers the
// whole token including the '#'.

struct PlaceholderBinding {
    std::string field;
    std::size_t start{0};
    std::size_t end{0};

    bool operator==(const PlaceholderBinding&) const = default;
};

/// Find every placeholder in text, in left-to-right order.
[[nodiscard]] std::vector<PlaceholderBinding> extract_placeholders(std::string_view text);

// ─────────────────────────────────────────────────────────────────────────────
// Missing Field Policy
// ─────────────────────────────────────────────────────────────────────────────
// What to do when a record lacks (or has null for) a field the URL references.

enum class MissingFieldPolicy {
    LeaveToken,   ///< Keep "#field" in the URL (default)
    Fail,         ///< Encoding error for the flush
    EmptyString   ///< Substitute nothing
};

[[nodiscard]] constexpr std::string_view to_string(MissingFieldPolicy policy) noexcept {
    switch (policy) {
        case MissingFieldPolicy::LeaveToken:  return "leave";
        case MissingFieldPolicy::Fail:        return "fail";
        case MissingFieldPolicy::EmptyString: return "empty";
    }
    return "leave";
}

[[nodiscard]] std::optional<MissingFieldPolicy> parse_missing_field_policy(std::string_view name);

// ─────────────────────────────────────────────────────────────────────────────
// PlaceholderResolver
// ─────────────────────────────────────────────────────────────────────────────
// Binds a URL template once and renders it per record. The template itself is
// never modified; each resolve() works on a fresh copy and substitutes from the
// last binding to the first so earlier offsets stay valid.
//
// Usage:
//   PlaceholderResolver resolver("https://api.example.com/users/#id", Charset::Utf8);
//   auto url = resolver.resolve(Record{{"id", "42"}});   // ".../users/42"

class PlaceholderResolver {
public:
    PlaceholderResolver(
        std::string url_template,
        Charset charset,
        MissingFieldPolicy missing_field_policy = MissingFieldPolicy::LeaveToken
    );

    [[nodiscard]] SinkResult<std::string> resolve(const Record& record) const;

    [[nodiscard]] const std::vector<PlaceholderBinding>& bindings() const noexcept {
        return bindings_;
    }

    [[nodiscard]] bool has_placeholders() const noexcept {
        return bindings_.empty() == false;
    }

    [[nodiscard]] const std::string& url_template() const noexcept {
        return template_;
    }

private:
    std::string template_;
    Charset charset_;
    MissingFieldPolicy missing_field_policy_;
    std::vector<PlaceholderBinding> bindings_;
};

}  // namespace httpsink

#endif  // HTTPSINK_PLACEHOLDER_PLACEHOLDER_RESOLVER_HPP
