#include "httpsink/placeholder/placeholder_resolver.hpp"
#include "httpsink/http/http_types.hpp"

#include <format>
#include <regex>

namespace httpsink {

std::vector<PlaceholderBinding> extract_placeholders(std::string_view text) {
    static const std::regex placeholder_regex(R"(#(\w+))");

    std::vector<PlaceholderBinding> bindings;
    const std::string subject(text);
    const auto begin = std::sregex_iterator(subject.begin(), subject.end(), placeholder_regex);
    const auto end = std::sregex_iterator();
    for (auto it = begin; it != end; ++it) {
        const auto& match = *it;
        const auto start = static_cast<std::size_t>(match.position(0));
        const auto length = static_cast<std::size_t>(match.length(0));
        bindings.push_back(PlaceholderBinding{match[1].str(), start, start + length});
    }
    return bindings;
}

std::optional<MissingFieldPolicy> parse_missing_field_policy(std::string_view name) {
    if (iequals(name, "leave"))  return MissingFieldPolicy::LeaveToken;
    if (iequals(name, "fail"))   return MissingFieldPolicy::Fail;
    if (iequals(name, "empty"))  return MissingFieldPolicy::EmptyString;
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// PlaceholderResolver
// ─────────────────────────────────────────────────────────────────────────────

PlaceholderResolver::PlaceholderResolver(
    std::string url_template,
    Charset charset,
    MissingFieldPolicy missing_field_policy
)
    : template_(std::move(url_template))
    , charset_(charset)
    , missing_field_policy_(missing_field_policy)
    , bindings_(extract_placeholders(template_))
{}

SinkResult<std::string> PlaceholderResolver::resolve(const Record& record) const {
    std::string url = template_;

    for (auto it = bindings_.rbegin(); it != bindings_.rend(); ++it) {
        const auto& binding = *it;
        const auto value = get_field(record, binding.field);
        const bool missing = (value.has_value() == false) || value->is_null();

        std::string replacement;
        if (missing) {
            switch (missing_field_policy_) {
                case MissingFieldPolicy::LeaveToken:
                    continue;
                case MissingFieldPolicy::Fail:
                    return tl::unexpected(SinkError::encoding(std::format(
                        "URL placeholder '#{}' has no value in record", binding.field)));
                case MissingFieldPolicy::EmptyString:
                    break;
            }
        } else {
            std::string text;
            try {
                text = value_to_text(*value);
            } catch (const nlohmann::json::type_error& e) {
                return tl::unexpected(SinkError::encoding(std::format(
                    "URL placeholder '#{}' value cannot be serialized: {}", binding.field, e.what())));
            }
            auto encoded = url_encode(text, charset_);
            if (!encoded) {
                return tl::unexpected(encoded.error());
            }
            replacement = std::move(*encoded);
        }

        url.replace(binding.start, binding.end - binding.start, replacement);
    }

    return url;
}

}  // namespace httpsink
