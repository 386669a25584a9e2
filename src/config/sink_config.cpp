#include "httpsink/config/sink_config.hpp"

#include <chrono>
#include <format>
#include <string_view>

namespace httpsink {

namespace {

std::string_view trim(std::string_view text) {
    constexpr std::string_view kWhitespace = " \t\r";
    const auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

std::vector<std::string_view> split(std::string_view text, char separator) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (start <= text.size()) {
        const auto pos = text.find(separator, start);
        if (pos == std::string_view::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

// ─────────────────────────────────────────────────────────────────────────────
// Property Readers
// ─────────────────────────────────────────────────────────────────────────────
// Connector properties often arrive as strings ("10", "true"); numbers and
// booleans are accepted in either form.

// Retry windows are added to clock readings; keep them well inside the range
// of the steady clock so the arithmetic cannot overflow.
constexpr std::chrono::seconds kMaxRetryWindow =
    std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::duration::max()) / 2;

SinkError property_error(std::string_view name, std::string_view expected) {
    return SinkError::configuration(std::format("Property '{}' must be {}", name, expected));
}

SinkResult<std::optional<std::string>> read_string(const nlohmann::ordered_json& props, std::string_view name) {
    const auto it = props.find(std::string(name));
    if (it == props.end() || it->is_null()) {
        return std::optional<std::string>{};
    }
    if (it->is_string() == false) {
        return tl::unexpected(property_error(name, "a string"));
    }
    return std::optional<std::string>{it->get<std::string>()};
}

SinkResult<std::optional<bool>> read_bool(const nlohmann::ordered_json& props, std::string_view name) {
    const auto it = props.find(std::string(name));
    if (it == props.end() || it->is_null()) {
        return std::optional<bool>{};
    }
    if (it->is_boolean()) {
        return std::optional<bool>{it->get<bool>()};
    }
    if (it->is_string()) {
        const auto text = it->get<std::string>();
        if (iequals(text, "true"))  return std::optional<bool>{true};
        if (iequals(text, "false")) return std::optional<bool>{false};
    }
    return tl::unexpected(property_error(name, "a boolean"));
}

SinkResult<std::optional<std::int64_t>> read_int(const nlohmann::ordered_json& props, std::string_view name) {
    const auto it = props.find(std::string(name));
    if (it == props.end() || it->is_null()) {
        return std::optional<std::int64_t>{};
    }
    if (it->is_number_integer()) {
        return std::optional<std::int64_t>{it->get<std::int64_t>()};
    }
    if (it->is_string()) {
        const auto text = it->get<std::string>();
        try {
            std::size_t consumed = 0;
            const auto value = std::stoll(text, &consumed);
            if (consumed == text.size()) {
                return std::optional<std::int64_t>{value};
            }
        } catch (const std::exception&) {
            // Reported below.
        }
    }
    return tl::unexpected(property_error(name, "an integer"));
}

SinkResult<std::vector<ErrorPolicyRule>> read_error_rules(const nlohmann::ordered_json& value) {
    if (value.is_null()) {
        return std::vector<ErrorPolicyRule>{};
    }
    if (value.is_string()) {
        return parse_error_rules(value.get<std::string>());
    }

    std::vector<ErrorPolicyRule> rules;
    if (value.is_object()) {
        for (const auto& [pattern, action] : value.items()) {
            if (action.is_string() == false) {
                return tl::unexpected(property_error("httpErrorsHandling", "a map of pattern to action string"));
            }
            rules.push_back(ErrorPolicyRule{pattern, action.get<std::string>()});
        }
        return rules;
    }
    if (value.is_array()) {
        for (const auto& entry : value) {
            const bool well_formed =
                entry.is_object() &&
                entry.contains("pattern") && entry["pattern"].is_string() &&
                entry.contains("action") && entry["action"].is_string();
            if (well_formed == false) {
                return tl::unexpected(property_error(
                    "httpErrorsHandling", "an array of {\"pattern\", \"action\"} objects"));
            }
            rules.push_back(ErrorPolicyRule{
                entry["pattern"].get<std::string>(), entry["action"].get<std::string>()});
        }
        return rules;
    }
    return tl::unexpected(property_error("httpErrorsHandling", "a string, object or array"));
}

std::optional<FieldType> parse_field_type(std::string_view name) {
    if (iequals(name, "string"))  return FieldType::String;
    if (iequals(name, "int"))     return FieldType::Int;
    if (iequals(name, "long"))    return FieldType::Long;
    if (iequals(name, "float"))   return FieldType::Float;
    if (iequals(name, "double"))  return FieldType::Double;
    if (iequals(name, "boolean")) return FieldType::Boolean;
    if (iequals(name, "bytes"))   return FieldType::Bytes;
    if (iequals(name, "record"))  return FieldType::Record;
    if (iequals(name, "array"))   return FieldType::Array;
    if (iequals(name, "null"))    return FieldType::Null;
    return std::nullopt;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Text Forms
// ─────────────────────────────────────────────────────────────────────────────

SinkResult<HeaderMap> parse_request_headers(std::string_view text) {
    HeaderMap headers;
    for (const auto raw_line : split(text, '\n')) {
        const auto line = trim(raw_line);
        if (line.empty()) {
            continue;
        }

        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return tl::unexpected(SinkError::configuration(
                std::format("Unable to parse key-value pair '{}'.", line)));
        }

        const auto name = trim(line.substr(0, colon));
        if (name.empty()) {
            return tl::unexpected(SinkError::configuration(
                std::format("Request header line '{}' has an empty name", line)));
        }
        headers[std::string(name)] = std::string(trim(line.substr(colon + 1)));
    }
    return headers;
}

SinkResult<std::vector<ErrorPolicyRule>> parse_error_rules(std::string_view text) {
    std::vector<ErrorPolicyRule> rules;
    if (trim(text).empty()) {
        return rules;
    }

    for (const auto raw_entry : split(text, ',')) {
        const auto entry = trim(raw_entry);
        if (entry.empty()) {
            continue;
        }

        const auto colon = entry.rfind(':');
        if (colon == std::string_view::npos || trim(entry.substr(colon + 1)).empty()) {
            return tl::unexpected(SinkError::configuration(
                std::format("Missing value for key {}", entry)));
        }
        rules.push_back(ErrorPolicyRule{
            std::string(trim(entry.substr(0, colon))),
            std::string(trim(entry.substr(colon + 1)))});
    }
    return rules;
}

SinkResult<Schema> schema_from_json(const nlohmann::ordered_json& document) {
    const nlohmann::ordered_json* fields = &document;
    if (document.is_object() && document.contains("fields")) {
        fields = &document["fields"];
    }
    if (fields->is_array() == false) {
        return tl::unexpected(SinkError::configuration("Schema must be an array of fields or {\"fields\": [...]}"));
    }

    Schema schema;
    for (const auto& entry : *fields) {
        const bool has_name = entry.is_object() && entry.contains("name") && entry["name"].is_string();
        if (has_name == false) {
            return tl::unexpected(SinkError::configuration("Schema field must be an object with a string \"name\""));
        }

        SchemaField field;
        field.name = entry["name"].get<std::string>();

        if (entry.contains("type")) {
            const auto type_name = entry["type"].is_string() ? entry["type"].get<std::string>() : std::string{};
            const auto type = parse_field_type(type_name);
            if (type.has_value() == false) {
                return tl::unexpected(SinkError::configuration(
                    std::format("Schema field '{}' has unsupported type '{}'", field.name, type_name)));
            }
            field.type = *type;
        }
        if (entry.contains("nullable") && entry["nullable"].is_boolean()) {
            field.nullable = entry["nullable"].get<bool>();
        }
        schema.fields.push_back(std::move(field));
    }
    return schema;
}

// ─────────────────────────────────────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────────────────────────────────────

SinkResult<void> SinkConfig::validate() const {
    std::vector<std::string> failures;

    if (url.empty()) {
        failures.emplace_back("URL must be set");
    } else if (parse_url(url).has_value() == false) {
        failures.push_back(std::format("URL '{}' is malformed", url));
    }

    if (batch_size < 1) {
        failures.emplace_back("Batch size must be greater than 0.");
    }
    if (connect_timeout.count() < 0) {
        failures.emplace_back("Connection Timeout cannot be a negative number.");
    }
    if (read_timeout.count() < 0) {
        failures.emplace_back("Read Timeout cannot be a negative number.");
    }
    if (max_retry_duration.count() < 0) {
        failures.emplace_back("Max retry duration cannot be a negative number.");
    } else if (max_retry_duration > kMaxRetryWindow) {
        failures.push_back(std::format("Max retry duration cannot exceed {}s.", kMaxRetryWindow.count()));
    }

    if (retry_policy == RetryPolicyKind::Linear) {
        if (linear_retry_interval.has_value() == false) {
            failures.emplace_back("Linear retry interval must be set when retry policy is linear.");
        } else if (linear_retry_interval->count() < 0) {
            failures.emplace_back("Linear retry interval cannot be a negative number.");
        } else if (*linear_retry_interval > kMaxRetryWindow) {
            failures.push_back(std::format("Linear retry interval cannot exceed {}s.", kMaxRetryWindow.count()));
        }
    }

    const bool needs_body = (message_format == MessageFormat::Custom);
    if (needs_body && (body.has_value() == false || body->empty())) {
        failures.emplace_back("For Custom message format, message cannot be null.");
    }

    if (auto parsed = parse_charset(charset); !parsed) {
        failures.push_back(parsed.error().message);
    }

    if (auto headers = request_headers_map(); !headers) {
        failures.push_back(headers.error().message);
    }

    if (auto table = error_policy_table(); !table) {
        failures.push_back(table.error().message);
    }

    if (proxy.has_value() && (proxy->url.empty() == false)) {
        if (parse_url(proxy->url).has_value() == false) {
            failures.push_back(std::format("Proxy URL '{}' is malformed", proxy->url));
        }
    }

    if (oauth2_enabled) {
        if (oauth2.token_url.empty() || (parse_url(oauth2.token_url).has_value() == false)) {
            failures.emplace_back("OAuth2 token URL must be a valid http(s) URL.");
        }
        if (oauth2.client_id.empty()) {
            failures.emplace_back("OAuth2 client ID must be set.");
        }
        if (oauth2.client_secret.empty()) {
            failures.emplace_back("OAuth2 client secret must be set.");
        }
        if (oauth2.refresh_token.empty()) {
            failures.emplace_back("OAuth2 refresh token must be set.");
        }
    }

    if (failures.empty()) {
        return {};
    }

    std::string joined;
    for (const auto& failure : failures) {
        if (joined.empty() == false) {
            joined += "; ";
        }
        joined += failure;
    }
    return tl::unexpected(SinkError::configuration(std::move(joined)));
}

SinkResult<void> SinkConfig::validate_schema(const Schema& schema) const {
    if (schema.empty()) {
        return tl::unexpected(SinkError::configuration("Schema must contain at least one field"));
    }

    if (addresses_resource(method)) {
        for (const auto& binding : extract_placeholders(url)) {
            if (schema.has_field(binding.field) == false) {
                return tl::unexpected(SinkError::configuration(std::format(
                    "Schema must contain all fields mentioned in the url: '{}' is missing", binding.field)));
            }
        }
    }

    const bool is_custom = (message_format == MessageFormat::Custom) && body.has_value();
    if (is_custom) {
        for (const auto& binding : extract_placeholders(*body)) {
            if (schema.has_field(binding.field) == false) {
                return tl::unexpected(SinkError::configuration(std::format(
                    "Schema must contain all fields mentioned in the message body: '{}' is missing",
                    binding.field)));
            }
        }
    }

    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Derived Values
// ─────────────────────────────────────────────────────────────────────────────

SinkResult<HeaderMap> SinkConfig::request_headers_map() const {
    return parse_request_headers(request_headers);
}

SinkResult<ErrorPolicyTable> SinkConfig::error_policy_table() const {
    return ErrorPolicyTable::compile(http_errors_handling, non_matching_status_policy);
}

RetryScheduler SinkConfig::retry_scheduler() const {
    const std::chrono::milliseconds max_duration = max_retry_duration;
    if (retry_policy == RetryPolicyKind::Linear) {
        return RetryScheduler::fixed(linear_retry_interval.value_or(std::chrono::seconds{0}), max_duration);
    }
    return RetryScheduler::exponential(max_duration);
}

// ─────────────────────────────────────────────────────────────────────────────
// Loading
// ─────────────────────────────────────────────────────────────────────────────

SinkResult<SinkConfig> SinkConfig::from_json(const nlohmann::ordered_json& properties) {
    if (properties.is_object() == false) {
        return tl::unexpected(SinkError::configuration("Sink configuration must be a JSON object"));
    }

    SinkConfig config;

    auto url = read_string(properties, "url");
    if (!url) {
        return tl::unexpected(url.error());
    }
    if (url->has_value()) config.url = **url;

    auto method = read_string(properties, "method");
    if (!method) {
        return tl::unexpected(method.error());
    }
    if (method->has_value()) {
        const auto parsed = parse_method(**method);
        if (parsed.has_value() == false) {
            return tl::unexpected(SinkError::configuration(
                std::format("Unsupported value for 'method': '{}'", **method)));
        }
        config.method = *parsed;
    }

    auto batch_size = read_int(properties, "batchSize");
    if (!batch_size) {
        return tl::unexpected(batch_size.error());
    }
    if (batch_size->has_value()) {
        if (**batch_size < 1) {
            return tl::unexpected(SinkError::configuration("Batch size must be greater than 0."));
        }
        config.batch_size = static_cast<std::size_t>(**batch_size);
    }

    auto as_array = read_bool(properties, "writeJsonAsArray");
    if (!as_array) {
        return tl::unexpected(as_array.error());
    }
    if (as_array->has_value()) config.write_json_as_array = **as_array;

    auto batch_key = read_string(properties, "jsonBatchKey");
    if (!batch_key) {
        return tl::unexpected(batch_key.error());
    }
    if (batch_key->has_value()) config.json_batch_key = **batch_key;

    auto delimiter = read_string(properties, "delimiterForMessages");
    if (!delimiter) {
        return tl::unexpected(delimiter.error());
    }
    if (delimiter->has_value()) config.delimiter_for_messages = **delimiter;

    auto format = read_string(properties, "messageFormat");
    if (!format) {
        return tl::unexpected(format.error());
    }
    if (format->has_value()) {
        const auto parsed = parse_message_format(**format);
        if (parsed.has_value() == false) {
            return tl::unexpected(SinkError::configuration(
                std::format("Unsupported value for 'messageFormat': '{}'", **format)));
        }
        config.message_format = *parsed;
    }

    auto body = read_string(properties, "body");
    if (!body) {
        return tl::unexpected(body.error());
    }
    if (body->has_value()) config.body = **body;

    auto headers = read_string(properties, "requestHeaders");
    if (!headers) {
        return tl::unexpected(headers.error());
    }
    if (headers->has_value()) config.request_headers = **headers;

    auto charset = read_string(properties, "charset");
    if (!charset) {
        return tl::unexpected(charset.error());
    }
    if (charset->has_value()) config.charset = **charset;

    auto follow = read_bool(properties, "followRedirects");
    if (!follow) {
        return tl::unexpected(follow.error());
    }
    if (follow->has_value()) config.follow_redirects = **follow;

    auto insecure = read_bool(properties, "disableSSLValidation");
    if (!insecure) {
        return tl::unexpected(insecure.error());
    }
    if (insecure->has_value()) config.disable_ssl_validation = **insecure;

    if (properties.contains("httpErrorsHandling")) {
        auto rules = read_error_rules(properties["httpErrorsHandling"]);
        if (!rules) {
            return tl::unexpected(rules.error());
        }
        config.http_errors_handling = std::move(*rules);
    }

    auto fallback = read_string(properties, "nonMatchingStatusPolicy");
    if (!fallback) {
        return tl::unexpected(fallback.error());
    }
    if (fallback->has_value()) {
        const auto parsed = parse_non_matching_status_policy(**fallback);
        if (parsed.has_value() == false) {
            return tl::unexpected(SinkError::configuration(
                std::format("Unsupported value for 'nonMatchingStatusPolicy': '{}'", **fallback)));
        }
        config.non_matching_status_policy = *parsed;
    }

    auto retry_policy = read_string(properties, "retryPolicy");
    if (!retry_policy) {
        return tl::unexpected(retry_policy.error());
    }
    if (retry_policy->has_value()) {
        const auto parsed = parse_retry_policy_kind(**retry_policy);
        if (parsed.has_value() == false) {
            return tl::unexpected(SinkError::configuration(
                std::format("Unsupported value for 'retryPolicy': '{}'", **retry_policy)));
        }
        config.retry_policy = *parsed;
    }

    auto linear_interval = read_int(properties, "linearRetryInterval");
    if (!linear_interval) {
        return tl::unexpected(linear_interval.error());
    }
    if (linear_interval->has_value()) config.linear_retry_interval = std::chrono::seconds{**linear_interval};

    auto max_duration = read_int(properties, "maxRetryDuration");
    if (!max_duration) {
        return tl::unexpected(max_duration.error());
    }
    if (max_duration->has_value()) config.max_retry_duration = std::chrono::seconds{**max_duration};

    auto connect_timeout = read_int(properties, "connectTimeout");
    if (!connect_timeout) {
        return tl::unexpected(connect_timeout.error());
    }
    if (connect_timeout->has_value()) config.connect_timeout = std::chrono::milliseconds{**connect_timeout};

    auto read_timeout = read_int(properties, "readTimeout");
    if (!read_timeout) {
        return tl::unexpected(read_timeout.error());
    }
    if (read_timeout->has_value()) config.read_timeout = std::chrono::milliseconds{**read_timeout};

    auto proxy_url = read_string(properties, "proxyUrl");
    if (!proxy_url) {
        return tl::unexpected(proxy_url.error());
    }
    auto proxy_username = read_string(properties, "proxyUsername");
    if (!proxy_username) {
        return tl::unexpected(proxy_username.error());
    }
    auto proxy_password = read_string(properties, "proxyPassword");
    if (!proxy_password) {
        return tl::unexpected(proxy_password.error());
    }
    if (proxy_url->has_value() && ((*proxy_url)->empty() == false)) {
        config.proxy = ProxySettings{
            **proxy_url,
            proxy_username->value_or(std::string{}),
            proxy_password->value_or(std::string{})
        };
    }

    auto oauth2_enabled = read_bool(properties, "oauth2Enabled");
    if (!oauth2_enabled) {
        return tl::unexpected(oauth2_enabled.error());
    }
    if (oauth2_enabled->has_value()) config.oauth2_enabled = **oauth2_enabled;

    auto token_url = read_string(properties, "tokenUrl");
    if (!token_url) {
        return tl::unexpected(token_url.error());
    }
    auto client_id = read_string(properties, "clientId");
    if (!client_id) {
        return tl::unexpected(client_id.error());
    }
    auto client_secret = read_string(properties, "clientSecret");
    if (!client_secret) {
        return tl::unexpected(client_secret.error());
    }
    auto refresh_token = read_string(properties, "refreshToken");
    if (!refresh_token) {
        return tl::unexpected(refresh_token.error());
    }
    auto scopes = read_string(properties, "scopes");
    if (!scopes) {
        return tl::unexpected(scopes.error());
    }
    config.oauth2.token_url = token_url->value_or(std::string{});
    config.oauth2.client_id = client_id->value_or(std::string{});
    config.oauth2.client_secret = client_secret->value_or(std::string{});
    config.oauth2.refresh_token = refresh_token->value_or(std::string{});
    config.oauth2.scopes = scopes->value_or(std::string{});

    auto missing_field = read_string(properties, "urlPlaceholderMissingField");
    if (!missing_field) {
        return tl::unexpected(missing_field.error());
    }
    if (missing_field->has_value()) {
        const auto parsed = parse_missing_field_policy(**missing_field);
        if (parsed.has_value() == false) {
            return tl::unexpected(SinkError::configuration(
                std::format("Unsupported value for 'urlPlaceholderMissingField': '{}'", **missing_field)));
        }
        config.url_placeholder_missing_field = *parsed;
    }

    return config;
}

// ─────────────────────────────────────────────────────────────────────────────
// Builder-Style Helpers
// ─────────────────────────────────────────────────────────────────────────────

SinkConfig& SinkConfig::with_url(std::string target) {
    url = std::move(target);
    return *this;
}

SinkConfig& SinkConfig::with_method(HttpMethod m) {
    method = m;
    return *this;
}

SinkConfig& SinkConfig::with_batch_size(std::size_t size) {
    batch_size = size;
    return *this;
}

SinkConfig& SinkConfig::with_format(MessageFormat format) {
    message_format = format;
    return *this;
}

SinkConfig& SinkConfig::with_body(std::string template_text) {
    body = std::move(template_text);
    return *this;
}

SinkConfig& SinkConfig::with_header(const std::string& name, const std::string& value) {
    if (request_headers.empty() == false && request_headers.back() != '\n') {
        request_headers.push_back('\n');
    }
    request_headers += name + ":" + value;
    return *this;
}

SinkConfig& SinkConfig::with_error_rule(std::string pattern, std::string action) {
    http_errors_handling.push_back(ErrorPolicyRule{std::move(pattern), std::move(action)});
    return *this;
}

SinkConfig& SinkConfig::with_linear_retry(std::chrono::seconds interval) {
    retry_policy = RetryPolicyKind::Linear;
    linear_retry_interval = interval;
    return *this;
}

SinkConfig& SinkConfig::with_max_retry_duration(std::chrono::seconds duration) {
    max_retry_duration = duration;
    return *this;
}

SinkConfig& SinkConfig::with_oauth2(OAuth2Config settings) {
    oauth2_enabled = true;
    oauth2 = std::move(settings);
    return *this;
}

}  // namespace httpsink
