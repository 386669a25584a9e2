#pragma once

#include <nlohmann/json.hpp>

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace httpsink {

// ─────────────────────────────────────────────────────────────────────────────
// Record
// ─────────────────────────────────────────────────────────────────────────────
// Records arrive from the host as JSON objects. ordered_json keeps the field
// insertion order, which the delimited and form formats rely on when no
// schema is supplied.

using Record = nlohmann::ordered_json;

// Look up a field; nullopt when the record is not an object or lacks the field.
[[nodiscard]] inline std::optional<Record> get_field(const Record& record, std::string_view name) {
    const bool is_object = record.is_object();
    if (is_object == false) {
        return std::nullopt;
    }
    const auto it = record.find(std::string(name));
    if (it == record.end()) {
        return std::nullopt;
    }
    return *it;
}

// Text form of a field value as it appears in a URL, form or template:
// strings unquoted, null empty, everything else as compact JSON.
[[nodiscard]] inline std::string value_to_text(const Record& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return {};
    }
    return value.dump();
}

// ─────────────────────────────────────────────────────────────────────────────
// Schema
// ─────────────────────────────────────────────────────────────────────────────

enum class FieldType {
    String,
    Int,
    Long,
    Float,
    Double,
    Boolean,
    Bytes,
    Record,
    Array,
    Null
};

struct SchemaField {
    std::string name;
    FieldType type{FieldType::String};
    bool nullable{true};
};

struct Schema {
    std::vector<SchemaField> fields;

    [[nodiscard]] bool has_field(std::string_view name) const {
        return std::ranges::any_of(fields, [&name](const SchemaField& field) {
            return field.name == name;
        });
    }

    [[nodiscard]] std::vector<std::string> field_names() const {
        std::vector<std::string> names;
        names.reserve(fields.size());
        for (const auto& field : fields) {
            names.push_back(field.name);
        }
        return names;
    }

    [[nodiscard]] bool empty() const noexcept {
        return fields.empty();
    }
};

}  // namespace httpsink
