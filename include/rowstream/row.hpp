/**
 * rowstream/row.hpp - Row and column model
 *
 * Part of rowstream - a buffered, cancelable row cursor.
 *
 * A Row is an immutable list of JSON values plus the field names of the
 * result it belongs to. Rows of one result share a single name list.
 *
 *   auto names = rowstream::make_field_names(std::vector<std::string>{"id", "name"});
 *   auto row = rowstream::Row::from_array(json::array({1, "alice"}), names);
 *   row["name"];       // "alice"
 *   row.to_object();   // {"id":1,"name":"alice"}
 */

#pragma once

#include "json.hpp"

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace rowstream {

// ============================================================================
// Column Info
// ============================================================================

struct ColumnInfo {
    std::string name;
    std::string type_name;
    bool nullable = false;

    ColumnInfo() = default;
    ColumnInfo(std::string n, std::string type, bool null_ok)
        : name(std::move(n)), type_name(std::move(type)), nullable(null_ok) {}

    bool operator==(const ColumnInfo& other) const {
        return name == other.name && type_name == other.type_name &&
               nullable == other.nullable;
    }
    bool operator!=(const ColumnInfo& other) const { return !(*this == other); }
};

inline void to_json(json& j, const ColumnInfo& c) {
    j = json{{"name", c.name}, {"typeName", c.type_name}, {"nullable", c.nullable}};
}

inline void from_json(const json& j, ColumnInfo& c) {
    j.at("name").get_to(c.name);
    c.type_name = j.value("typeName", std::string());
    c.nullable = j.value("nullable", false);
}

using FieldNames = std::shared_ptr<const std::vector<std::string>>;

inline FieldNames make_field_names(std::vector<std::string> names) {
    return std::make_shared<const std::vector<std::string>>(std::move(names));
}

inline FieldNames make_field_names(const std::vector<ColumnInfo>& columns) {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& c : columns) {
        names.push_back(c.name);
    }
    return make_field_names(std::move(names));
}

// ============================================================================
// Row
// ============================================================================

class Row {
public:
    Row() : names_(make_field_names(std::vector<std::string>{})) {}

    Row(std::vector<json> values, FieldNames names)
        : values_(std::move(values)),
          names_(names ? std::move(names) : make_field_names(std::vector<std::string>{})) {
        if (values_.size() < names_->size()) {
            values_.resize(names_->size());
        }
    }

    /**
     * Build a row from positional values. Missing trailing values are null;
     * extra values are kept but have no name.
     */
    static Row from_array(const json& values, FieldNames names) {
        if (!values.is_array()) {
            throw std::invalid_argument("Row::from_array expects a JSON array");
        }
        return Row(values.get<std::vector<json>>(), std::move(names));
    }

    /// Build a row by looking up each field name in record. Missing keys are null.
    static Row from_object(const json& record, FieldNames names) {
        if (!record.is_object()) {
            throw std::invalid_argument("Row::from_object expects a JSON object");
        }
        std::vector<json> values;
        if (names) {
            values.reserve(names->size());
            for (const auto& name : *names) {
                auto it = record.find(name);
                values.push_back(it != record.end() ? *it : json());
            }
        }
        return Row(std::move(values), std::move(names));
    }

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    const json& operator[](size_t i) const { return values_[i]; }
    const json& operator[](const std::string& name) const { return at(name); }

    const json& at(size_t i) const { return values_.at(i); }

    const json& at(const std::string& name) const {
        const auto& names = *names_;
        for (size_t i = 0; i < names.size(); ++i) {
            if (names[i] == name) return values_[i];
        }
        throw std::out_of_range("No field named '" + name + "' in row");
    }

    bool has(const std::string& name) const {
        for (const auto& n : *names_) {
            if (n == name) return true;
        }
        return false;
    }

    const std::vector<json>& values() const { return values_; }
    const std::vector<std::string>& names() const { return *names_; }
    const FieldNames& field_names() const { return names_; }

    json to_array() const { return json(values_); }

    json to_object() const {
        json out = json::object();
        const auto& names = *names_;
        for (size_t i = 0; i < names.size(); ++i) {
            out[names[i]] = values_[i];
        }
        return out;
    }

    // Iterator support
    auto begin() const { return values_.begin(); }
    auto end() const { return values_.end(); }

    bool operator==(const Row& other) const {
        return values_ == other.values_ && *names_ == *other.names_;
    }
    bool operator!=(const Row& other) const { return !(*this == other); }

private:
    std::vector<json> values_;
    FieldNames names_;
};

// ============================================================================
// Column inference
// ============================================================================

inline const char* json_type_name(const json& v) {
    switch (v.type()) {
        case json::value_t::null:            return "unknown";
        case json::value_t::boolean:         return "boolean";
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float:    return "number";
        case json::value_t::string:          return "string";
        case json::value_t::array:           return "array";
        case json::value_t::object:          return "object";
        case json::value_t::binary:          return "binary";
        case json::value_t::discarded:       return "unknown";
    }
    return "unknown";
}

/**
 * Derive column info from a sample record. A null value gives type
 * "unknown" and marks the column nullable.
 */
inline std::vector<ColumnInfo> parse_columns(const json& record) {
    if (!record.is_object()) {
        throw std::invalid_argument("parse_columns expects a JSON object");
    }
    std::vector<ColumnInfo> cols;
    cols.reserve(record.size());
    for (auto it = record.begin(); it != record.end(); ++it) {
        cols.emplace_back(it.key(), json_type_name(it.value()), it.value().is_null());
    }
    return cols;
}

} // namespace rowstream
