#pragma once

#include "core/error.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace sysmlsql {

// {"@id": "..."}, a pointer to another element
struct Reference {
    std::string id;
    bool operator==(const Reference&) const = default;
};

using ReferenceList = std::vector<Reference>;

// Any object or array that is not a reference (list)
struct StructuredValue {
    nlohmann::json json;
    bool operator==(const StructuredValue&) const = default;
};

using FieldValue = std::variant<
    std::monostate,     // null
    bool,
    int64_t,
    double,
    std::string,
    Reference,
    ReferenceList,
    StructuredValue
>;

[[nodiscard]] inline bool holds_reference(const FieldValue& v) {
    return std::holds_alternative<Reference>(v) || std::holds_alternative<ReferenceList>(v);
}

/**
 * @brief One model object, as parsed from an element document
 *
 * Immutable after parsing. Properties exclude the identifier and type-tag.
 */
struct Element {
    std::string id;
    std::string type;
    std::map<std::string, FieldValue> properties;

    [[nodiscard]] const FieldValue* find(const std::string& name) const {
        const auto it = properties.find(name);
        return it == properties.end() ? nullptr : &it->second;
    }

    bool operator==(const Element&) const = default;
};

/**
 * @brief Classify one JSON property value
 * @param id_field Member name marking a reference object
 */
[[nodiscard]] FieldValue to_field_value(const nlohmann::json& value, const std::string& id_field);

/**
 * @brief Parse an element document (a JSON array of element objects)
 *
 * Every entry needs string identifier and type-tag members. Entries that
 * repeat an identifier collapse when identical and are an error otherwise.
 * First occurrence order is kept.
 */
[[nodiscard]] Result<std::vector<Element>, ImportError> parse_elements(
    const nlohmann::json& document,
    const std::string& id_field = "@id",
    const std::string& type_field = "@type");

} // namespace sysmlsql
