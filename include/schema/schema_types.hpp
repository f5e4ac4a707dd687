#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sysmlsql {

// ============================================================================
// Field kinds
// ============================================================================

enum class FieldKind : uint8_t {
    STRING,
    INTEGER,
    NUMBER,
    BOOLEAN,
    STRUCTURED,         // array or object, stored as canonical JSON text
    REFERENCE,          // exactly one other element, lowered into a relation
    REFERENCE_LIST,     // many other elements, lowered into relations
    POLYMORPHIC         // known to be either a literal or a reference
};

[[nodiscard]] inline const char* field_kind_to_string(FieldKind kind) {
    switch (kind) {
        case FieldKind::STRING:         return "string";
        case FieldKind::INTEGER:        return "integer";
        case FieldKind::NUMBER:         return "number";
        case FieldKind::BOOLEAN:        return "boolean";
        case FieldKind::STRUCTURED:     return "structured";
        case FieldKind::REFERENCE:      return "reference";
        case FieldKind::REFERENCE_LIST: return "reference_list";
        case FieldKind::POLYMORPHIC:    return "polymorphic";
        default:                        return "unknown";
    }
}

[[nodiscard]] inline bool is_reference_kind(FieldKind kind) {
    return kind == FieldKind::REFERENCE || kind == FieldKind::REFERENCE_LIST;
}

// ============================================================================
// FieldDescriptor
// ============================================================================

struct FieldDescriptor {
    std::string name;
    FieldKind kind = FieldKind::STRING;
    bool nullable = false;
    std::string declared_type;              // name of a $ref'd definition, never expanded
    // String constraints, also taken from a $ref'd scalar alias
    std::optional<std::string> constant;    // "const"
    std::vector<std::string> enum_values;   // "enum"
    std::string format;                     // "format", only "uuid" is enforced

    bool operator==(const FieldDescriptor&) const = default;
};

// ============================================================================
// SchemaDefinition
// ============================================================================

enum class DefinitionShape : uint8_t {
    OBJECT,         // concrete type with a field set and a discriminator
    UNION,          // anyOf/oneOf over other definitions, no own instances
    SCALAR_ALIAS    // named scalar (enumerations and the like)
};

struct SchemaDefinition {
    std::string name;
    DefinitionShape shape = DefinitionShape::OBJECT;

    // Full transitive union of own and inherited fields, declaration order,
    // first definition wins on name collision.
    std::vector<FieldDescriptor> fields;

    std::vector<std::string> supertypes;    // direct allOf / $ref parents
    std::vector<std::string> ancestors;     // transitive, direct parents first, no duplicates
    std::vector<std::string> union_members; // UNION only

    std::string discriminator;              // value stored under the type-tag property
    FieldKind scalar_kind = FieldKind::STRING;  // SCALAR_ALIAS only

    [[nodiscard]] const FieldDescriptor* find_field(std::string_view field_name) const {
        for (const auto& f : fields) {
            if (f.name == field_name) return &f;
        }
        return nullptr;
    }

    [[nodiscard]] bool inherits_from(std::string_view type_name) const {
        for (const auto& a : ancestors) {
            if (a == type_name) return true;
        }
        return false;
    }
};

// Ordered by type name, which fixes the traversal order used for emission.
using ResolvedSchema = std::map<std::string, SchemaDefinition>;

// ============================================================================
// Source format conventions
// ============================================================================

struct SchemaConventions {
    std::string id_field = "@id";
    std::string type_field = "@type";
    std::string identity_type = "Identified";
    std::string relation_root = "Relationship";
    std::vector<std::string> polymorphic_fields = {"value"};

    bool operator==(const SchemaConventions&) const = default;
};

} // namespace sysmlsql
