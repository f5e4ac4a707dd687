#pragma once

#include "core/error.hpp"
#include "schema/schema_types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sysmlsql {

// Declaration order of properties is significant, so the document keeps it.
using SchemaDocument = nlohmann::ordered_json;

/**
 * @brief Turns a raw schema document into a flat set of resolved definitions
 *
 * Accepts the `$defs` (or `definitions`) member of a JSON-Schema-like
 * document. Inheritance through `allOf` and `$ref` aliases is flattened so
 * every definition carries its full transitive field set. A property that
 * refers to another type only records the type's name, which keeps
 * self-referential schemas finite.
 *
 * Resolution walks the inheritance graph with an explicit work stack, so the
 * depth of an upstream hierarchy never touches the call stack.
 */
class SchemaResolver {
public:
    explicit SchemaResolver(SchemaConventions conventions = {});

    [[nodiscard]] Result<ResolvedSchema, SchemaError> resolve(const SchemaDocument& document) const;

    // Parse errors surface as MALFORMED_DOCUMENT
    [[nodiscard]] Result<ResolvedSchema, SchemaError> resolve_text(std::string_view text) const;

    [[nodiscard]] const SchemaConventions& conventions() const { return conventions_; }

    /**
     * @brief Type name addressed by a `$ref` string
     *
     * `#/$defs/PartUsage` and `https://host/API/PartUsage` both name
     * `PartUsage`. Returns an empty string when nothing follows the last '/'.
     */
    [[nodiscard]] static std::string ref_target(std::string_view ref);

private:
    // Either a parent type whose resolved fields are merged, or a node whose
    // "properties" are merged
    struct MergeStep {
        std::string parent;
        const SchemaDocument* block = nullptr;
    };

    // Per-definition facts gathered before any field set is merged
    struct RawDefinition {
        std::string name;
        DefinitionShape shape = DefinitionShape::OBJECT;
        const SchemaDocument* node = nullptr;
        std::string alias_of;                   // pure {"$ref": X} definitions
        std::vector<std::string> parents;       // types whose field sets are merged in
        std::vector<MergeStep> steps;           // merge order, first definition wins
        std::vector<std::string> members;       // union members
        FieldKind scalar_kind = FieldKind::STRING;
    };

    using RawSet = std::unordered_map<std::string, RawDefinition>;

    [[nodiscard]] Result<RawDefinition, SchemaError> classify_definition(
        const std::string& name, const SchemaDocument& node) const;

    [[nodiscard]] Result<FieldDescriptor, SchemaError> classify_property(
        const std::string& type_name, const std::string& field_name,
        const SchemaDocument& node, const RawSet& raw) const;

    [[nodiscard]] Result<SchemaDefinition, SchemaError> merge(
        const RawDefinition& def, const RawSet& raw, const ResolvedSchema& done) const;

    // Shape of a definition after following pure $ref aliases
    [[nodiscard]] const RawDefinition* effective(const std::string& name, const RawSet& raw) const;

    SchemaConventions conventions_;
};

} // namespace sysmlsql
