#include "schema/ddl_emitter.hpp"
#include "schema/schema_constants.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <set>
#include <unordered_map>

namespace sysmlsql {

namespace {

using utils::escape_sql_ident;
using utils::escape_sql_str_lit;

// Indexed when the elements table has them
constexpr std::string_view kElementIndexColumns[] = {"declaredName", "qualifiedName", "name"};

constexpr std::string_view kUuidPattern = "________-____-____-____-____________";

// enum, then const, then format; only string fields are constrained
std::optional<std::string> check_for(const FieldDescriptor& field) {
    if (field.kind != FieldKind::STRING) return std::nullopt;
    const auto column = escape_sql_ident(field.name);
    if (!field.enum_values.empty()) {
        std::vector<std::string> literals;
        literals.reserve(field.enum_values.size());
        for (const auto& v : field.enum_values) literals.push_back(escape_sql_str_lit(v));
        return std::format("{} IN ({})", column, utils::join(literals, ", "));
    }
    if (field.constant) {
        return std::format("{} = {}", column, escape_sql_str_lit(*field.constant));
    }
    if (field.format == "uuid") {
        return std::format("{} LIKE {}", column, escape_sql_str_lit(kUuidPattern));
    }
    return std::nullopt;
}

SchemaError column_conflict(const std::string& type_name, const std::string& field,
                            std::string type_a, std::string type_b) {
    SchemaError e;
    e.kind = SchemaErrorKind::COLUMN_TYPE_CONFLICT;
    e.type_name = type_name;
    e.field = field;
    e.type_a = std::move(type_a);
    e.type_b = std::move(type_b);
    return e;
}

std::string create_index_sql(std::string_view table, std::string_view column) {
    return std::format("CREATE INDEX IF NOT EXISTS {} ON {} ({});",
        escape_sql_ident(std::format("idx_{}_{}", table, column)),
        escape_sql_ident(table), escape_sql_ident(column));
}

} // anonymous namespace

std::string EmittedSchema::ddl() const {
    std::string out;
    for (const auto& stmt : statements) {
        out += stmt;
        out += "\n\n";
    }
    if (!out.empty()) out.pop_back();
    return out;
}

DdlEmitter::DdlEmitter(SchemaConventions conventions)
    : conventions_(std::move(conventions)) {}

SchemaPartition DdlEmitter::partition(const ResolvedSchema& schema) const {
    SchemaPartition out;
    // std::map iteration gives the fixed, name-sorted traversal
    for (const auto& [name, def] : schema) {
        if (def.shape != DefinitionShape::OBJECT) continue;
        if (name == conventions_.identity_type) continue;

        if (name == conventions_.relation_root || def.inherits_from(conventions_.relation_root)) {
            out.relation_types.push_back(&def);
        } else {
            out.element_types.push_back(&def);
        }
    }
    return out;
}

Result<EmittedSchema, SchemaError> DdlEmitter::emit(const ResolvedSchema& schema) const {
    return emit(partition(schema));
}

Result<EmittedSchema, SchemaError> DdlEmitter::emit(const SchemaPartition& partition) const {
    using R = Result<EmittedSchema, SchemaError>;

    const std::vector<RelationalColumn> element_fixed = {
        {.name = conventions_.id_field, .type = ColumnType::TEXT, .nullable = false, .primary_key = true},
        {.name = conventions_.type_field, .type = ColumnType::TEXT},
    };
    const std::vector<RelationalColumn> relation_fixed = {
        {.name = conventions_.id_field, .type = ColumnType::TEXT, .nullable = false, .primary_key = true},
        {.name = conventions_.type_field, .type = ColumnType::TEXT},
        {.name = std::string(table::kName), .type = ColumnType::TEXT, .nullable = false},
        {.name = std::string(table::kOriginId), .type = ColumnType::TEXT, .nullable = false},
        {.name = std::string(table::kTargetId), .type = ColumnType::TEXT, .nullable = false},
    };

    EmittedSchema out;
    std::vector<std::string> relation_names;

    auto elements = build_table(table::kElements, partition.element_types, element_fixed, relation_names);
    if (elements.is_error()) return R::error(elements.err());
    auto relations = build_table(table::kRelations, partition.relation_types, relation_fixed, relation_names);
    if (relations.is_error()) return R::error(relations.err());

    out.elements = std::move(elements.value());
    out.relations = std::move(relations.value());

    std::sort(relation_names.begin(), relation_names.end());
    relation_names.erase(std::unique(relation_names.begin(), relation_names.end()), relation_names.end());
    out.relation_names = std::move(relation_names);

    out.statements.push_back(create_table_sql(out.elements, false));
    out.statements.push_back(create_table_sql(out.relations, true));

    out.statements.push_back(create_index_sql(table::kElements, conventions_.type_field));
    for (const auto column : kElementIndexColumns) {
        if (out.elements.find_column(std::string(column))) {
            out.statements.push_back(create_index_sql(table::kElements, column));
        }
    }
    out.statements.push_back(create_index_sql(table::kRelations, table::kOriginId));
    out.statements.push_back(create_index_sql(table::kRelations, table::kTargetId));
    out.statements.push_back(create_index_sql(table::kRelations, table::kName));

    utils::log::info(std::format(
        "generated schema: {} element columns from {} types, {} relation columns from {} types, "
        "{} relation names",
        out.elements.columns.size(), partition.element_types.size(),
        out.relations.columns.size(), partition.relation_types.size(),
        out.relation_names.size()));

    return R::ok(std::move(out));
}

Result<TableSchema, SchemaError> DdlEmitter::build_table(
    std::string_view table_name,
    const std::vector<const SchemaDefinition*>& types,
    const std::vector<RelationalColumn>& fixed,
    std::vector<std::string>& relation_names) const {
    using R = Result<TableSchema, SchemaError>;

    TableSchema table;
    table.name = std::string(table_name);
    table.columns = fixed;

    std::unordered_map<std::string, size_t> column_index;
    for (size_t i = 0; i < table.columns.size(); ++i) {
        column_index.emplace(table.columns[i].name, i);
    }
    const size_t fixed_count = table.columns.size();

    // Reference fields of this table, for conflicts against columns
    std::set<std::string> references;

    for (const auto* def : types) {
        for (const auto& field : def->fields) {
            const auto existing = column_index.find(field.name);
            const bool is_fixed = existing != column_index.end() && existing->second < fixed_count;

            if (is_reference_kind(field.kind)) {
                if (existing != column_index.end() && !is_fixed) {
                    return R::error(column_conflict(def->name, field.name,
                        ColumnTypeMap::sql_name(table.columns[existing->second].type), "relation"));
                }
                references.insert(field.name);
                relation_names.push_back(field.name);
                continue;
            }

            // The fixed column wins
            if (is_fixed) continue;

            const auto type = ColumnTypeMap::for_field(field.kind);
            if (!type) continue;

            if (references.contains(field.name)) {
                return R::error(column_conflict(def->name, field.name,
                    "relation", ColumnTypeMap::sql_name(*type)));
            }

            if (existing != column_index.end()) {
                auto& column = table.columns[existing->second];
                if (column.type != *type) {
                    return R::error(column_conflict(def->name, field.name,
                        ColumnTypeMap::sql_name(column.type), ColumnTypeMap::sql_name(*type)));
                }
                // The column is shared, so a constraint holds only if all its types declare it
                if (column.check != check_for(field)) column.check.reset();
                continue;
            }

            column_index.emplace(field.name, table.columns.size());
            table.columns.push_back(RelationalColumn{.name = field.name, .type = *type,
                                                     .check = check_for(field)});
        }
    }
    return R::ok(std::move(table));
}

std::string DdlEmitter::create_table_sql(const TableSchema& table, bool with_foreign_keys) const {
    std::vector<std::string> lines;
    lines.reserve(table.columns.size() + 2);

    for (const auto& c : table.columns) {
        std::string line = std::format("    {} {}", escape_sql_ident(c.name), ColumnTypeMap::sql_name(c.type));
        if (!c.nullable) line += " NOT NULL";
        if (c.primary_key) line += " PRIMARY KEY";
        if (c.check) line += std::format(" CHECK ({})", *c.check);
        lines.push_back(std::move(line));
    }

    if (with_foreign_keys) {
        for (const auto column : {table::kOriginId, table::kTargetId}) {
            lines.push_back(std::format(
                "    FOREIGN KEY ({}) REFERENCES {} ({}) DEFERRABLE INITIALLY DEFERRED",
                escape_sql_ident(column), escape_sql_ident(table::kElements),
                escape_sql_ident(conventions_.id_field)));
        }
    }

    return std::format("CREATE TABLE IF NOT EXISTS {} (\n{}\n);",
        escape_sql_ident(table.name), utils::join(lines, ",\n"));
}

} // namespace sysmlsql
