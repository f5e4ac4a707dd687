#pragma once

#include "core/error.hpp"
#include "schema/column_type_map.hpp"
#include "schema/schema_types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sysmlsql {

struct RelationalColumn {
    std::string name;
    ColumnType type = ColumnType::TEXT;
    bool nullable = true;
    bool primary_key = false;
    std::optional<std::string> check;   // CHECK expression, kept only if every declaring type agrees
};

struct TableSchema {
    std::string name;
    std::vector<RelationalColumn> columns;  // fixed columns first, then first-seen order

    [[nodiscard]] const RelationalColumn* find_column(const std::string& column) const {
        for (const auto& c : columns) {
            if (c.name == column) return &c;
        }
        return nullptr;
    }
};

// Object definitions split by the table their instances live in
struct SchemaPartition {
    std::vector<const SchemaDefinition*> element_types;
    std::vector<const SchemaDefinition*> relation_types;
};

struct EmittedSchema {
    TableSchema elements;
    TableSchema relations;
    std::vector<std::string> relation_names;    // reference fields, sorted, unique
    std::vector<std::string> statements;        // each a complete statement ending in ';'

    // All statements as one script, byte-identical for an unchanged schema
    [[nodiscard]] std::string ddl() const;
};

/**
 * @brief Lowers a resolved schema into the elements/relations tables
 *
 * Both tables are wide: their column set is the union of every field of
 * every type stored in them, so every generated column is nullable.
 * Reference fields are not columns; their values become relations rows.
 */
class DdlEmitter {
public:
    explicit DdlEmitter(SchemaConventions conventions = {});

    /**
     * @brief Split object types into element-like and relation-like ones
     *
     * A type is relation-like when it is, or inherits from, the relation
     * root. Unions, scalar aliases and the identity type belong to neither.
     */
    [[nodiscard]] SchemaPartition partition(const ResolvedSchema& schema) const;

    [[nodiscard]] Result<EmittedSchema, SchemaError> emit(const ResolvedSchema& schema) const;
    [[nodiscard]] Result<EmittedSchema, SchemaError> emit(const SchemaPartition& partition) const;

private:
    [[nodiscard]] Result<TableSchema, SchemaError> build_table(
        std::string_view table_name,
        const std::vector<const SchemaDefinition*>& types,
        const std::vector<RelationalColumn>& fixed,
        std::vector<std::string>& relation_names) const;

    [[nodiscard]] std::string create_table_sql(const TableSchema& table, bool with_foreign_keys) const;

    SchemaConventions conventions_;
};

} // namespace sysmlsql
