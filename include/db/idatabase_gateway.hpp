#pragma once

#include "core/error.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace sysmlsql {

// NULL, INTEGER, REAL or TEXT, the storage classes the importer writes
using SqlValue = std::variant<std::monostate, int64_t, double, std::string>;

[[nodiscard]] inline bool is_null(const SqlValue& v) {
    return std::holds_alternative<std::monostate>(v);
}

/**
 * @brief Column as reported by the live database
 */
struct ColumnInfo {
    std::string name;
    std::string declared_type;
    bool not_null = false;
    bool primary_key = false;
};

/**
 * @brief Rows returned by IDatabaseGateway::execute()
 *
 * Owns the result data (copied out of native statement handles).
 */
struct DbResultSet {
    std::vector<std::string> column_names;
    std::vector<std::vector<SqlValue>> rows;

    // For DML
    uint64_t affected_rows = 0;

    // SELECT vs DML/DDL
    bool has_rows = false;
};

/**
 * @brief Narrow statement-execution surface used by the schema and import passes
 *
 * Implementations serialise their callers: one gateway is one writer.
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDatabaseGateway {
public:
    virtual ~IDatabaseGateway() = default;

    /**
     * @brief Run one DDL statement (CREATE TABLE, CREATE INDEX, ...)
     */
    [[nodiscard]] virtual Result<Done, DbError> execute_ddl(const std::string& statement) = 0;

    /**
     * @brief Insert a row, replacing any row with the same primary key
     * @param table Target table
     * @param columns Column names, same length as values
     * @param values Row values
     */
    [[nodiscard]] virtual Result<Done, DbError> upsert(const std::string& table,
                                                       const std::vector<std::string>& columns,
                                                       const std::vector<SqlValue>& values) = 0;

    [[nodiscard]] virtual Result<Done, DbError> begin_transaction() = 0;
    [[nodiscard]] virtual Result<Done, DbError> commit() = 0;
    [[nodiscard]] virtual Result<Done, DbError> rollback() = 0;

    /**
     * @brief Live column list of a table, in table order
     * @return Empty list if the table does not exist
     */
    [[nodiscard]] virtual Result<std::vector<ColumnInfo>, DbError> table_columns(
        const std::string& table) = 0;

    /**
     * @brief DELETE FROM table WHERE column = value
     * @return Number of deleted rows
     */
    [[nodiscard]] virtual Result<uint64_t, DbError> delete_where(const std::string& table,
                                                                 const std::string& column,
                                                                 const SqlValue& value) = 0;

    // PRAGMA name = value
    [[nodiscard]] virtual Result<Done, DbError> set_pragma(const std::string& name,
                                                           const std::string& value) = 0;

    /**
     * @brief Execute a statement batch; rows of the last row-producing statement are returned
     */
    [[nodiscard]] virtual Result<DbResultSet, DbError> execute(const std::string& sql) = 0;

    [[nodiscard]] virtual Result<uint64_t, DbError> count_rows(const std::string& table) = 0;
};

} // namespace sysmlsql
