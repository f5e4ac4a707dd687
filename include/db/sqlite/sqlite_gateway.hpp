#pragma once

#include "db/idatabase_gateway.hpp"

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sysmlsql {

/**
 * @brief SQLite implementation of IDatabaseGateway
 *
 * Wraps one sqlite3* handle. Foreign keys are enforced and a busy timeout
 * is set when the database is opened. Statements issued through upsert(),
 * delete_where() and table_columns() are prepared once and cached by their
 * SQL text. A mutex serialises every call.
 */
class SqliteGateway : public IDatabaseGateway {
    // Only open() can name this, so only open() can construct
    struct OpenTag {
        explicit OpenTag() = default;
    };

public:
    static constexpr int kBusyTimeoutMs = 5000;

    /**
     * @brief Open (or create) a database file
     * @param path File path, or ":memory:"
     */
    [[nodiscard]] static Result<std::unique_ptr<SqliteGateway>, DbError> open(const std::string& path);

    SqliteGateway(OpenTag, sqlite3* db, std::string path);
    ~SqliteGateway() override;

    SqliteGateway(const SqliteGateway&) = delete;
    SqliteGateway& operator=(const SqliteGateway&) = delete;

    Result<Done, DbError> execute_ddl(const std::string& statement) override;
    Result<Done, DbError> upsert(const std::string& table,
                                 const std::vector<std::string>& columns,
                                 const std::vector<SqlValue>& values) override;
    Result<Done, DbError> begin_transaction() override;
    Result<Done, DbError> commit() override;
    Result<Done, DbError> rollback() override;
    Result<std::vector<ColumnInfo>, DbError> table_columns(const std::string& table) override;
    Result<uint64_t, DbError> delete_where(const std::string& table,
                                           const std::string& column,
                                           const SqlValue& value) override;
    Result<Done, DbError> set_pragma(const std::string& name, const std::string& value) override;
    Result<DbResultSet, DbError> execute(const std::string& sql) override;
    Result<uint64_t, DbError> count_rows(const std::string& table) override;

    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] size_t cached_statements() const;

private:
    struct DbCloser {
        void operator()(sqlite3* db) const { sqlite3_close_v2(db); }
    };
    struct StmtFinalizer {
        void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
    };
    using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtFinalizer>;

    // Caller holds mutex_
    [[nodiscard]] Result<sqlite3_stmt*, DbError> prepare_cached(const std::string& sql);
    [[nodiscard]] Result<Done, DbError> exec_locked(const std::string& sql);
    [[nodiscard]] DbError last_error(const std::string& statement) const;

    std::unique_ptr<sqlite3, DbCloser> db_;
    std::string path_;
    std::unordered_map<std::string, StmtPtr> stmt_cache_;
    mutable std::mutex mutex_;
};

} // namespace sysmlsql
