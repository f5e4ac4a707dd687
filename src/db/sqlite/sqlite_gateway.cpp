#include "db/sqlite/sqlite_gateway.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>
#include <type_traits>
#include <variant>

namespace sysmlsql {

namespace {

using utils::escape_sql_ident;

bool is_pragma_token(const std::string& s) {
    if (s.empty()) return false;
    for (const char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') return false;
    }
    return true;
}

int bind_value(sqlite3_stmt* stmt, int index, const SqlValue& value) {
    return std::visit([&](const auto& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(v));
        } else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(stmt, index, v);
        } else {
            return sqlite3_bind_text(stmt, index, v.data(), static_cast<int>(v.size()),
                                     SQLITE_TRANSIENT);
        }
    }, value);
}

SqlValue column_value(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, col));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, col);
        case SQLITE_TEXT:
        case SQLITE_BLOB: {
            const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt, col));
            const int len = sqlite3_column_bytes(stmt, col);
            return std::string(data ? data : "", data ? static_cast<size_t>(len) : 0);
        }
        default:
            return std::monostate{};
    }
}

} // anonymous namespace

// ============================================================================
// Lifecycle
// ============================================================================

Result<std::unique_ptr<SqliteGateway>, DbError> SqliteGateway::open(const std::string& path) {
    using R = Result<std::unique_ptr<SqliteGateway>, DbError>;

    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &raw,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        DbError err{rc, {}, std::format("cannot open database {}: {}", path,
                                        raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc))};
        sqlite3_close_v2(raw);
        return R::error(std::move(err));
    }

    auto gw = std::make_unique<SqliteGateway>(OpenTag{}, raw, path);
    sqlite3_busy_timeout(raw, kBusyTimeoutMs);

    std::lock_guard<std::mutex> lock(gw->mutex_);
    auto fk = gw->exec_locked("PRAGMA foreign_keys = ON");
    if (fk.is_error()) return R::error(fk.err());

    utils::log::debug(std::format("opened database {}", path));
    return R::ok(std::move(gw));
}

SqliteGateway::SqliteGateway(OpenTag, sqlite3* db, std::string path)
    : db_(db), path_(std::move(path)) {}

SqliteGateway::~SqliteGateway() {
    // Statements must be finalized before the connection closes
    stmt_cache_.clear();
}

size_t SqliteGateway::cached_statements() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stmt_cache_.size();
}

// ============================================================================
// Helpers
// ============================================================================

DbError SqliteGateway::last_error(const std::string& statement) const {
    return DbError{sqlite3_extended_errcode(db_.get()), statement, sqlite3_errmsg(db_.get())};
}

Result<Done, DbError> SqliteGateway::exec_locked(const std::string& sql) {
    char* errmsg = nullptr;
    const int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        DbError err{rc, sql, errmsg ? errmsg : sqlite3_errstr(rc)};
        sqlite3_free(errmsg);
        return Result<Done, DbError>::error(std::move(err));
    }
    return Result<Done, DbError>::ok(Done{});
}

Result<sqlite3_stmt*, DbError> SqliteGateway::prepare_cached(const std::string& sql) {
    using R = Result<sqlite3_stmt*, DbError>;

    if (const auto it = stmt_cache_.find(sql); it != stmt_cache_.end()) {
        sqlite3_reset(it->second.get());
        sqlite3_clear_bindings(it->second.get());
        return R::ok(it->second.get());
    }

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_.get(), sql.c_str(), static_cast<int>(sql.size()), &raw, nullptr)
            != SQLITE_OK) {
        sqlite3_finalize(raw);
        return R::error(last_error(sql));
    }
    auto* stmt = raw;
    stmt_cache_.emplace(sql, StmtPtr(raw));
    return R::ok(stmt);
}

// ============================================================================
// IDatabaseGateway
// ============================================================================

Result<Done, DbError> SqliteGateway::execute_ddl(const std::string& statement) {
    std::lock_guard<std::mutex> lock(mutex_);
    return exec_locked(statement);
}

Result<Done, DbError> SqliteGateway::upsert(const std::string& table,
                                            const std::vector<std::string>& columns,
                                            const std::vector<SqlValue>& values) {
    using R = Result<Done, DbError>;

    if (columns.size() != values.size() || columns.empty()) {
        return R::error(DbError{SQLITE_MISUSE, {}, std::format(
            "upsert into {} with {} columns and {} values", table, columns.size(), values.size())});
    }

    std::string column_list;
    std::string placeholders;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) {
            column_list += ", ";
            placeholders += ", ";
        }
        column_list += escape_sql_ident(columns[i]);
        placeholders += '?';
    }
    const auto sql = std::format("INSERT OR REPLACE INTO {} ({}) VALUES ({})",
                                 escape_sql_ident(table), column_list, placeholders);

    std::lock_guard<std::mutex> lock(mutex_);
    auto prepared = prepare_cached(sql);
    if (prepared.is_error()) return R::error(prepared.err());
    sqlite3_stmt* stmt = prepared.value();

    for (size_t i = 0; i < values.size(); ++i) {
        if (bind_value(stmt, static_cast<int>(i + 1), values[i]) != SQLITE_OK) {
            return R::error(last_error(sql));
        }
    }
    const int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        auto err = last_error(sql);
        sqlite3_reset(stmt);
        return R::error(std::move(err));
    }
    sqlite3_reset(stmt);
    return R::ok(Done{});
}

Result<Done, DbError> SqliteGateway::begin_transaction() {
    std::lock_guard<std::mutex> lock(mutex_);
    return exec_locked("BEGIN IMMEDIATE");
}

Result<Done, DbError> SqliteGateway::commit() {
    std::lock_guard<std::mutex> lock(mutex_);
    return exec_locked("COMMIT");
}

Result<Done, DbError> SqliteGateway::rollback() {
    std::lock_guard<std::mutex> lock(mutex_);
    return exec_locked("ROLLBACK");
}

Result<std::vector<ColumnInfo>, DbError> SqliteGateway::table_columns(const std::string& table) {
    using R = Result<std::vector<ColumnInfo>, DbError>;

    const auto sql = std::format("PRAGMA table_info({})", escape_sql_ident(table));

    std::lock_guard<std::mutex> lock(mutex_);
    auto prepared = prepare_cached(sql);
    if (prepared.is_error()) return R::error(prepared.err());
    sqlite3_stmt* stmt = prepared.value();

    // cid | name | type | notnull | dflt_value | pk
    std::vector<ColumnInfo> columns;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        ColumnInfo info;
        const auto* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        const auto* type = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
        info.name = name ? name : "";
        info.declared_type = type ? type : "";
        info.not_null = sqlite3_column_int(stmt, 3) != 0;
        info.primary_key = sqlite3_column_int(stmt, 5) != 0;
        columns.push_back(std::move(info));
    }
    if (rc != SQLITE_DONE) {
        auto err = last_error(sql);
        sqlite3_reset(stmt);
        return R::error(std::move(err));
    }
    sqlite3_reset(stmt);
    return R::ok(std::move(columns));
}

Result<uint64_t, DbError> SqliteGateway::delete_where(const std::string& table,
                                                      const std::string& column,
                                                      const SqlValue& value) {
    using R = Result<uint64_t, DbError>;

    const auto sql = std::format("DELETE FROM {} WHERE {} = ?",
                                 escape_sql_ident(table), escape_sql_ident(column));

    std::lock_guard<std::mutex> lock(mutex_);
    auto prepared = prepare_cached(sql);
    if (prepared.is_error()) return R::error(prepared.err());
    sqlite3_stmt* stmt = prepared.value();

    if (bind_value(stmt, 1, value) != SQLITE_OK) return R::error(last_error(sql));
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        auto err = last_error(sql);
        sqlite3_reset(stmt);
        return R::error(std::move(err));
    }
    const auto deleted = static_cast<uint64_t>(sqlite3_changes(db_.get()));
    sqlite3_reset(stmt);
    return R::ok(deleted);
}

Result<Done, DbError> SqliteGateway::set_pragma(const std::string& name, const std::string& value) {
    if (!is_pragma_token(name) || !is_pragma_token(value)) {
        return Result<Done, DbError>::error(DbError{SQLITE_MISUSE, {},
            std::format("refusing PRAGMA {} = {}", name, value)});
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return exec_locked(std::format("PRAGMA {} = {}", name, value));
}

Result<DbResultSet, DbError> SqliteGateway::execute(const std::string& sql) {
    using R = Result<DbResultSet, DbError>;

    std::lock_guard<std::mutex> lock(mutex_);

    DbResultSet result;
    const char* tail = sql.c_str();
    const char* const end = sql.c_str() + sql.size();

    while (tail && tail < end) {
        sqlite3_stmt* raw = nullptr;
        const char* next = nullptr;
        if (sqlite3_prepare_v2(db_.get(), tail, static_cast<int>(end - tail), &raw, &next)
                != SQLITE_OK) {
            sqlite3_finalize(raw);
            return R::error(last_error(std::string(tail, end)));
        }
        tail = next;
        if (!raw) continue;  // whitespace or comment
        const StmtPtr stmt(raw);

        const int ncols = sqlite3_column_count(raw);
        if (ncols > 0) {
            result.column_names.clear();
            result.rows.clear();
            for (int i = 0; i < ncols; ++i) {
                const char* name = sqlite3_column_name(raw, i);
                result.column_names.emplace_back(name ? name : "");
            }
            result.has_rows = true;
        }

        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(raw)) == SQLITE_ROW) {
            std::vector<SqlValue> row;
            row.reserve(static_cast<size_t>(ncols));
            for (int i = 0; i < ncols; ++i) {
                row.push_back(column_value(raw, i));
            }
            result.rows.push_back(std::move(row));
        }
        if (rc != SQLITE_DONE) {
            const char* text = sqlite3_sql(raw);
            return R::error(last_error(text ? text : ""));
        }
        if (ncols == 0) {
            result.affected_rows += static_cast<uint64_t>(sqlite3_changes(db_.get()));
        }
    }
    return R::ok(std::move(result));
}

Result<uint64_t, DbError> SqliteGateway::count_rows(const std::string& table) {
    using R = Result<uint64_t, DbError>;

    const auto sql = std::format("SELECT COUNT(*) FROM {}", escape_sql_ident(table));

    std::lock_guard<std::mutex> lock(mutex_);
    auto prepared = prepare_cached(sql);
    if (prepared.is_error()) return R::error(prepared.err());
    sqlite3_stmt* stmt = prepared.value();

    if (sqlite3_step(stmt) != SQLITE_ROW) {
        auto err = last_error(sql);
        sqlite3_reset(stmt);
        return R::error(std::move(err));
    }
    const auto count = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
    sqlite3_reset(stmt);
    return R::ok(count);
}

} // namespace sysmlsql
