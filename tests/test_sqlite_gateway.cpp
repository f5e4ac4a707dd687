#include <catch2/catch_test_macros.hpp>
#include "db/sqlite/sqlite_gateway.hpp"

#include <sqlite3.h>

#include <string>
#include <type_traits>

using namespace sysmlsql;

namespace {

std::unique_ptr<SqliteGateway> memory_db() {
    auto db = SqliteGateway::open(":memory:");
    REQUIRE(db.is_ok());
    REQUIRE(db.value()->execute_ddl(
        R"(CREATE TABLE "items" ("@id" TEXT NOT NULL PRIMARY KEY, "name" TEXT, "size" INTEGER, "weight" REAL))")
        .is_ok());
    return std::move(db.value());
}

const std::vector<std::string> kColumns = {"@id", "name", "size", "weight"};

} // namespace

TEST_CASE("SqliteGateway: a handle comes only from open", "[db][sqlite]") {
    STATIC_REQUIRE_FALSE(std::is_constructible_v<SqliteGateway, sqlite3*, std::string>);
    STATIC_REQUIRE_FALSE(std::is_copy_constructible_v<SqliteGateway>);

    auto db = SqliteGateway::open(":memory:");
    REQUIRE(db.is_ok());
    REQUIRE(db.value() != nullptr);
    CHECK(db.value()->execute("SELECT 1").is_ok());
}

TEST_CASE("SqliteGateway: upsert inserts and replaces by primary key", "[db][sqlite]") {
    auto db = memory_db();
    REQUIRE(db->upsert("items", kColumns, {SqlValue{"a"}, SqlValue{"first"}, SqlValue{int64_t{1}}, SqlValue{}})
                .is_ok());
    REQUIRE(db->upsert("items", kColumns, {SqlValue{"b"}, SqlValue{"second"}, SqlValue{}, SqlValue{2.5}})
                .is_ok());
    REQUIRE(db->upsert("items", kColumns, {SqlValue{"a"}, SqlValue{"again"}, SqlValue{int64_t{3}}, SqlValue{}})
                .is_ok());

    CHECK(db->count_rows("items").value() == 2);

    auto rs = db->execute(R"(SELECT "@id", name, size, weight FROM items ORDER BY "@id")");
    REQUIRE(rs.is_ok());
    const auto& r = rs.value();
    CHECK(r.has_rows);
    CHECK(r.column_names == std::vector<std::string>{"@id", "name", "size", "weight"});
    REQUIRE(r.rows.size() == 2);
    CHECK(r.rows[0][1] == SqlValue{"again"});
    CHECK(r.rows[0][2] == SqlValue{int64_t{3}});
    CHECK(is_null(r.rows[0][3]));
    CHECK(is_null(r.rows[1][2]));
    CHECK(r.rows[1][3] == SqlValue{2.5});
}

TEST_CASE("SqliteGateway: upsert rejects mismatched rows", "[db][sqlite]") {
    auto db = memory_db();
    auto res = db->upsert("items", kColumns, {SqlValue{"a"}});
    REQUIRE(res.is_error());
    CHECK(res.err().code == SQLITE_MISUSE);

    auto missing = db->upsert("nothing", {"x"}, {SqlValue{int64_t{1}}});
    REQUIRE(missing.is_error());
    CHECK(missing.err().message().find("nothing") != std::string::npos);
}

TEST_CASE("SqliteGateway: rollback discards the transaction", "[db][sqlite]") {
    auto db = memory_db();
    REQUIRE(db->begin_transaction().is_ok());
    REQUIRE(db->upsert("items", kColumns, {SqlValue{"a"}, SqlValue{}, SqlValue{}, SqlValue{}}).is_ok());
    REQUIRE(db->rollback().is_ok());
    CHECK(db->count_rows("items").value() == 0);

    REQUIRE(db->begin_transaction().is_ok());
    REQUIRE(db->upsert("items", kColumns, {SqlValue{"a"}, SqlValue{}, SqlValue{}, SqlValue{}}).is_ok());
    REQUIRE(db->commit().is_ok());
    CHECK(db->count_rows("items").value() == 1);

    // Nothing to commit
    CHECK(db->commit().is_error());
}

TEST_CASE("SqliteGateway: table_columns reports the live table", "[db][sqlite]") {
    auto db = memory_db();
    auto cols = db->table_columns("items");
    REQUIRE(cols.is_ok());
    REQUIRE(cols.value().size() == 4);
    CHECK(cols.value()[0].name == "@id");
    CHECK(cols.value()[0].primary_key);
    CHECK(cols.value()[0].not_null);
    CHECK(cols.value()[2].declared_type == "INTEGER");
    CHECK_FALSE(cols.value()[3].primary_key);

    auto none = db->table_columns("absent");
    REQUIRE(none.is_ok());
    CHECK(none.value().empty());
}

TEST_CASE("SqliteGateway: delete_where counts deleted rows", "[db][sqlite]") {
    auto db = memory_db();
    for (const auto* id : {"a", "b", "c"}) {
        REQUIRE(db->upsert("items", kColumns,
                           {SqlValue{id}, SqlValue{"x"}, SqlValue{}, SqlValue{}}).is_ok());
    }
    REQUIRE(db->upsert("items", kColumns, {SqlValue{"d"}, SqlValue{"y"}, SqlValue{}, SqlValue{}}).is_ok());

    auto deleted = db->delete_where("items", "name", SqlValue{"x"});
    REQUIRE(deleted.is_ok());
    CHECK(deleted.value() == 3);
    CHECK(db->delete_where("items", "name", SqlValue{"x"}).value() == 0);
    CHECK(db->count_rows("items").value() == 1);
}

TEST_CASE("SqliteGateway: pragmas accept plain tokens only", "[db][sqlite]") {
    auto db = memory_db();
    CHECK(db->set_pragma("cache_size", "-262144").is_ok());
    CHECK(db->set_pragma("synchronous", "OFF").is_ok());
    CHECK(db->execute("PRAGMA synchronous").value().rows[0][0] == SqlValue{int64_t{0}});

    auto bad = db->set_pragma("foreign_keys", "ON; DROP TABLE items");
    REQUIRE(bad.is_error());
    CHECK(bad.err().code == SQLITE_MISUSE);
    CHECK(db->count_rows("items").is_ok());
}

TEST_CASE("SqliteGateway: foreign keys are enforced", "[db][sqlite]") {
    auto db = memory_db();
    CHECK(db->execute("PRAGMA foreign_keys").value().rows[0][0] == SqlValue{int64_t{1}});
}

TEST_CASE("SqliteGateway: execute runs statement batches", "[db][sqlite]") {
    auto db = memory_db();
    auto rs = db->execute(R"(
        -- seed
        INSERT INTO items ("@id", name) VALUES ('a', 'x');
        INSERT INTO items ("@id", name) VALUES ('b', 'y');
        SELECT COUNT(*) AS n FROM items;
        UPDATE items SET size = 1;
    )");
    REQUIRE(rs.is_ok());
    CHECK(rs.value().has_rows);
    CHECK(rs.value().column_names == std::vector<std::string>{"n"});
    REQUIRE(rs.value().rows.size() == 1);
    CHECK(rs.value().rows[0][0] == SqlValue{int64_t{2}});
    CHECK(rs.value().affected_rows == 4);

    auto dml = db->execute("DELETE FROM items");
    REQUIRE(dml.is_ok());
    CHECK_FALSE(dml.value().has_rows);
    CHECK(dml.value().affected_rows == 2);

    auto broken = db->execute("SELEC 1");
    REQUIRE(broken.is_error());
    CHECK(broken.err().statement == "SELEC 1");
}

TEST_CASE("SqliteGateway: prepared statements are reused", "[db][sqlite]") {
    auto db = memory_db();
    CHECK(db->cached_statements() == 0);
    for (int i = 0; i < 10; ++i) {
        REQUIRE(db->upsert("items", kColumns,
                           {SqlValue{std::to_string(i)}, SqlValue{}, SqlValue{int64_t{i}}, SqlValue{}}).is_ok());
    }
    CHECK(db->cached_statements() == 1);
    REQUIRE(db->count_rows("items").is_ok());
    REQUIRE(db->count_rows("items").is_ok());
    CHECK(db->cached_statements() == 2);
}

TEST_CASE("SqliteGateway: open reports unusable paths", "[db][sqlite]") {
    auto db = SqliteGateway::open("/nonexistent-dir/sub/model.sqlite");
    REQUIRE(db.is_error());
    CHECK(db.err().detail.find("cannot open database") != std::string::npos);
}
