#include <catch2/catch_test_macros.hpp>
#include "app/commands.hpp"
#include "db/sqlite/sqlite_gateway.hpp"

#include <algorithm>

using namespace sysmlsql;

TEST_CASE("BundledSchema: resolves and lowers to DDL", "[schema][bundled]") {
    REQUIRE_FALSE(bundled_schema_text().empty());

    auto resolved = SchemaResolver{}.resolve_text(bundled_schema_text());
    INFO(resolved.error_message());
    REQUIRE(resolved.is_ok());

    auto emitted = DdlEmitter{}.emit(resolved.value());
    INFO(emitted.error_message());
    REQUIRE(emitted.is_ok());

    const auto& schema = emitted.value();
    CHECK(schema.elements.find_column("declaredName") != nullptr);
    CHECK(schema.elements.find_column("isLibraryElement")->type == ColumnType::INTEGER);
    CHECK(schema.elements.find_column("value")->type == ColumnType::ANY);
    CHECK(schema.elements.find_column("owner") == nullptr);
    CHECK(schema.relations.find_column("memberName") != nullptr);

    const auto& names = schema.relation_names;
    for (const auto* expected : {"owner", "definition", "typedFeature", "ownedElement"}) {
        INFO(expected);
        CHECK(std::find(names.begin(), names.end(), expected) != names.end());
    }
}

TEST_CASE("BundledSchema: relation-like type names", "[schema][bundled]") {
    auto names = relation_type_names(SchemaConventions{});
    INFO(names.error_message());
    REQUIRE(names.is_ok());

    const auto& set = names.value();
    CHECK(set.contains("Relationship"));
    CHECK(set.contains("Membership"));
    CHECK(set.contains("OwningMembership"));
    CHECK(set.contains("FeatureTyping"));
    CHECK_FALSE(set.contains("PartUsage"));
    CHECK_FALSE(set.contains("Identified"));
}

TEST_CASE("BundledSchema: checked-in DDL matches a fresh emission", "[schema][bundled]") {
    auto document = load_schema_document("");
    INFO(document.error_message());
    REQUIRE(document.is_ok());

    auto derived = derive_schema(document.value(), SchemaConventions{});
    INFO(derived.error_message());
    REQUIRE(derived.is_ok());

    // Written the way json-schema-to-sql-schema --dump-sql writes it
    CHECK(std::string(bundled_ddl_text()) == derived.value().ddl() + "\n");
}

TEST_CASE("BundledSchema: init_schema is idempotent", "[schema][bundled]") {
    auto db = SqliteGateway::open(":memory:");
    REQUIRE(db.is_ok());

    auto first = init_schema(*db.value(), SchemaConventions{});
    INFO(first.error_message());
    REQUIRE(first.is_ok());
    REQUIRE(init_schema(*db.value(), SchemaConventions{}).is_ok());

    auto derived = derive_schema(load_schema_document("").value(), SchemaConventions{});
    REQUIRE(derived.is_ok());
    auto cols = db.value()->table_columns("elements");
    REQUIRE(cols.is_ok());
    CHECK(cols.value().size() == derived.value().elements.columns.size());
    auto rel_cols = db.value()->table_columns("relations");
    REQUIRE(rel_cols.is_ok());
    CHECK(rel_cols.value().size() == derived.value().relations.columns.size());
}

TEST_CASE("BundledSchema: other conventions derive the DDL instead", "[schema][bundled]") {
    auto db = SqliteGateway::open(":memory:");
    REQUIRE(db.is_ok());

    SchemaConventions conventions;
    conventions.polymorphic_fields = {"value", "body"};
    auto res = init_schema(*db.value(), conventions);
    INFO(res.error_message());
    REQUIRE(res.is_ok());

    auto cols = db.value()->table_columns("elements");
    REQUIRE(cols.is_ok());
    const auto body = std::find_if(cols.value().begin(), cols.value().end(),
                                   [](const ColumnInfo& c) { return c.name == "body"; });
    REQUIRE(body != cols.value().end());
    CHECK(body->declared_type == "ANY");
}
