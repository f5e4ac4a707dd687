#include <catch2/catch_test_macros.hpp>
#include "app/commands.hpp"
#include "db/sqlite/sqlite_gateway.hpp"
#include "importer/importer.hpp"
#include "mocks/failing_gateway.hpp"

#include <filesystem>
#include <fstream>
#include <regex>

using namespace sysmlsql;
using nlohmann::json;
using sysmlsql::testing::FailingGateway;

namespace {

std::unique_ptr<SqliteGateway> fresh_db() {
    auto db = SqliteGateway::open(":memory:");
    REQUIRE(db.is_ok());
    auto schema = init_schema(*db.value(), SchemaConventions{});
    INFO(schema.error_message());
    REQUIRE(schema.is_ok());
    return std::move(db.value());
}

std::set<std::string> relation_types() {
    auto names = relation_type_names(SchemaConventions{});
    REQUIRE(names.is_ok());
    return names.value();
}

uint64_t count(IDatabaseGateway& db, const std::string& table) {
    auto n = db.count_rows(table);
    REQUIRE(n.is_ok());
    return n.value();
}

// Single value of a one-row query
SqlValue scalar(IDatabaseGateway& db, const std::string& sql) {
    auto rs = db.execute(sql);
    INFO(rs.error_message());
    REQUIRE(rs.is_ok());
    REQUIRE(rs.value().rows.size() == 1);
    return rs.value().rows[0][0];
}

std::vector<std::vector<SqlValue>> rows(IDatabaseGateway& db, const std::string& sql) {
    auto rs = db.execute(sql);
    INFO(rs.error_message());
    REQUIRE(rs.is_ok());
    return rs.value().rows;
}

const char* kVehicle = R"([
  {"@id": "pkg", "@type": "Package", "name": "Vehicles", "isLibraryElement": false,
   "ownedElement": [{"@id": "car"}, {"@id": "wheel"}], "aliasIds": ["veh"]},
  {"@id": "car", "@type": "PartDefinition", "name": "Car", "isAbstract": false,
   "owner": {"@id": "pkg"}},
  {"@id": "wheel", "@type": "PartUsage", "name": "wheel", "isComposite": true,
   "owner": {"@id": "car"}, "definition": [{"@id": "car"}], "documentation": []}
])";

} // namespace

TEST_CASE("Importer: elements and embedded references are written", "[importer]") {
    auto db = fresh_db();
    Importer importer(*db, ImportConfig{});

    auto report = importer.import_json(json::parse(kVehicle));
    INFO(report.error_message());
    REQUIRE(report.is_ok());
    CHECK(report.value().elements_written == 3);
    CHECK(report.value().relations_written == 5);
    CHECK(report.value().dangling.empty());

    CHECK(count(*db, "elements") == 3);
    CHECK(count(*db, "relations") == 5);

    CHECK(scalar(*db, R"(SELECT "@type" FROM elements WHERE "@id" = 'wheel')") == SqlValue{"PartUsage"});
    CHECK(scalar(*db, R"(SELECT isComposite FROM elements WHERE "@id" = 'wheel')") == SqlValue{int64_t{1}});
    CHECK(scalar(*db, R"(SELECT isAbstract FROM elements WHERE "@id" = 'car')") == SqlValue{int64_t{0}});
    CHECK(scalar(*db, R"(SELECT aliasIds FROM elements WHERE "@id" = 'pkg')") == SqlValue{"[\"veh\"]"});
    // Absent properties are NULL
    CHECK(is_null(scalar(*db, R"(SELECT declaredName FROM elements WHERE "@id" = 'car')")));

    const auto owned = rows(*db,
        "SELECT target_id FROM relations WHERE origin_id = 'pkg' AND name = 'ownedElement' ORDER BY target_id");
    REQUIRE(owned.size() == 2);
    CHECK(owned[0][0] == SqlValue{"car"});
    CHECK(owned[1][0] == SqlValue{"wheel"});

    CHECK(scalar(*db, R"(SELECT "@type" FROM relations WHERE origin_id = 'wheel' AND name = 'definition')") ==
          SqlValue{"PartUsage"});
    CHECK(scalar(*db, R"(SELECT "@id" FROM relations WHERE origin_id = 'wheel' AND name = 'definition')") ==
          SqlValue{Importer::relation_id("wheel", "definition", "car")});
}

TEST_CASE("Importer: importing twice leaves the database unchanged", "[importer]") {
    auto db = fresh_db();
    Importer importer(*db, ImportConfig{});

    REQUIRE(importer.import_json(json::parse(kVehicle)).is_ok());
    const auto before_elements = rows(*db, R"(SELECT * FROM elements ORDER BY "@id")");
    const auto before_relations = rows(*db, R"(SELECT * FROM relations ORDER BY "@id")");

    auto again = importer.import_json(json::parse(kVehicle));
    REQUIRE(again.is_ok());
    CHECK(rows(*db, R"(SELECT * FROM elements ORDER BY "@id")") == before_elements);
    CHECK(rows(*db, R"(SELECT * FROM relations ORDER BY "@id")") == before_relations);
}

TEST_CASE("Importer: the document replaces stored elements and their references", "[importer]") {
    auto db = fresh_db();
    Importer importer(*db, ImportConfig{});
    REQUIRE(importer.import_json(json::parse(kVehicle)).is_ok());

    // wheel renamed and no longer typed by car
    auto report = importer.import_json(json::parse(R"([
      {"@id": "car", "@type": "PartDefinition", "name": "Car"},
      {"@id": "wheel", "@type": "PartUsage", "name": "front wheel", "owner": {"@id": "car"}}
    ])"));
    REQUIRE(report.is_ok());

    CHECK(scalar(*db, R"(SELECT name FROM elements WHERE "@id" = 'wheel')") == SqlValue{"front wheel"});
    CHECK(scalar(*db, "SELECT COUNT(*) FROM relations WHERE origin_id = 'wheel'") == SqlValue{int64_t{1}});
    // car lost its owner reference, pkg is untouched
    CHECK(scalar(*db, "SELECT COUNT(*) FROM relations WHERE origin_id = 'car'") == SqlValue{int64_t{0}});
    CHECK(scalar(*db, "SELECT COUNT(*) FROM relations WHERE origin_id = 'pkg'") == SqlValue{int64_t{2}});
    CHECK(count(*db, "elements") == 3);
}

TEST_CASE("Importer: references to absent elements are skipped and reported", "[importer]") {
    auto db = fresh_db();
    Importer importer(*db, ImportConfig{});

    auto report = importer.import_json(json::parse(R"([
      {"@id": "a", "@type": "PartUsage", "owner": {"@id": "ghost"}, "definition": [{"@id": "b"}]},
      {"@id": "b", "@type": "PartDefinition"}
    ])"));
    INFO(report.error_message());
    REQUIRE(report.is_ok());
    CHECK(report.value().relations_written == 1);
    REQUIRE(report.value().dangling.size() == 1);

    const auto& d = report.value().dangling.front();
    CHECK(d.kind == ImportErrorKind::DANGLING_REFERENCE);
    CHECK(d.origin_id == "a");
    CHECK(d.relation_name == "owner");
    CHECK(d.target_id == "ghost");
    CHECK(d.relation_id == Importer::relation_id("a", "owner", "ghost"));
    CHECK(count(*db, "relations") == 1);
}

TEST_CASE("Importer: relation aliases rename relations", "[importer]") {
    auto db = fresh_db();
    ImportConfig config;
    config.relation_aliases = {{"owner", "ownedBy"}, {"definition", "definedBy"}};
    Importer importer(*db, config);

    REQUIRE(importer.import_json(json::parse(kVehicle)).is_ok());
    CHECK(scalar(*db, "SELECT COUNT(*) FROM relations WHERE name = 'ownedBy'") == SqlValue{int64_t{2}});
    CHECK(scalar(*db, "SELECT COUNT(*) FROM relations WHERE name = 'definedBy'") == SqlValue{int64_t{1}});
    CHECK(scalar(*db, "SELECT COUNT(*) FROM relations WHERE name = 'owner'") == SqlValue{int64_t{0}});
}

TEST_CASE("Importer: string booleans are converted in compatibility mode", "[importer]") {
    const auto doc = json::parse(R"([{"@id": "t", "@type": "PartDefinition",
                                      "isAbstract": "true", "isVariation": "false", "name": "true"}])");
    SECTION("enabled") {
        auto db = fresh_db();
        ImportConfig config;
        config.syside_compat = true;
        Importer importer(*db, config);
        REQUIRE(importer.import_json(doc).is_ok());
        CHECK(scalar(*db, R"(SELECT isAbstract FROM elements WHERE "@id" = 't')") == SqlValue{int64_t{1}});
        CHECK(scalar(*db, R"(SELECT isVariation FROM elements WHERE "@id" = 't')") == SqlValue{int64_t{0}});
        // Only is* columns are touched
        CHECK(scalar(*db, R"(SELECT name FROM elements WHERE "@id" = 't')") == SqlValue{"true"});
    }
    SECTION("disabled") {
        auto db = fresh_db();
        Importer importer(*db, ImportConfig{});
        CHECK(importer.to_sql("isAbstract", FieldValue{std::string("true")}) == SqlValue{"true"});
    }
}

TEST_CASE("Importer: relation-like elements fill their relations rows", "[importer]") {
    auto db = fresh_db();
    Importer importer(*db, ImportConfig{}, SchemaConventions{}, relation_types());

    auto report = importer.import_json(json::parse(R"([
      {"@id": "pkg", "@type": "Package", "name": "P"},
      {"@id": "m1", "@type": "OwningMembership", "memberName": "engine", "visibility": "public",
       "membershipOwningNamespace": {"@id": "pkg"}, "ownedMemberName": "engine"}
    ])"));
    INFO(report.error_message());
    REQUIRE(report.is_ok());
    CHECK(report.value().unmatched_properties.empty());

    const auto r = rows(*db, R"(SELECT name, memberName, visibility, "@type" FROM relations WHERE origin_id = 'm1')");
    REQUIRE(r.size() == 1);
    CHECK(r[0][0] == SqlValue{"membershipOwningNamespace"});
    CHECK(r[0][1] == SqlValue{"engine"});
    CHECK(r[0][2] == SqlValue{"public"});
    CHECK(r[0][3] == SqlValue{"OwningMembership"});
}

TEST_CASE("Importer: properties without a column are reported", "[importer]") {
    auto db = fresh_db();
    Importer importer(*db, ImportConfig{});

    auto report = importer.import_json(json::parse(R"([
      {"@id": "x", "@type": "PartUsage", "name": "x", "vendorExtension": 3, "nothing": null}
    ])"));
    REQUIRE(report.is_ok());
    CHECK(report.value().unmatched_properties == std::set<std::string>{"vendorExtension"});
    CHECK(count(*db, "elements") == 1);
}

TEST_CASE("Importer: a failure rolls the whole run back", "[importer]") {
    auto db = fresh_db();
    FailingGateway failing(*db, "relations", 2);
    Importer importer(failing, ImportConfig{});

    auto report = importer.import_json(json::parse(kVehicle));
    REQUIRE(report.is_error());
    CHECK(report.err().kind == ImportErrorKind::DATABASE_ERROR);
    CHECK_FALSE(report.err().relation_id.empty());
    CHECK(failing.rollbacks == 1);

    CHECK(count(*db, "elements") == 0);
    CHECK(count(*db, "relations") == 0);
}

TEST_CASE("Importer: a transaction that cannot start restores the bulk settings", "[importer]") {
    auto db = fresh_db();
    FailingGateway failing(*db, "relations", 100);
    failing.fail_begin = true;
    ImportConfig config;
    config.disable_foreign_key_checks = true;
    Importer importer(failing, config);

    auto report = importer.import_json(json::parse(kVehicle));
    REQUIRE(report.is_error());
    CHECK(report.err().kind == ImportErrorKind::DATABASE_ERROR);
    CHECK(report.err().detail.find("locked") != std::string::npos);
    CHECK(failing.rollbacks == 0);

    CHECK(scalar(*db, "PRAGMA foreign_keys") == SqlValue{int64_t{1}});
    CHECK(scalar(*db, "PRAGMA synchronous") == SqlValue{int64_t{1}});  // NORMAL
    CHECK(count(*db, "elements") == 0);
}

TEST_CASE("Importer: an uninitialised database is refused", "[importer]") {
    auto db = SqliteGateway::open(":memory:");
    REQUIRE(db.is_ok());
    Importer importer(*db.value(), ImportConfig{});

    auto report = importer.import_json(json::parse(kVehicle));
    REQUIRE(report.is_error());
    CHECK(report.err().kind == ImportErrorKind::DATABASE_ERROR);
    CHECK(report.err().detail.find("initialise") != std::string::npos);
}

TEST_CASE("Importer: malformed documents import nothing", "[importer]") {
    auto db = fresh_db();
    Importer importer(*db, ImportConfig{});

    auto report = importer.import_json(json::parse(R"([{"@id": "a", "@type": "T"}, {"@type": "T"}])"));
    REQUIRE(report.is_error());
    CHECK(report.err().kind == ImportErrorKind::MALFORMED_ELEMENT);
    CHECK(report.err().element_index == 1);
    CHECK(count(*db, "elements") == 0);
}

TEST_CASE("Importer: import_file reads JSON files", "[importer]") {
    const auto dir = std::filesystem::temp_directory_path() / "sysmlsql_test_import";
    std::filesystem::create_directories(dir);
    const auto good = dir / "model.json";
    const auto bad = dir / "broken.json";
    std::ofstream(good) << kVehicle;
    std::ofstream(bad) << "[{";

    auto db = fresh_db();
    Importer importer(*db, ImportConfig{});
    CHECK(importer.import_file(good.string()).is_ok());
    CHECK(count(*db, "elements") == 3);

    auto broken = importer.import_file(bad.string());
    REQUIRE(broken.is_error());
    CHECK(broken.err().kind == ImportErrorKind::IO_ERROR);

    auto missing = importer.import_file((dir / "absent.json").string());
    REQUIRE(missing.is_error());
    CHECK(missing.err().kind == ImportErrorKind::IO_ERROR);

    std::filesystem::remove_all(dir);
}

TEST_CASE("Importer: vacuum and disabled foreign keys are honoured", "[importer]") {
    auto db = fresh_db();
    ImportConfig config;
    config.vacuum = true;
    config.disable_foreign_key_checks = true;
    Importer importer(*db, config);

    REQUIRE(importer.import_json(json::parse(kVehicle)).is_ok());
    CHECK(scalar(*db, "PRAGMA foreign_keys") == SqlValue{int64_t{1}});
    CHECK(count(*db, "elements") == 3);
}

TEST_CASE("Importer: relation ids are deterministic name-based UUIDs", "[importer]") {
    const auto id = Importer::relation_id("a", "owner", "b");
    CHECK(id == Importer::relation_id("a", "owner", "b"));
    CHECK(id != Importer::relation_id("b", "owner", "a"));
    CHECK(id != Importer::relation_id("a", "ownerb", ""));

    static const std::regex uuid5("^[0-9a-f]{8}-[0-9a-f]{4}-5[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    CHECK(std::regex_match(id, uuid5));
}

TEST_CASE("Importer: values project onto column storage classes", "[importer]") {
    auto db = fresh_db();
    Importer importer(*db, ImportConfig{});
    CHECK(importer.to_sql("x", FieldValue{}) == SqlValue{});
    CHECK(importer.to_sql("isX", FieldValue{true}) == SqlValue{int64_t{1}});
    CHECK(importer.to_sql("n", FieldValue{int64_t{5}}) == SqlValue{int64_t{5}});
    CHECK(importer.to_sql("r", FieldValue{1.5}) == SqlValue{1.5});
    CHECK(importer.to_sql("owner", FieldValue{Reference{"e"}}) == SqlValue{});
    CHECK(importer.to_sql("s", FieldValue{StructuredValue{json::parse(R"({"b":1,"a":2})")}}) ==
          SqlValue{std::string(R"({"a":2,"b":1})")});
}
