#include <catch2/catch_test_macros.hpp>
#include "importer/element.hpp"

using namespace sysmlsql;
using nlohmann::json;

TEST_CASE("ElementParser: property values are classified", "[importer][elements]") {
    const std::string id = "@id";
    CHECK(std::holds_alternative<std::monostate>(to_field_value(json(nullptr), id)));
    CHECK(std::get<bool>(to_field_value(json(true), id)));
    CHECK(std::get<int64_t>(to_field_value(json(-7), id)) == -7);
    CHECK(std::get<int64_t>(to_field_value(json(42u), id)) == 42);
    CHECK(std::get<double>(to_field_value(json(2.5), id)) == 2.5);
    CHECK(std::get<std::string>(to_field_value(json("x"), id)) == "x");

    // Above INT64_MAX the value no longer fits an integer column
    CHECK(std::holds_alternative<double>(to_field_value(json(18446744073709551615ull), id)));
}

TEST_CASE("ElementParser: references and reference lists", "[importer][elements]") {
    const std::string id = "@id";
    CHECK(std::get<Reference>(to_field_value(json::parse(R"({"@id": "e1"})"), id)) == Reference{"e1"});
    CHECK(std::get<ReferenceList>(to_field_value(json::parse(R"([{"@id": "a"}, {"@id": "b"}])"), id)) ==
          ReferenceList{{"a"}, {"b"}});

    // Extra members or a non-string id make it plain structured data
    CHECK(std::holds_alternative<StructuredValue>(
        to_field_value(json::parse(R"({"@id": "e1", "name": "x"})"), id)));
    CHECK(std::holds_alternative<StructuredValue>(to_field_value(json::parse(R"({"@id": 5})"), id)));
    CHECK(std::holds_alternative<StructuredValue>(
        to_field_value(json::parse(R"([{"@id": "a"}, "b"])"), id)));
    CHECK(std::holds_alternative<StructuredValue>(to_field_value(json::parse("[]"), id)));
    CHECK(std::holds_alternative<StructuredValue>(to_field_value(json::parse(R"(["x", "y"])"), id)));

    // Custom id member
    CHECK(std::holds_alternative<Reference>(to_field_value(json::parse(R"({"id": "e1"})"), "id")));
    CHECK_FALSE(holds_reference(to_field_value(json::parse(R"({"id": "e1"})"), "@id")));
}

TEST_CASE("ElementParser: elements keep id, type and properties", "[importer][elements]") {
    auto res = parse_elements(json::parse(R"([
      {"@id": "e1", "@type": "PartUsage", "name": "wheel", "isAbstract": false,
       "owner": {"@id": "e2"}, "aliasIds": []},
      {"@id": "e2", "@type": "PartDefinition", "name": "Car"}
    ])"));
    REQUIRE(res.is_ok());
    const auto& elements = res.value();
    REQUIRE(elements.size() == 2);

    CHECK(elements[0].id == "e1");
    CHECK(elements[0].type == "PartUsage");
    CHECK(elements[0].find("@id") == nullptr);
    CHECK(elements[0].find("@type") == nullptr);
    CHECK(std::get<std::string>(*elements[0].find("name")) == "wheel");
    CHECK(std::get<bool>(*elements[0].find("isAbstract")) == false);
    CHECK(holds_reference(*elements[0].find("owner")));
    CHECK(elements[1].properties.size() == 1);
}

TEST_CASE("ElementParser: identical duplicates collapse", "[importer][elements]") {
    auto res = parse_elements(json::parse(R"([
      {"@id": "e1", "@type": "Part", "name": "a"},
      {"@id": "e2", "@type": "Part"},
      {"@id": "e1", "@type": "Part", "name": "a"}
    ])"));
    REQUIRE(res.is_ok());
    REQUIRE(res.value().size() == 2);
    CHECK(res.value()[0].id == "e1");
    CHECK(res.value()[1].id == "e2");
}

TEST_CASE("ElementParser: differing duplicates are rejected", "[importer][elements]") {
    auto res = parse_elements(json::parse(R"([
      {"@id": "e1", "@type": "Part", "name": "a"},
      {"@id": "e1", "@type": "Part", "name": "b"}
    ])"));
    REQUIRE(res.is_error());
    CHECK(res.err().kind == ImportErrorKind::CONFLICTING_DUPLICATE);
    CHECK(res.err().element_id == "e1");
    CHECK(res.err().element_index == 1);
}

TEST_CASE("ElementParser: malformed entries name their index", "[importer][elements]") {
    SECTION("document is not an array") {
        auto res = parse_elements(json::parse(R"({"@id": "e1"})"));
        REQUIRE(res.is_error());
        CHECK(res.err().kind == ImportErrorKind::MALFORMED_ELEMENT);
    }
    SECTION("entry is not an object") {
        auto res = parse_elements(json::parse(R"([{"@id": "e1", "@type": "T"}, 3])"));
        REQUIRE(res.is_error());
        CHECK(res.err().kind == ImportErrorKind::MALFORMED_ELEMENT);
        CHECK(res.err().element_index == 1);
    }
    SECTION("missing id") {
        auto res = parse_elements(json::parse(R"([{"@type": "T"}])"));
        REQUIRE(res.is_error());
        CHECK(res.err().element_index == 0);
    }
    SECTION("empty id") {
        auto res = parse_elements(json::parse(R"([{"@id": "", "@type": "T"}])"));
        REQUIRE(res.is_error());
        CHECK(res.err().kind == ImportErrorKind::MALFORMED_ELEMENT);
    }
    SECTION("non-string type") {
        auto res = parse_elements(json::parse(R"([{"@id": "e1", "@type": 4}])"));
        REQUIRE(res.is_error());
        CHECK(res.err().detail.find("e1") != std::string::npos);
    }
}

TEST_CASE("ElementParser: an empty document has no elements", "[importer][elements]") {
    auto res = parse_elements(json::array());
    REQUIRE(res.is_ok());
    CHECK(res.value().empty());
}
