#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>

using namespace sysmlsql;

namespace {

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    TmpDir() : path(std::filesystem::temp_directory_path() / "sysmlsql_test_config") {
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
    std::string file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::ofstream f(p);
        f << content;
        return p.string();
    }
};

// Credentials from the environment would leak into every load
struct NoCredentialEnv {
    NoCredentialEnv() {
        ::unsetenv("SYSML_USERNAME");
        ::unsetenv("SYSML_PASSWORD");
    }
    ~NoCredentialEnv() {
        ::unsetenv("SYSML_USERNAME");
        ::unsetenv("SYSML_PASSWORD");
    }
};

} // namespace

TEST_CASE("ConfigLoader: empty file yields defaults", "[config]") {
    NoCredentialEnv env;
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    const auto& c = result.config;
    CHECK(c.logging.level == "info");
    CHECK(c.schema.id_field == "@id");
    CHECK(c.schema.type_field == "@type");
    CHECK(c.schema.polymorphic_fields == std::vector<std::string>{"value"});
    CHECK(c.fetch.max_retries == 3);
    CHECK(c.fetch.page_size == 0);
    CHECK(c.fetch.username.empty());
    CHECK_FALSE(c.import.vacuum);
    CHECK(c.import.relation_aliases == std::map<std::string, std::string>{
        {"definedBy", "definition"}, {"ownedBy", "owner"}});
    CHECK(c.schema_file.empty());

    auto defaults = ConfigLoader::load_defaults();
    REQUIRE(defaults.success);
    CHECK(defaults.config.fetch.request_timeout_ms == c.fetch.request_timeout_ms);
}

TEST_CASE("ConfigLoader: every section is read", "[config]") {
    NoCredentialEnv env;
    auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "debug"

[schema]
id_field = "id"
type_field = "kind"
identity_type = "Ref"
relation_root = "Link"
polymorphic_fields = ["value", "default"]
file = "schemas/custom.json"

[fetch]
page_size = 500
max_retries = 7
retry_backoff_ms = 250
request_timeout_ms = 10000
overall_timeout_ms = 600000
allow_invalid_certs = true
username = "alice"
password = "pw"

[import]
vacuum = true
disable_foreign_key_checks = true
syside_compat = true

[import.relation_aliases]
definition = "definedBy"
owner = "ownedBy"
)");
    INFO(result.error_message);
    REQUIRE(result.success);
    const auto& c = result.config;
    CHECK(c.logging.level == "debug");
    CHECK(c.schema.id_field == "id");
    CHECK(c.schema.type_field == "kind");
    CHECK(c.schema.identity_type == "Ref");
    CHECK(c.schema.relation_root == "Link");
    CHECK(c.schema.polymorphic_fields == std::vector<std::string>{"value", "default"});
    CHECK(c.schema_file == "schemas/custom.json");
    CHECK(c.fetch.page_size == 500);
    CHECK(c.fetch.max_retries == 7);
    CHECK(c.fetch.retry_backoff_ms == 250);
    CHECK(c.fetch.request_timeout_ms == 10000);
    CHECK(c.fetch.overall_timeout_ms == 600000);
    CHECK(c.fetch.allow_invalid_certs);
    CHECK(c.fetch.username == "alice");
    CHECK(c.fetch.password == "pw");
    CHECK(c.import.vacuum);
    CHECK(c.import.disable_foreign_key_checks);
    CHECK(c.import.syside_compat);
    CHECK(c.import.relation_aliases.at("definition") == "definedBy");
    CHECK(c.import.relation_aliases.at("owner") == "ownedBy");
    CHECK(c.import.relation_aliases.at("definedBy") == "definition");
}

TEST_CASE("ConfigLoader: relation aliases add to the defaults", "[config]") {
    NoCredentialEnv env;
    auto result = ConfigLoader::load_from_string(R"(
[import.relation_aliases]
definedBy = "typedBy"
memberElement = "member"
)");
    INFO(result.error_message);
    REQUIRE(result.success);
    CHECK(result.config.import.relation_aliases == std::map<std::string, std::string>{
        {"definedBy", "typedBy"}, {"memberElement", "member"}, {"ownedBy", "owner"}});
}

TEST_CASE("ConfigLoader: env vars expand in strings", "[config][env]") {
    NoCredentialEnv env;
    ::setenv("SYSMLSQL_TEST_USER", "bob", 1);
    ::unsetenv("SYSMLSQL_TEST_MISSING");

    auto result = ConfigLoader::load_from_string(R"(
[fetch]
username = "${SYSMLSQL_TEST_USER}"
password = "x${SYSMLSQL_TEST_MISSING}y"
)");
    REQUIRE(result.success);
    CHECK(result.config.fetch.username == "bob");
    CHECK(result.config.fetch.password == "xy");

    auto unclosed = ConfigLoader::load_from_string(R"(
[fetch]
username = "${SYSMLSQL_TEST_USER"
)");
    CHECK_FALSE(unclosed.success);
    CHECK(unclosed.error_message.find("Unclosed") != std::string::npos);

    ::unsetenv("SYSMLSQL_TEST_USER");
}

TEST_CASE("ConfigLoader: credentials fall back to the environment", "[config][env]") {
    NoCredentialEnv env;
    ::setenv("SYSML_USERNAME", "env-user", 1);
    ::setenv("SYSML_PASSWORD", "env-pass", 1);

    auto from_env = ConfigLoader::load_from_string("");
    REQUIRE(from_env.success);
    CHECK(from_env.config.fetch.username == "env-user");
    CHECK(from_env.config.fetch.password == "env-pass");

    auto defaults = ConfigLoader::load_defaults();
    REQUIRE(defaults.success);
    CHECK(defaults.config.fetch.username == "env-user");

    // File credentials win
    auto from_file = ConfigLoader::load_from_string(R"(
[fetch]
username = "file-user"
)");
    REQUIRE(from_file.success);
    CHECK(from_file.config.fetch.username == "file-user");
    CHECK(from_file.config.fetch.password.empty());
}

TEST_CASE("ConfigLoader: included files sit underneath the including one", "[config][include]") {
    NoCredentialEnv env;
    TmpDir tmp;

    tmp.file("credentials.toml", R"(
[fetch]
username = "included"
password = "secret"
max_retries = 9
)");
    tmp.file("aliases.toml", R"(
[import.relation_aliases]
owner = "ownedBy"
)");
    auto main_path = tmp.file("main.toml", R"(
include = ["credentials.toml", "aliases.toml"]

[fetch]
max_retries = 2
)");

    auto result = ConfigLoader::load_from_file(main_path);
    INFO(result.error_message);
    REQUIRE(result.success);
    CHECK(result.config.fetch.username == "included");
    CHECK(result.config.fetch.password == "secret");
    CHECK(result.config.fetch.max_retries == 2);
    CHECK(result.config.import.relation_aliases.at("owner") == "ownedBy");
}

TEST_CASE("ConfigLoader: circular includes are rejected", "[config][include]") {
    NoCredentialEnv env;
    TmpDir tmp;
    tmp.file("a.toml", "include = \"b.toml\"\n");
    auto b = tmp.file("b.toml", "include = \"a.toml\"\n");

    auto result = ConfigLoader::load_from_file(b);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Circular") != std::string::npos);
}

TEST_CASE("ConfigLoader: missing and malformed files fail to load", "[config]") {
    NoCredentialEnv env;
    TmpDir tmp;

    CHECK_FALSE(ConfigLoader::load_from_file((tmp.path / "absent.toml").string()).success);

    auto bad = tmp.file("bad.toml", "[fetch\nmax_retries = 1\n");
    auto result = ConfigLoader::load_from_file(bad);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to load config"));
}

TEST_CASE("ConfigLoader: invalid values are reported together", "[config][validation]") {
    NoCredentialEnv env;
    auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "chatty"

[schema]
id_field = "key"
type_field = "key"

[fetch]
max_retries = 1000
request_timeout_ms = 0
password = "orphan"

[import.relation_aliases]
owner = ""
)");
    REQUIRE_FALSE(result.success);
    const auto& msg = result.error_message;
    CHECK(msg.find("logging.level") != std::string::npos);
    CHECK(msg.find("must differ") != std::string::npos);
    CHECK(msg.find("fetch.max_retries") != std::string::npos);
    CHECK(msg.find("fetch.request_timeout_ms") != std::string::npos);
    CHECK(msg.find("fetch.username is not") != std::string::npos);
    CHECK(msg.find("import.relation_aliases.owner") != std::string::npos);
}

TEST_CASE("ConfigLoader: out of range numbers and wrong alias types fail", "[config][validation]") {
    NoCredentialEnv env;
    auto negative = ConfigLoader::load_from_string("[fetch]\npage_size = -1\n");
    CHECK_FALSE(negative.success);
    CHECK(negative.error_message.find("page_size") != std::string::npos);

    auto alias = ConfigLoader::load_from_string("[import.relation_aliases]\nowner = 3\n");
    CHECK_FALSE(alias.success);
    CHECK(alias.error_message.find("must be a string") != std::string::npos);

    auto include = ConfigLoader::load_from_file("/nonexistent/sysml-sql.toml");
    CHECK_FALSE(include.success);
}
