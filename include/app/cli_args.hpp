#pragma once

#include "fetch/model_locator.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace sysmlsql {

enum class Command {
    NONE,
    INIT_DB,
    IMPORT_JSON,
    FETCH,
    SCHEMA_TO_SQL
};

[[nodiscard]] const char* command_name(Command command);

// Per-run overrides of the [import] config section
struct ImportFlags {
    bool vacuum = false;
    bool disable_foreign_key_checks = false;
    bool syside_compat = false;
};

struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    bool verbose = false;
    std::string config_path;            // empty = built-in defaults

    std::string db_file;
    Command command = Command::NONE;

    // import-json
    std::string input_file;
    ImportFlags import;

    // fetch
    std::string base_url;
    ModelSelector selector;
    std::optional<uint32_t> page_size;
    bool allow_invalid_certs = false;
    std::string dump_json;
    bool pretty = false;
    std::string dump_pages_dir;
    bool no_import = false;

    // json-schema-to-sql-schema
    std::string schema_file;
    std::string dump_sql;
    bool no_init = false;
};

// Exit codes: 0 = success, 1 = fatal error, 2 = usage error
inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;

/**
 * @brief Parse argv into typed options
 * @return false with a one-line error for unknown flags, missing values or
 *         options that do not belong to the selected command
 */
[[nodiscard]] bool parse_cli_args(int argc, const char* const* argv, CliOptions& options,
                                  std::string& error);

void print_help(std::ostream& os);

} // namespace sysmlsql
