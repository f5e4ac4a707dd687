#include "app/cli_args.hpp"
#include "core/utils.hpp"

#include <format>
#include <algorithm>
#include <map>
#include <vector>

namespace sysmlsql {

namespace {

struct CommandSpec {
    Command command;
    size_t operands;        // positional arguments after the command name
    const char* operand_name;
};

const std::map<std::string, CommandSpec>& command_specs() {
    static const std::map<std::string, CommandSpec> specs = {
        {"init-db",                   {Command::INIT_DB, 0, ""}},
        {"import-json",               {Command::IMPORT_JSON, 1, "<file>"}},
        {"fetch",                     {Command::FETCH, 1, "<base_url>"}},
        {"json-schema-to-sql-schema", {Command::SCHEMA_TO_SQL, 1, "<schema.json>"}},
    };
    return specs;
}

using CommandSet = std::vector<Command>;

bool allowed_for(Command command, const CommandSet& commands) {
    return std::find(commands.begin(), commands.end(), command) != commands.end();
}

} // anonymous namespace

const char* command_name(Command command) {
    switch (command) {
        case Command::NONE:          return "none";
        case Command::INIT_DB:       return "init-db";
        case Command::IMPORT_JSON:   return "import-json";
        case Command::FETCH:         return "fetch";
        case Command::SCHEMA_TO_SQL: return "json-schema-to-sql-schema";
    }
    return "unknown";
}

void print_help(std::ostream& os) {
    os << "Usage: sysml-sql [-v] [-c <config.toml>] <db_file> <command> [options]\n\n";
    os << "Commands:\n";
    os << "  init-db\n";
    os << "      Create the elements and relations tables from the bundled schema.\n";
    os << "      Initialising an existing database is a no-op.\n";
    os << "  import-json <file> [import options]\n";
    os << "      Import a JSON array of elements. Re-importing is idempotent; the\n";
    os << "      document's version of an element replaces the stored one.\n";
    os << "  fetch <base_url> (--project-id <id> | --project-name <name>)\n";
    os << "        [--commit-id <id> | --branch-id <id> | --branch-name <name>]\n";
    os << "        [--page-size <n>] [--allow-invalid-certs] [--dump-json <file>] [--pretty]\n";
    os << "        [--dump-pages <dir>] [--no-import] [import options]\n";
    os << "      Fetch a model from a SysML v2 API server and import it. Without a commit\n";
    os << "      or branch option the head of the default branch is used. Names match by\n";
    os << "      prefix. Basic auth credentials come from [fetch] in the config file or\n";
    os << "      from SYSML_USERNAME / SYSML_PASSWORD.\n";
    os << "  json-schema-to-sql-schema <schema.json> [--dump-sql <file>] [--no-init]\n";
    os << "      Derive the SQL schema from a JSON schema document.\n\n";
    os << "Import options:\n";
    os << "  --vacuum                        Run VACUUM after the import\n";
    os << "  --disable-foreign-key-checks    Allow importing incomplete model dumps\n";
    os << "  --syside-compat                 Accept \"true\"/\"false\" strings for is* columns\n\n";
    os << "Global options:\n";
    os << "  -v, --verbose                   Debug logging\n";
    os << "  -c, --config <file>             TOML configuration file\n";
    os << "  -h, --help                      Show this help\n";
    os << "  -V, --version                   Show the version\n\n";
    os << "Exit codes: 0=success, 1=fatal error, 2=usage error.\n";
}

bool parse_cli_args(int argc, const char* const* argv, CliOptions& options, std::string& error) {
    CliOptions parsed;
    std::vector<std::string> positionals;
    // Command specific flags, checked once the command is known
    std::vector<std::pair<std::string, CommandSet>> used;

    const CommandSet importing = {Command::IMPORT_JSON, Command::FETCH};
    const CommandSet fetching = {Command::FETCH};
    const CommandSet schema_only = {Command::SCHEMA_TO_SQL};

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto take_value = [&](std::string& out) {
            if (i + 1 >= argc) {
                error = std::format("Missing value for {}", arg);
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            parsed.show_help = true;
        } else if (arg == "-V" || arg == "--version") {
            parsed.show_version = true;
        } else if (arg == "-v" || arg == "--verbose") {
            parsed.verbose = true;
        } else if (arg == "-c" || arg == "--config") {
            if (!take_value(parsed.config_path)) return false;
        } else if (arg == "--vacuum") {
            parsed.import.vacuum = true;
            used.emplace_back(arg, importing);
        } else if (arg == "--disable-foreign-key-checks") {
            parsed.import.disable_foreign_key_checks = true;
            used.emplace_back(arg, importing);
        } else if (arg == "--syside-compat") {
            parsed.import.syside_compat = true;
            used.emplace_back(arg, importing);
        } else if (arg == "--project-id") {
            if (!take_value(parsed.selector.project_id)) return false;
            used.emplace_back(arg, fetching);
        } else if (arg == "--project-name") {
            if (!take_value(parsed.selector.project_name)) return false;
            used.emplace_back(arg, fetching);
        } else if (arg == "--commit-id") {
            if (!take_value(parsed.selector.commit_id)) return false;
            used.emplace_back(arg, fetching);
        } else if (arg == "--branch-id") {
            if (!take_value(parsed.selector.branch_id)) return false;
            used.emplace_back(arg, fetching);
        } else if (arg == "--branch-name") {
            if (!take_value(parsed.selector.branch_name)) return false;
            used.emplace_back(arg, fetching);
        } else if (arg == "--page-size") {
            std::string value;
            if (!take_value(value)) return false;
            const auto n = utils::try_parse_int<uint32_t>(value);
            if (!n || *n == 0) {
                error = std::format("Invalid --page-size value \"{}\" (use a positive integer)", value);
                return false;
            }
            parsed.page_size = *n;
            used.emplace_back(arg, fetching);
        } else if (arg == "--allow-invalid-certs") {
            parsed.allow_invalid_certs = true;
            used.emplace_back(arg, fetching);
        } else if (arg == "--dump-json") {
            if (!take_value(parsed.dump_json)) return false;
            used.emplace_back(arg, fetching);
        } else if (arg == "--pretty") {
            parsed.pretty = true;
            used.emplace_back(arg, fetching);
        } else if (arg == "--dump-pages") {
            if (!take_value(parsed.dump_pages_dir)) return false;
            used.emplace_back(arg, fetching);
        } else if (arg == "--no-import") {
            parsed.no_import = true;
            used.emplace_back(arg, fetching);
        } else if (arg == "--dump-sql") {
            if (!take_value(parsed.dump_sql)) return false;
            used.emplace_back(arg, schema_only);
        } else if (arg == "--no-init") {
            parsed.no_init = true;
            used.emplace_back(arg, schema_only);
        } else if (arg.size() > 1 && arg.starts_with('-')) {
            error = "Unknown argument: " + arg;
            return false;
        } else {
            positionals.push_back(arg);
        }
    }

    if (parsed.show_help || parsed.show_version) {
        options = std::move(parsed);
        return true;
    }

    if (positionals.empty()) {
        error = "Missing <db_file>";
        return false;
    }
    if (positionals.size() < 2) {
        error = "Missing <command> (init-db, import-json, fetch, json-schema-to-sql-schema)";
        return false;
    }
    parsed.db_file = positionals[0];

    const auto spec = command_specs().find(positionals[1]);
    if (spec == command_specs().end()) {
        error = std::format("Unknown command: {}", positionals[1]);
        return false;
    }
    parsed.command = spec->second.command;

    const size_t operands = positionals.size() - 2;
    if (operands < spec->second.operands) {
        error = std::format("{} expects {}", positionals[1], spec->second.operand_name);
        return false;
    }
    if (operands > spec->second.operands) {
        error = std::format("Unexpected argument for {}: {}", positionals[1],
                            positionals[2 + spec->second.operands]);
        return false;
    }

    for (const auto& [flag, commands] : used) {
        if (!allowed_for(parsed.command, commands)) {
            error = std::format("{} is not supported by {}", flag, positionals[1]);
            return false;
        }
    }

    switch (parsed.command) {
        case Command::IMPORT_JSON:
            parsed.input_file = positionals[2];
            break;
        case Command::SCHEMA_TO_SQL:
            parsed.schema_file = positionals[2];
            break;
        case Command::FETCH: {
            parsed.base_url = positionals[2];
            const auto& sel = parsed.selector;
            if (sel.project_id.empty() == sel.project_name.empty()) {
                error = "fetch needs exactly one of --project-id and --project-name";
                return false;
            }
            const int commits = !sel.commit_id.empty() + !sel.branch_id.empty() +
                                !sel.branch_name.empty();
            if (commits > 1) {
                error = "--commit-id, --branch-id and --branch-name are mutually exclusive";
                return false;
            }
            if (parsed.no_import && parsed.dump_json.empty() && parsed.dump_pages_dir.empty()) {
                error = "--no-import without --dump-json or --dump-pages discards the fetched model";
                return false;
            }
            if (parsed.pretty && parsed.dump_json.empty()) {
                error = "--pretty is only supported with --dump-json";
                return false;
            }
            break;
        }
        case Command::INIT_DB:
        case Command::NONE:
            break;
    }

    options = std::move(parsed);
    return true;
}

} // namespace sysmlsql
