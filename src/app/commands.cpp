#include "app/commands.hpp"
#include "db/sqlite/sqlite_gateway.hpp"
#include "fetch/api_client.hpp"
#include "fetch/paginated_fetcher.hpp"
#include "schema/schema_constants.hpp"
#include "core/utils.hpp"

#include "bundled_schema_data.hpp"

#include <chrono>
#include <format>
#include <fstream>
#include <future>
#include <iostream>
#include <memory>

namespace sysmlsql {

namespace {

constexpr std::chrono::milliseconds kInterruptPoll{100};

template<typename E>
CommandError from(const E& err) {
    return CommandError{err.message()};
}

// Waits for the fetch, cancelling it once interrupted is set
Result<nlohmann::json, FetchError> await_fetch(std::future<Result<nlohmann::json, FetchError>>& pending,
                                               PaginatedFetcher& fetcher,
                                               const std::atomic<bool>* interrupted) {
    bool cancelled = false;
    while (pending.wait_for(kInterruptPoll) != std::future_status::ready) {
        if (!cancelled && interrupted && interrupted->load()) {
            utils::log::warn("interrupted, cancelling the fetch");
            fetcher.cancel();
            cancelled = true;
        }
    }
    return pending.get();
}

} // anonymous namespace

std::string_view bundled_schema_text() {
    return generated::kBundledSchema;
}

std::string_view bundled_ddl_text() {
    return generated::kBundledDdl;
}

// ============================================================================
// Schema commands
// ============================================================================

Result<SchemaDocument, CommandError> read_schema_document(const std::string& path) {
    using R = Result<SchemaDocument, CommandError>;

    std::ifstream in(path, std::ios::binary);
    if (!in) return R::error(CommandError{std::format("cannot open schema file {}", path)});
    try {
        return R::ok(SchemaDocument::parse(in));
    } catch (const SchemaDocument::parse_error& e) {
        return R::error(CommandError{std::format("{} is not valid JSON: {}", path, e.what())});
    }
}

Result<EmittedSchema, CommandError> derive_schema(const SchemaDocument& document,
                                                  const SchemaConventions& conventions) {
    using R = Result<EmittedSchema, CommandError>;

    const SchemaResolver resolver(conventions);
    auto resolved = resolver.resolve(document);
    if (resolved.is_error()) return R::error(from(resolved.err()));

    const DdlEmitter emitter(conventions);
    auto emitted = emitter.emit(resolved.value());
    if (emitted.is_error()) return R::error(from(emitted.err()));
    return R::ok(std::move(emitted.value()));
}

Result<Done, CommandError> apply_schema(IDatabaseGateway& db, const EmittedSchema& schema) {
    utils::log::info(std::format("creating tables ({} statements)", schema.statements.size()));
    for (const auto& statement : schema.statements) {
        auto res = db.execute_ddl(statement);
        if (res.is_error()) {
            return Result<Done, CommandError>::error(CommandError{std::format(
                "{}; are there pre-existing tables with a different layout in the database?",
                res.error_message())});
        }
    }
    return Result<Done, CommandError>::ok(Done{});
}

Result<SchemaDocument, CommandError> load_schema_document(const std::string& schema_file) {
    using R = Result<SchemaDocument, CommandError>;

    if (!schema_file.empty()) return read_schema_document(schema_file);
    try {
        const auto text = bundled_schema_text();
        return R::ok(SchemaDocument::parse(text.begin(), text.end()));
    } catch (const SchemaDocument::parse_error& e) {
        return R::error(CommandError{std::format("bundled schema is not valid JSON: {}", e.what())});
    }
}

Result<Done, CommandError> init_schema(IDatabaseGateway& db, const SchemaConventions& conventions,
                                       const std::string& schema_file) {
    using R = Result<Done, CommandError>;

    if (schema_file.empty() && conventions == SchemaConventions{}) {
        utils::log::info("creating tables from the bundled DDL");
        auto res = db.execute(std::string(bundled_ddl_text()));
        if (res.is_error()) {
            return R::error(CommandError{std::format(
                "{}; are there pre-existing tables with a different layout in the database?",
                res.error_message())});
        }
        return R::ok(Done{});
    }

    utils::log::info(schema_file.empty()
        ? std::string("deriving the DDL from the bundled schema for the configured conventions")
        : std::format("deriving the DDL from {}", schema_file));
    auto document = load_schema_document(schema_file);
    if (document.is_error()) return R::error(document.err());

    auto schema = derive_schema(document.value(), conventions);
    if (schema.is_error()) return R::error(schema.err());
    return apply_schema(db, schema.value());
}

Result<EmittedSchema, CommandError> generate_ddl(IDatabaseGateway* db,
                                                 const std::string& schema_path,
                                                 const std::string& dump_sql,
                                                 const SchemaConventions& conventions) {
    using R = Result<EmittedSchema, CommandError>;

    auto document = read_schema_document(schema_path);
    if (document.is_error()) return R::error(document.err());

    auto schema = derive_schema(document.value(), conventions);
    if (schema.is_error()) return schema;

    if (!dump_sql.empty()) {
        utils::log::info(std::format("writing the SQL schema to {}", dump_sql));
        std::ofstream out(dump_sql, std::ios::binary | std::ios::trunc);
        out << schema.value().ddl() << '\n';
        out.flush();
        if (!out) return R::error(CommandError{std::format("cannot write {}", dump_sql)});
    }

    if (db) {
        auto applied = apply_schema(*db, schema.value());
        if (applied.is_error()) return R::error(applied.err());
    }
    return schema;
}

Result<std::set<std::string>, CommandError> relation_type_names(const SchemaConventions& conventions,
                                                                const std::string& schema_file) {
    using R = Result<std::set<std::string>, CommandError>;

    auto document = load_schema_document(schema_file);
    if (document.is_error()) return R::error(document.err());

    const SchemaResolver resolver(conventions);
    auto resolved = resolver.resolve(document.value());
    if (resolved.is_error()) return R::error(from(resolved.err()));

    std::set<std::string> names;
    const DdlEmitter emitter(conventions);
    for (const auto* def : emitter.partition(resolved.value()).relation_types) {
        names.insert(def->name);
        if (!def->discriminator.empty()) names.insert(def->discriminator);
    }
    return R::ok(std::move(names));
}

// ============================================================================
// Import commands
// ============================================================================

Result<ImportReport, CommandError> load_from_file(IDatabaseGateway& db, const std::string& path,
                                                  const AppConfig& config) {
    using R = Result<ImportReport, CommandError>;

    auto relation_types = relation_type_names(config.schema, config.schema_file);
    if (relation_types.is_error()) return R::error(relation_types.err());

    Importer importer(db, config.import, config.schema, std::move(relation_types.value()));
    auto report = importer.import_file(path);
    if (report.is_error()) return R::error(from(report.err()));
    return R::ok(std::move(report.value()));
}

Result<std::optional<ImportReport>, CommandError> fetch_from_server(IDatabaseGateway* db,
                                                                    IHttpTransport& transport,
                                                                    const FetchRequest& request,
                                                                    const AppConfig& config,
                                                                    const std::atomic<bool>* interrupted) {
    using R = Result<std::optional<ImportReport>, CommandError>;

    ApiClient client(request.base_url, config.fetch, transport);
    if (!config.fetch.username.empty()) {
        utils::log::debug(std::format("using basic auth as {}", config.fetch.username));
    }

    client.start_operation();
    ModelLocator locator(client);
    auto model = locator.locate(request.selector);
    if (model.is_error()) return R::error(from(model.err()));

    PaginatedFetcher fetcher(client, PaginatedFetcher::Config{
        .page_size = config.fetch.page_size,
        .dump_pages_dir = request.dump_pages_dir});
    auto pending = fetcher.fetch_async(model.value().project_id, model.value().commit_id);
    auto collection = await_fetch(pending, fetcher, interrupted);
    if (collection.is_error()) return R::error(from(collection.err()));

    if (!request.dump_json.empty()) {
        auto dumped = PaginatedFetcher::dump_collection(collection.value(), request.dump_json,
                                                        request.pretty);
        if (dumped.is_error()) return R::error(from(dumped.err()));
    }

    if (!db) return R::ok(std::nullopt);

    auto relation_types = relation_type_names(config.schema, config.schema_file);
    if (relation_types.is_error()) return R::error(relation_types.err());

    Importer importer(*db, config.import, config.schema, std::move(relation_types.value()));
    auto report = importer.import_json(collection.value());
    if (report.is_error()) return R::error(from(report.err()));
    return R::ok(std::move(report.value()));
}

void print_import_report(std::ostream& os, const ImportReport& report) {
    os << std::format("imported {} elements and {} relations\n",
                      report.elements_written, report.relations_written);
    if (!report.dangling.empty()) {
        os << std::format("{} dangling references were skipped:\n", report.dangling.size());
        for (const auto& d : report.dangling) {
            os << "  " << d.message() << '\n';
        }
    }
}

// ============================================================================
// Dispatch
// ============================================================================

AppConfig apply_cli_overrides(AppConfig config, const CliOptions& options) {
    if (options.verbose) config.logging.level = "debug";

    config.import.vacuum = config.import.vacuum || options.import.vacuum;
    config.import.disable_foreign_key_checks =
        config.import.disable_foreign_key_checks || options.import.disable_foreign_key_checks;
    config.import.syside_compat = config.import.syside_compat || options.import.syside_compat;

    if (options.page_size) config.fetch.page_size = *options.page_size;
    if (options.allow_invalid_certs) config.fetch.allow_invalid_certs = true;
    return config;
}

int run_command(const CliOptions& options, const AppConfig& config,
                const std::atomic<bool>* interrupted) {
    const bool needs_db = !(options.command == Command::FETCH && options.no_import) &&
                          !(options.command == Command::SCHEMA_TO_SQL && options.no_init);

    std::unique_ptr<SqliteGateway> db;
    if (needs_db) {
        utils::log::info(std::format("opening database {}", options.db_file));
        auto opened = SqliteGateway::open(options.db_file);
        if (opened.is_error()) {
            utils::log::error(std::format("cannot open database {}: {}", options.db_file,
                                          opened.error_message()));
            return kExitFailure;
        }
        db = std::move(opened.value());
    }

    auto fail = [](const CommandError& err) {
        utils::log::error(err.message());
        return kExitFailure;
    };

    switch (options.command) {
        case Command::INIT_DB: {
            auto schema = init_schema(*db, config.schema, config.schema_file);
            if (schema.is_error()) return fail(schema.err());
            auto elements = db->table_columns(std::string(table::kElements));
            if (elements.is_error()) return fail(CommandError{elements.error_message()});
            auto relations = db->table_columns(std::string(table::kRelations));
            if (relations.is_error()) return fail(CommandError{relations.error_message()});
            std::cout << std::format("initialised {} ({} element columns, {} relation columns)\n",
                options.db_file, elements.value().size(), relations.value().size());
            return kExitOk;
        }
        case Command::IMPORT_JSON: {
            auto report = load_from_file(*db, options.input_file, config);
            if (report.is_error()) return fail(report.err());
            print_import_report(std::cout, report.value());
            return kExitOk;
        }
        case Command::FETCH: {
            HttplibTransport transport;
            const FetchRequest request{
                .base_url = options.base_url,
                .selector = options.selector,
                .dump_json = options.dump_json,
                .pretty = options.pretty,
                .dump_pages_dir = options.dump_pages_dir};
            auto report = fetch_from_server(db.get(), transport, request, config, interrupted);
            if (report.is_error()) return fail(report.err());
            if (report.value()) print_import_report(std::cout, *report.value());
            return kExitOk;
        }
        case Command::SCHEMA_TO_SQL: {
            auto schema = generate_ddl(db.get(), options.schema_file, options.dump_sql, config.schema);
            if (schema.is_error()) return fail(schema.err());
            if (options.dump_sql.empty() && options.no_init) {
                std::cout << schema.value().ddl() << '\n';
            }
            return kExitOk;
        }
        case Command::NONE:
            break;
    }
    utils::log::error("no command given");
    return kExitUsage;
}

} // namespace sysmlsql
