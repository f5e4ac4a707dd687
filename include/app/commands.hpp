#pragma once

#include "app/cli_args.hpp"
#include "config/config_types.hpp"
#include "core/error.hpp"
#include "db/idatabase_gateway.hpp"
#include "fetch/http_transport.hpp"
#include "fetch/model_locator.hpp"
#include "importer/importer.hpp"
#include "schema/ddl_emitter.hpp"
#include "schema/schema_resolver.hpp"

#include <atomic>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <string_view>

namespace sysmlsql {

// Fatal error of a command, already rendered for the operator
struct CommandError {
    std::string detail;
    [[nodiscard]] std::string message() const { return detail; }
};

// The schema document compiled into the binary
[[nodiscard]] std::string_view bundled_schema_text();

// The checked-in DDL script generated from bundled_schema_text()
[[nodiscard]] std::string_view bundled_ddl_text();

// ============================================================================
// Schema commands
// ============================================================================

[[nodiscard]] Result<SchemaDocument, CommandError> read_schema_document(const std::string& path);

// The document at schema_file, or the bundled one when schema_file is empty
[[nodiscard]] Result<SchemaDocument, CommandError> load_schema_document(const std::string& schema_file);

/**
 * @brief Resolve a schema document and lower it to DDL
 */
[[nodiscard]] Result<EmittedSchema, CommandError> derive_schema(const SchemaDocument& document,
                                                                const SchemaConventions& conventions);

// Run every statement of an emitted schema
[[nodiscard]] Result<Done, CommandError> apply_schema(IDatabaseGateway& db, const EmittedSchema& schema);

/**
 * @brief init-db
 *
 * Runs the checked-in DDL script. With a schema file, or with conventions
 * other than the defaults, the DDL is derived from the schema document
 * instead.
 */
[[nodiscard]] Result<Done, CommandError> init_schema(IDatabaseGateway& db,
                                                     const SchemaConventions& conventions,
                                                     const std::string& schema_file = {});

/**
 * @brief json-schema-to-sql-schema
 * @param db Database to initialise, or nullptr to only derive the DDL
 * @param dump_sql File to write the DDL script to, empty for none
 */
[[nodiscard]] Result<EmittedSchema, CommandError> generate_ddl(IDatabaseGateway* db,
                                                               const std::string& schema_path,
                                                               const std::string& dump_sql,
                                                               const SchemaConventions& conventions);

// Relation-like type names of the schema at schema_file, or of the bundled one
[[nodiscard]] Result<std::set<std::string>, CommandError> relation_type_names(
    const SchemaConventions& conventions, const std::string& schema_file = {});

// ============================================================================
// Import commands
// ============================================================================

/**
 * @brief import-json
 */
[[nodiscard]] Result<ImportReport, CommandError> load_from_file(IDatabaseGateway& db,
                                                                const std::string& path,
                                                                const AppConfig& config);

struct FetchRequest {
    std::string base_url;
    ModelSelector selector;
    std::string dump_json;          // empty = no collection dump
    bool pretty = false;
    std::string dump_pages_dir;     // empty = no page dumps
};

/**
 * @brief fetch: locate the model, fetch it and import it
 *
 * @param db Database to import into, or nullptr to skip the import
 * @param interrupted Polled while the fetch runs; once set the fetch is cancelled
 * @return The import report, or nullopt when nothing was imported
 */
[[nodiscard]] Result<std::optional<ImportReport>, CommandError> fetch_from_server(
    IDatabaseGateway* db,
    IHttpTransport& transport,
    const FetchRequest& request,
    const AppConfig& config,
    const std::atomic<bool>* interrupted = nullptr);

void print_import_report(std::ostream& os, const ImportReport& report);

// ============================================================================
// Dispatch
// ============================================================================

// Fold command line overrides into the loaded config
[[nodiscard]] AppConfig apply_cli_overrides(AppConfig config, const CliOptions& options);

/**
 * @brief Run the selected command
 * @return Process exit code
 */
[[nodiscard]] int run_command(const CliOptions& options, const AppConfig& config,
                              const std::atomic<bool>* interrupted = nullptr);

} // namespace sysmlsql
