#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "db/idatabase_gateway.hpp"
#include "importer/element.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace sysmlsql {

struct ImportReport {
    uint64_t elements_written = 0;
    uint64_t relations_written = 0;
    std::vector<ImportError> dangling;                  // skipped relations
    std::set<std::string> unmatched_properties;         // neither a column nor a reference
};

/**
 * @brief Populates the elements and relations tables from an element collection
 *
 * Runs inside a single transaction: all elements are written first, then the
 * relations originating from re-imported elements are dropped, then every
 * embedded reference is written as a relations row. Rows are keyed by their
 * identifiers and replaced on conflict, so importing the same collection
 * twice leaves the database unchanged.
 *
 * A reference whose target is not part of the collection is skipped and
 * reported; any other failure rolls the whole run back.
 */
class Importer {
public:
    /**
     * @param relation_types Type-tags whose instances are relation-like; their
     *        scalar fields are copied into the relations rows they originate
     */
    Importer(IDatabaseGateway& db, ImportConfig config, SchemaConventions conventions = {},
             std::set<std::string> relation_types = {});

    [[nodiscard]] Result<ImportReport, ImportError> run(const std::vector<Element>& elements);

    // Parse, then run()
    [[nodiscard]] Result<ImportReport, ImportError> import_json(const nlohmann::json& document);

    // Read a JSON file, then import_json()
    [[nodiscard]] Result<ImportReport, ImportError> import_file(const std::string& path);

    /**
     * @brief Deterministic relation identifier (name-based UUID, version 5 layout)
     */
    [[nodiscard]] static std::string relation_id(const std::string& origin_id,
                                                 const std::string& name,
                                                 const std::string& target_id);

    /**
     * @brief Column value for a property
     *
     * References map to NULL (they live in the relations table), structured
     * values to their JSON text with sorted keys.
     */
    [[nodiscard]] SqlValue to_sql(const std::string& column, const FieldValue& value) const;

private:
    [[nodiscard]] Result<Done, ImportError> write_elements(const std::vector<Element>& elements,
                                                           ImportReport& report);
    [[nodiscard]] Result<Done, ImportError> drop_stale_relations(const std::vector<Element>& elements);
    [[nodiscard]] Result<Done, ImportError> write_relations(const std::vector<Element>& elements,
                                                            ImportReport& report);

    [[nodiscard]] Result<Done, ImportError> before_bulk_insert();
    // Resets the pragmas of before_bulk_insert()
    [[nodiscard]] Result<Done, ImportError> restore_settings();
    // restore_settings(), then VACUUM and ANALYZE
    [[nodiscard]] Result<Done, ImportError> after_bulk_insert();

    [[nodiscard]] const std::string& relation_name(const std::string& property) const;

    IDatabaseGateway& db_;
    ImportConfig config_;
    SchemaConventions conventions_;
    std::set<std::string> relation_types_;

    std::vector<std::string> element_columns_;
    std::vector<std::string> relation_columns_;
};

} // namespace sysmlsql
