#include "importer/importer.hpp"
#include "schema/schema_constants.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>

#include <array>
#include <cctype>
#include <format>
#include <fstream>
#include <type_traits>
#include <unordered_set>
#include <variant>

namespace sysmlsql {

namespace {

// Fixed namespace for relation identifiers
constexpr std::array<unsigned char, 16> kRelationNamespace = {
    0x3c, 0x5e, 0x0f, 0x41, 0x8b, 0x7a, 0x4d, 0x52,
    0x9e, 0x61, 0x2f, 0xa4, 0xc3, 0x17, 0xd8, 0x90
};

// 256 MiB page cache during bulk inserts (negative = KiB)
constexpr const char* kBulkCacheSize = "-262144";

ImportError db_failure(const DbError& e) {
    return ImportError{.kind = ImportErrorKind::DATABASE_ERROR, .detail = e.message()};
}

// isAbstract, isComposite, ... hold booleans
bool is_boolean_column(const std::string& name) {
    return name.size() > 2 && name.starts_with("is") &&
           std::isupper(static_cast<unsigned char>(name[2]));
}

bool is_empty_list(const FieldValue& value) {
    const auto* s = std::get_if<StructuredValue>(&value);
    return s && s->json.is_array() && s->json.empty();
}

std::vector<std::string> column_names(const std::vector<ColumnInfo>& columns) {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& c : columns) names.push_back(c.name);
    return names;
}

} // anonymous namespace

Importer::Importer(IDatabaseGateway& db, ImportConfig config, SchemaConventions conventions,
                   std::set<std::string> relation_types)
    : db_(db),
      config_(std::move(config)),
      conventions_(std::move(conventions)),
      relation_types_(std::move(relation_types)) {}

// ============================================================================
// Relation identifiers
// ============================================================================

std::string Importer::relation_id(const std::string& origin_id,
                                  const std::string& name,
                                  const std::string& target_id) {
    std::string input(kRelationNamespace.begin(), kRelationNamespace.end());
    input += origin_id;
    input += '\0';
    input += name;
    input += '\0';
    input += target_id;

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    EVP_Digest(input.data(), input.size(), hash, &hash_len, EVP_sha1(), nullptr);

    hash[6] = static_cast<unsigned char>((hash[6] & 0x0f) | 0x50);  // version 5
    hash[8] = static_cast<unsigned char>((hash[8] & 0x3f) | 0x80);  // RFC 4122 variant

    std::string out;
    out.reserve(36);
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
        out += std::format("{:02x}", hash[i]);
    }
    return out;
}

// ============================================================================
// Value projection
// ============================================================================

SqlValue Importer::to_sql(const std::string& column, const FieldValue& value) const {
    return std::visit([&](const auto& v) -> SqlValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return std::monostate{};
        } else if constexpr (std::is_same_v<T, bool>) {
            return static_cast<int64_t>(v ? 1 : 0);
        } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double>) {
            return v;
        } else if constexpr (std::is_same_v<T, std::string>) {
            if (config_.syside_compat && is_boolean_column(column)) {
                if (v == "true") return static_cast<int64_t>(1);
                if (v == "false") return static_cast<int64_t>(0);
            }
            return v;
        } else if constexpr (std::is_same_v<T, StructuredValue>) {
            return v.json.dump();
        } else {
            return std::monostate{};
        }
    }, value);
}

const std::string& Importer::relation_name(const std::string& property) const {
    const auto it = config_.relation_aliases.find(property);
    return it == config_.relation_aliases.end() ? property : it->second;
}

// ============================================================================
// Import run
// ============================================================================

Result<ImportReport, ImportError> Importer::import_file(const std::string& path) {
    using R = Result<ImportReport, ImportError>;

    utils::log::info(std::format("reading elements from {}", path));
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return R::error(ImportError{.kind = ImportErrorKind::IO_ERROR,
                                    .detail = std::format("cannot open {}", path)});
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        return R::error(ImportError{.kind = ImportErrorKind::IO_ERROR,
                                    .detail = std::format("{} is not valid JSON: {}", path, e.what())});
    }
    return import_json(document);
}

Result<ImportReport, ImportError> Importer::import_json(const nlohmann::json& document) {
    auto elements = parse_elements(document, conventions_.id_field, conventions_.type_field);
    if (elements.is_error()) return Result<ImportReport, ImportError>::error(elements.err());
    return run(elements.value());
}

Result<ImportReport, ImportError> Importer::run(const std::vector<Element>& elements) {
    using R = Result<ImportReport, ImportError>;

    const utils::Timer timer;

    auto elem_cols = db_.table_columns(std::string(table::kElements));
    if (elem_cols.is_error()) return R::error(db_failure(elem_cols.err()));
    auto rel_cols = db_.table_columns(std::string(table::kRelations));
    if (rel_cols.is_error()) return R::error(db_failure(rel_cols.err()));
    if (elem_cols.value().empty() || rel_cols.value().empty()) {
        return R::error(ImportError{.kind = ImportErrorKind::DATABASE_ERROR,
            .detail = "the elements and relations tables do not exist, initialise the database first"});
    }
    element_columns_ = column_names(elem_cols.value());
    relation_columns_ = column_names(rel_cols.value());
    utils::log::debug(std::format("elements table has {} columns, relations table {}",
                                  element_columns_.size(), relation_columns_.size()));

    // Settings are restored on every path once they may have been changed
    auto fail = [this](ImportError err, bool in_transaction) {
        if (in_transaction) {
            utils::log::error(std::format("import failed, rolling back: {}", err.message()));
            auto rolled_back = db_.rollback();
            if (rolled_back.is_error()) {
                utils::log::error(std::format("rollback failed: {}", rolled_back.error_message()));
            }
        } else {
            utils::log::error(std::format("import failed: {}", err.message()));
        }
        auto restored = restore_settings();
        if (restored.is_error()) {
            utils::log::warn(std::format("could not reset database tweaks: {}", restored.error_message()));
        }
        return R::error(std::move(err));
    };

    auto tweaked = before_bulk_insert();
    if (tweaked.is_error()) return fail(tweaked.err(), false);

    auto began = db_.begin_transaction();
    if (began.is_error()) return fail(db_failure(began.err()), false);

    ImportReport report;
    auto written = write_elements(elements, report);
    if (written.is_ok()) written = drop_stale_relations(elements);
    if (written.is_ok()) written = write_relations(elements, report);
    if (written.is_error()) return fail(written.err(), true);

    utils::log::info("committing import");
    auto committed = db_.commit();
    if (committed.is_error()) return fail(db_failure(committed.err()), true);

    auto restored = after_bulk_insert();
    if (restored.is_error()) return R::error(restored.err());

    for (const auto& d : report.dangling) {
        utils::log::warn(d.message());
    }
    if (!report.unmatched_properties.empty()) {
        utils::log::warn(std::format("the following properties matched neither a column nor a reference: {}",
            utils::join(std::vector<std::string>(report.unmatched_properties.begin(),
                                                 report.unmatched_properties.end()), ", ")));
    }
    utils::log::info(std::format("imported {} elements and {} relations ({} dangling) in {}",
        report.elements_written, report.relations_written, report.dangling.size(),
        utils::format_duration(timer.elapsed())));
    return R::ok(std::move(report));
}

Result<Done, ImportError> Importer::write_elements(const std::vector<Element>& elements,
                                                   ImportReport& report) {
    using R = Result<Done, ImportError>;

    const std::unordered_set<std::string> known(element_columns_.begin(), element_columns_.end());
    const std::unordered_set<std::string> relation_known(relation_columns_.begin(), relation_columns_.end());
    const std::string elements_table(table::kElements);
    utils::ProgressReporter progress("element");
    std::vector<SqlValue> row;

    utils::log::info(std::format("inserting {} elements", elements.size()));
    for (const auto& element : elements) {
        row.clear();
        row.reserve(element_columns_.size());
        for (const auto& column : element_columns_) {
            if (column == conventions_.id_field) {
                row.emplace_back(element.id);
            } else if (column == conventions_.type_field) {
                row.emplace_back(element.type);
            } else if (const auto* value = element.find(column)) {
                row.push_back(to_sql(column, *value));
            } else {
                row.emplace_back(std::monostate{});
            }
        }

        const bool relation_like = relation_types_.contains(element.type);
        for (const auto& [name, value] : element.properties) {
            if (known.contains(name) || holds_reference(value)) continue;
            if (relation_like && relation_known.contains(name)) continue;
            if (std::holds_alternative<std::monostate>(value) || is_empty_list(value)) continue;
            report.unmatched_properties.insert(name);
        }

        auto res = db_.upsert(elements_table, element_columns_, row);
        if (res.is_error()) {
            auto err = db_failure(res.err());
            err.element_id = element.id;
            return R::error(std::move(err));
        }
        progress.tick(++report.elements_written);
    }
    progress.finish(report.elements_written);
    return R::ok(Done{});
}

Result<Done, ImportError> Importer::drop_stale_relations(const std::vector<Element>& elements) {
    const std::string relations_table(table::kRelations);
    const std::string origin_column(table::kOriginId);
    uint64_t dropped = 0;

    for (const auto& element : elements) {
        auto res = db_.delete_where(relations_table, origin_column, SqlValue{element.id});
        if (res.is_error()) return Result<Done, ImportError>::error(db_failure(res.err()));
        dropped += res.value();
    }
    if (dropped > 0) {
        utils::log::debug(std::format("dropped {} relations of re-imported elements", dropped));
    }
    return Result<Done, ImportError>::ok(Done{});
}

Result<Done, ImportError> Importer::write_relations(const std::vector<Element>& elements,
                                                    ImportReport& report) {
    using R = Result<Done, ImportError>;

    std::unordered_set<std::string> ids;
    ids.reserve(elements.size());
    for (const auto& e : elements) ids.insert(e.id);

    const std::string relations_table(table::kRelations);
    std::unordered_set<std::string> seen;
    utils::ProgressReporter progress("relation");
    std::vector<SqlValue> row;

    utils::log::info("inserting relations");
    for (const auto& element : elements) {
        const bool relation_like = relation_types_.contains(element.type);

        for (const auto& [property, value] : element.properties) {
            std::vector<const Reference*> targets;
            if (const auto* ref = std::get_if<Reference>(&value)) {
                targets.push_back(ref);
            } else if (const auto* refs = std::get_if<ReferenceList>(&value)) {
                for (const auto& r : *refs) targets.push_back(&r);
            } else {
                continue;
            }

            const auto& name = relation_name(property);
            for (const auto* target : targets) {
                auto id = relation_id(element.id, name, target->id);
                if (!seen.insert(id).second) continue;

                if (!ids.contains(target->id)) {
                    report.dangling.push_back(ImportError{
                        .kind = ImportErrorKind::DANGLING_REFERENCE, .relation_id = id,
                        .origin_id = element.id, .relation_name = name, .target_id = target->id});
                    continue;
                }

                row.clear();
                row.reserve(relation_columns_.size());
                for (const auto& column : relation_columns_) {
                    if (column == conventions_.id_field) {
                        row.emplace_back(id);
                    } else if (column == conventions_.type_field) {
                        row.emplace_back(element.type);
                    } else if (column == table::kName) {
                        row.emplace_back(name);
                    } else if (column == table::kOriginId) {
                        row.emplace_back(element.id);
                    } else if (column == table::kTargetId) {
                        row.emplace_back(target->id);
                    } else if (const auto* v = relation_like ? element.find(column) : nullptr) {
                        row.push_back(to_sql(column, *v));
                    } else {
                        row.emplace_back(std::monostate{});
                    }
                }

                auto res = db_.upsert(relations_table, relation_columns_, row);
                if (res.is_error()) {
                    auto err = db_failure(res.err());
                    err.relation_id = id;
                    err.origin_id = element.id;
                    err.relation_name = name;
                    err.target_id = target->id;
                    return R::error(std::move(err));
                }
                progress.tick(++report.relations_written);
            }
        }
    }
    progress.finish(report.relations_written);
    return R::ok(Done{});
}

// ============================================================================
// Bulk insert tweaks
// ============================================================================

Result<Done, ImportError> Importer::before_bulk_insert() {
    using R = Result<Done, ImportError>;

    utils::log::debug("applying bulk insert tweaks");
    auto res = db_.set_pragma("cache_size", kBulkCacheSize);
    if (res.is_ok()) res = db_.set_pragma("synchronous", "OFF");
    if (res.is_ok() && config_.disable_foreign_key_checks) {
        utils::log::warn("foreign key checks are disabled for this import");
        res = db_.set_pragma("foreign_keys", "OFF");
    }
    if (res.is_error()) return R::error(db_failure(res.err()));
    return R::ok(Done{});
}

Result<Done, ImportError> Importer::restore_settings() {
    utils::log::debug("resetting bulk insert tweaks");
    auto res = db_.set_pragma("synchronous", "NORMAL");
    if (res.is_ok() && config_.disable_foreign_key_checks) {
        res = db_.set_pragma("foreign_keys", "ON");
    }
    if (res.is_error()) return Result<Done, ImportError>::error(db_failure(res.err()));
    return Result<Done, ImportError>::ok(Done{});
}

Result<Done, ImportError> Importer::after_bulk_insert() {
    using R = Result<Done, ImportError>;

    auto restored = restore_settings();
    if (restored.is_error()) return restored;

    std::vector<std::string> ops;
    if (config_.vacuum) ops.emplace_back("VACUUM");
    ops.emplace_back("ANALYZE");
    for (const auto& op : ops) {
        const utils::Timer timer;
        auto done = db_.execute(op);
        if (done.is_error()) return R::error(db_failure(done.err()));
        utils::log::info(std::format("{} took {}", op, utils::format_duration(timer.elapsed())));
    }
    return R::ok(Done{});
}

} // namespace sysmlsql
