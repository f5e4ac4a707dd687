#include "schema/column_type_map.hpp"
#include "core/utils.hpp"

namespace sysmlsql {

std::optional<ColumnType> ColumnTypeMap::for_field(FieldKind kind) {
    switch (kind) {
        case FieldKind::STRING:         return ColumnType::TEXT;
        case FieldKind::INTEGER:        return ColumnType::INTEGER;
        case FieldKind::NUMBER:         return ColumnType::REAL;
        case FieldKind::BOOLEAN:        return ColumnType::INTEGER;  // 0/1
        case FieldKind::STRUCTURED:     return ColumnType::TEXT;     // canonical JSON
        case FieldKind::POLYMORPHIC:    return ColumnType::ANY;
        case FieldKind::REFERENCE:
        case FieldKind::REFERENCE_LIST: return std::nullopt;
    }
    return std::nullopt;
}

const char* ColumnTypeMap::sql_name(ColumnType type) {
    switch (type) {
        case ColumnType::TEXT:    return "TEXT";
        case ColumnType::INTEGER: return "INTEGER";
        case ColumnType::REAL:    return "REAL";
        case ColumnType::ANY:     return "ANY";
    }
    return "ANY";
}

ColumnType ColumnTypeMap::from_declared(std::string_view declared) {
    const auto lower = utils::to_lower(std::string(declared));
    // Affinity rules, in SQLite's order of precedence
    if (lower.find("int") != std::string::npos) return ColumnType::INTEGER;
    if (lower.find("char") != std::string::npos || lower.find("clob") != std::string::npos ||
        lower.find("text") != std::string::npos) {
        return ColumnType::TEXT;
    }
    if (lower.empty() || lower.find("blob") != std::string::npos || lower == "any") {
        return ColumnType::ANY;
    }
    if (lower.find("real") != std::string::npos || lower.find("floa") != std::string::npos ||
        lower.find("doub") != std::string::npos) {
        return ColumnType::REAL;
    }
    // NUMERIC affinity
    return ColumnType::REAL;
}

} // namespace sysmlsql
