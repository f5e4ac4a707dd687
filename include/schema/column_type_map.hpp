#pragma once

#include "schema/schema_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sysmlsql {

/**
 * @brief SQL storage types of generated columns
 *
 * ANY is SQLite's untyped column, used for values that are a literal in one
 * element and a reference in another.
 */
enum class ColumnType : uint8_t {
    TEXT,
    INTEGER,
    REAL,
    ANY
};

/**
 * @brief Fixed mapping between field kinds and column types
 */
class ColumnTypeMap {
public:
    /**
     * @brief Column type for a field kind
     * @return Column type, or std::nullopt for kinds that are lowered into
     *         relations instead of columns
     */
    [[nodiscard]] static std::optional<ColumnType> for_field(FieldKind kind);

    /**
     * @brief Keyword used in CREATE TABLE
     */
    [[nodiscard]] static const char* sql_name(ColumnType type);

    /**
     * @brief Map a declared column type (as reported by PRAGMA table_info)
     * back to a ColumnType, following SQLite's affinity rules
     */
    [[nodiscard]] static ColumnType from_declared(std::string_view declared);
};

} // namespace sysmlsql
