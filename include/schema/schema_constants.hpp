#pragma once

#include <string_view>

namespace sysmlsql::table {

inline constexpr std::string_view kElements = "elements";
inline constexpr std::string_view kRelations = "relations";

// Fixed relations columns besides the identifier and type-tag
inline constexpr std::string_view kName     = "name";
inline constexpr std::string_view kOriginId = "origin_id";
inline constexpr std::string_view kTargetId = "target_id";

} // namespace sysmlsql::table
