#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sysmlsql {

/**
 * @brief One link-value of an RFC 8288 Link header
 */
struct LinkValue {
    std::string uri;                                        // as written, may be relative
    std::vector<std::string> rels;                          // lowercase relation types
    std::vector<std::pair<std::string, std::string>> params; // lowercase name, unquoted value

    [[nodiscard]] bool has_rel(std::string_view rel) const;
};

/**
 * @brief Parse a Link header field value
 *
 * Accepts comma separated `<uri>; name=value; name="quoted"` entries.
 * Commas inside `<...>` and quoted strings do not split entries. The first
 * `rel` parameter of an entry wins and may carry several space separated
 * relation types.
 *
 * @return Parsed entries, or std::nullopt if the value is not a Link header
 */
[[nodiscard]] std::optional<std::vector<LinkValue>> parse_link_header(std::string_view value);

// URI of the first entry with the given relation type
[[nodiscard]] std::optional<std::string> find_link(const std::vector<LinkValue>& links,
                                                   std::string_view rel);

} // namespace sysmlsql
