#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace sysmlsql {

/**
 * @brief Absolute http(s) URL split into origin and request target
 */
struct Url {
    std::string scheme;     // "http" | "https", lowercase
    std::string host;       // IPv6 literals keep their brackets
    int port = 0;           // 0 = scheme default
    std::string target;     // path plus optional query, always starts with '/'

    // scheme://host[:port]
    [[nodiscard]] std::string origin() const;

    [[nodiscard]] std::string str() const { return origin() + target; }

    [[nodiscard]] std::string path() const;
};

/**
 * @brief Parse an absolute http(s) URL; fragments are dropped
 */
[[nodiscard]] std::optional<Url> parse_url(std::string_view text);

/**
 * @brief Resolve a URI reference against a base URL (RFC 3986 section 5.2)
 * @return The absolute URL, or std::nullopt if the result is not http(s)
 */
[[nodiscard]] std::optional<Url> resolve_url(const Url& base, std::string_view reference);

} // namespace sysmlsql
