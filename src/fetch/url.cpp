#include "fetch/url.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>
#include <vector>

namespace sysmlsql {

namespace {

int default_port(const std::string& scheme) {
    return scheme == "https" ? 443 : 80;
}

std::string_view strip_fragment(std::string_view s) {
    const auto hash = s.find('#');
    return hash == std::string_view::npos ? s : s.substr(0, hash);
}

bool has_scheme(std::string_view ref) {
    if (ref.empty() || !std::isalpha(static_cast<unsigned char>(ref.front()))) return false;
    for (const char c : ref) {
        if (c == ':') return true;
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return false;
}

std::string remove_dot_segments(std::string_view path) {
    std::vector<std::string_view> segments;
    bool trailing_slash = false;

    size_t pos = path.starts_with('/') ? 1 : 0;
    while (pos <= path.size()) {
        const auto next = path.find('/', pos);
        const auto seg = path.substr(pos, next == std::string_view::npos ? std::string_view::npos : next - pos);

        if (seg == ".") {
            trailing_slash = true;
        } else if (seg == "..") {
            if (!segments.empty()) segments.pop_back();
            trailing_slash = true;
        } else {
            segments.push_back(seg);
            trailing_slash = false;
        }

        if (next == std::string_view::npos) break;
        pos = next + 1;
    }

    std::string out;
    for (const auto seg : segments) {
        out += '/';
        out += seg;
    }
    if (trailing_slash || out.empty()) out += '/';
    return out;
}

} // anonymous namespace

std::string Url::origin() const {
    if (port == 0 || port == default_port(scheme)) {
        return std::format("{}://{}", scheme, host);
    }
    return std::format("{}://{}:{}", scheme, host, port);
}

std::string Url::path() const {
    const auto q = target.find('?');
    return q == std::string::npos ? target : target.substr(0, q);
}

std::optional<Url> parse_url(std::string_view text) {
    const std::string trimmed = utils::trim(std::string(text));
    text = strip_fragment(trimmed);

    const auto sep = text.find("://");
    if (sep == std::string_view::npos) return std::nullopt;

    Url url;
    url.scheme = utils::to_lower(std::string(text.substr(0, sep)));
    if (url.scheme != "http" && url.scheme != "https") return std::nullopt;

    const auto rest = text.substr(sep + 3);
    const auto auth_end = rest.find_first_of("/?");
    auto authority = rest.substr(0, auth_end);
    url.target = auth_end == std::string_view::npos ? "/" : std::string(rest.substr(auth_end));
    if (url.target.front() == '?') url.target.insert(0, "/");

    // userinfo is never kept; credentials travel separately
    if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }
    if (authority.empty()) return std::nullopt;

    std::string_view port_str;
    if (authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string_view::npos) return std::nullopt;
        url.host = std::string(authority.substr(0, close + 1));
        const auto tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') return std::nullopt;
            port_str = tail.substr(1);
        }
    } else if (const auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        url.host = std::string(authority.substr(0, colon));
        port_str = authority.substr(colon + 1);
    } else {
        url.host = std::string(authority);
    }
    if (url.host.empty()) return std::nullopt;
    url.host = utils::to_lower(url.host);

    if (!port_str.empty()) {
        const auto port = utils::try_parse_int<int>(port_str);
        if (!port || *port < 1 || *port > 65535) return std::nullopt;
        url.port = *port == default_port(url.scheme) ? 0 : *port;
    }
    return url;
}

std::optional<Url> resolve_url(const Url& base, std::string_view reference) {
    const auto ref = strip_fragment(reference);

    if (ref.empty()) return base;
    if (has_scheme(ref)) return parse_url(ref);
    if (ref.starts_with("//")) return parse_url(std::format("{}:{}", base.scheme, ref));

    const auto q = ref.find('?');
    const auto ref_path = ref.substr(0, q);
    const auto ref_query = q == std::string_view::npos ? std::string_view{} : ref.substr(q);

    Url out = base;
    if (ref_path.empty()) {
        out.target = base.path() + std::string(ref_query);
    } else if (ref_path.starts_with('/')) {
        out.target = remove_dot_segments(ref_path) + std::string(ref_query);
    } else {
        const auto base_path = base.path();
        const auto dir = base_path.substr(0, base_path.rfind('/') + 1);
        out.target = remove_dot_segments(dir + std::string(ref_path)) + std::string(ref_query);
    }
    return out;
}

} // namespace sysmlsql
