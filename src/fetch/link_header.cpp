#include "fetch/link_header.hpp"
#include "core/utils.hpp"

namespace sysmlsql {

namespace {

constexpr bool is_ows(char c) {
    return c == ' ' || c == '\t';
}

// token = 1*tchar, minus the delimiters this grammar cares about
constexpr bool is_token_char(char c) {
    return c > ' ' && c < 127 && c != ';' && c != ',' && c != '=' && c != '"' &&
           c != '<' && c != '>';
}

class LinkParser {
public:
    explicit LinkParser(std::string_view input) : s_(input) {}

    std::optional<std::vector<LinkValue>> parse() {
        std::vector<LinkValue> links;
        while (true) {
            skip_ows();
            if (at_end()) break;
            if (s_[pos_] == ',') {
                ++pos_;
                continue;
            }
            auto link = parse_link_value();
            if (!link) return std::nullopt;
            links.push_back(std::move(*link));
        }
        return links;
    }

private:
    std::optional<LinkValue> parse_link_value() {
        if (s_[pos_] != '<') return std::nullopt;
        const auto close = s_.find('>', pos_ + 1);
        if (close == std::string_view::npos) return std::nullopt;

        LinkValue link;
        link.uri = utils::trim(std::string(s_.substr(pos_ + 1, close - pos_ - 1)));
        pos_ = close + 1;

        bool rel_seen = false;
        while (true) {
            skip_ows();
            if (at_end()) break;
            if (s_[pos_] == ',') {
                ++pos_;
                break;
            }
            if (s_[pos_] != ';') return std::nullopt;
            ++pos_;
            skip_ows();
            if (at_end() || s_[pos_] == ',') continue;  // empty parameter

            std::string name = read_token();
            if (name.empty()) return std::nullopt;
            name = utils::to_lower(name);

            std::string value;
            skip_ows();
            if (!at_end() && s_[pos_] == '=') {
                ++pos_;
                skip_ows();
                if (!at_end() && s_[pos_] == '"') {
                    auto quoted = read_quoted();
                    if (!quoted) return std::nullopt;
                    value = std::move(*quoted);
                } else {
                    value = read_token();
                }
            }

            if (name == "rel" && !rel_seen) {
                rel_seen = true;
                for (auto& rel : utils::split(value, ' ')) {
                    if (!rel.empty()) link.rels.push_back(utils::to_lower(rel));
                }
            }
            link.params.emplace_back(std::move(name), std::move(value));
        }
        return link;
    }

    std::string read_token() {
        const auto start = pos_;
        while (!at_end() && is_token_char(s_[pos_])) ++pos_;
        return std::string(s_.substr(start, pos_ - start));
    }

    std::optional<std::string> read_quoted() {
        ++pos_;  // opening quote
        std::string out;
        while (!at_end()) {
            const char c = s_[pos_++];
            if (c == '"') return out;
            if (c == '\\') {
                if (at_end()) return std::nullopt;
                out += s_[pos_++];
            } else {
                out += c;
            }
        }
        return std::nullopt;  // unterminated
    }

    void skip_ows() {
        while (!at_end() && is_ows(s_[pos_])) ++pos_;
    }

    [[nodiscard]] bool at_end() const { return pos_ >= s_.size(); }

    std::string_view s_;
    size_t pos_ = 0;
};

} // anonymous namespace

bool LinkValue::has_rel(std::string_view rel) const {
    const auto wanted = utils::to_lower(std::string(rel));
    for (const auto& r : rels) {
        if (r == wanted) return true;
    }
    return false;
}

std::optional<std::vector<LinkValue>> parse_link_header(std::string_view value) {
    return LinkParser(value).parse();
}

std::optional<std::string> find_link(const std::vector<LinkValue>& links, std::string_view rel) {
    for (const auto& link : links) {
        if (link.has_rel(rel)) return link.uri;
    }
    return std::nullopt;
}

} // namespace sysmlsql
