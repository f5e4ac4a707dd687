#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <limits>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace sysmlsql {

namespace {

namespace fs = std::filesystem;

constexpr uint32_t kMaxRetries = 100;
constexpr int kMaxIncludeDepth = 10;
constexpr std::string_view kIncludeKey = "include";

// ---- ${NAME} substitution --------------------------------------------------

// Unset variables expand to nothing
std::string substitute_env(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    for (;;) {
        const size_t open = text.find("${", pos);
        if (open == std::string_view::npos) break;
        const size_t close = text.find('}', open + 2);
        if (close == std::string_view::npos) {
            throw std::runtime_error(std::format("Unclosed ${{...}} in \"{}\" at offset {}", text, open));
        }
        out.append(text, pos, open - pos);
        const std::string name(text.substr(open + 2, close - open - 2));
        if (const char* value = std::getenv(name.c_str())) out += value;
        pos = close + 1;
    }
    out.append(text, pos);
    return out;
}

void substitute_env_in(toml::node& node) {
    if (auto* str = node.as_string()) {
        if (str->get().find("${") != std::string::npos) *str = substitute_env(str->get());
    } else if (auto* tbl = node.as_table()) {
        for (auto&& [key, child] : *tbl) substitute_env_in(child);
    } else if (auto* arr = node.as_array()) {
        for (auto& child : *arr) substitute_env_in(child);
    }
}

// ---- include = "file" | ["file", ...] ---------------------------------------

// Keys of `top` win; tables present on both sides are merged key by key
void overlay_onto(toml::table& bottom, const toml::table& top) {
    for (auto&& [key, node] : top) {
        auto* below = bottom.get_as<toml::table>(key.str());
        const auto* above = node.as_table();
        if (below && above) {
            overlay_onto(*below, *above);
        } else {
            bottom.insert_or_assign(key, node);
        }
    }
}

std::vector<std::string> include_targets(const toml::table& root) {
    const auto* node = root.get(kIncludeKey);
    if (!node) return {};
    if (const auto* one = node->as_string()) return {one->get()};

    const auto* many = node->as_array();
    if (!many) throw std::runtime_error("include must be a string or an array of strings");
    std::vector<std::string> targets;
    for (const auto& item : *many) {
        const auto* path = item.as_string();
        if (!path) throw std::runtime_error("include must be a string or an array of strings");
        targets.push_back(path->get());
    }
    return targets;
}

// Replaces a file's include directive by the contents of the files it names
class IncludeResolver {
public:
    explicit IncludeResolver(const fs::path& top_file) {
        seen_.insert(fs::canonical(top_file).string());
    }

    void resolve(toml::table& root, const fs::path& dir, int depth = 0) {
        if (depth > kMaxIncludeDepth) {
            throw std::runtime_error(std::format(
                "Config includes nest deeper than {} levels, possible circular include", kMaxIncludeDepth));
        }
        const auto targets = include_targets(root);
        root.erase(kIncludeKey);

        for (const auto& target : targets) {
            const auto file = fs::canonical(dir / target);
            if (!seen_.insert(file.string()).second) {
                throw std::runtime_error(std::format("Circular config include detected: {}", file.string()));
            }
            utils::log::debug(std::format("including config file {}", file.string()));

            auto base = toml::parse_file(file.string());
            resolve(base, file.parent_path(), depth + 1);
            overlay_onto(base, root);
            root = std::move(base);
        }
    }

private:
    std::unordered_set<std::string> seen_;
};

toml::table parse_config_text(const std::string& content) {
    auto root = toml::parse(content);
    substitute_env_in(root);
    return root;
}

toml::table parse_config_file(const std::string& path) {
    auto root = toml::parse_file(path);
    IncludeResolver(path).resolve(root, fs::path(path).parent_path());
    substitute_env_in(root);
    return root;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

uint32_t toml_u32(const toml::table& tbl, const std::string_view key, uint32_t fallback) {
    const auto v = tbl[key].value<int64_t>();
    if (!v) return fallback;
    if (*v < 0 || *v > std::numeric_limits<uint32_t>::max()) {
        throw std::runtime_error(std::format("{} must be between 0 and {}, got {}",
                                             key, std::numeric_limits<uint32_t>::max(), *v));
    }
    return static_cast<uint32_t>(*v);
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or(cfg.level);
    return cfg;
}

SchemaConventions ConfigLoader::extract_schema(const toml::table& root) {
    SchemaConventions cfg;
    const auto* schema = root["schema"].as_table();
    if (!schema) return cfg;
    const auto& s = *schema;

    cfg.id_field = s["id_field"].value_or(cfg.id_field);
    cfg.type_field = s["type_field"].value_or(cfg.type_field);
    cfg.identity_type = s["identity_type"].value_or(cfg.identity_type);
    cfg.relation_root = s["relation_root"].value_or(cfg.relation_root);
    if (s.contains("polymorphic_fields")) {
        cfg.polymorphic_fields = toml_string_array(s, "polymorphic_fields");
    }
    return cfg;
}

FetchConfig ConfigLoader::extract_fetch(const toml::table& root) {
    FetchConfig cfg;
    const auto* fetch = root["fetch"].as_table();
    if (!fetch) return cfg;
    const auto& f = *fetch;

    cfg.page_size = toml_u32(f, "page_size", cfg.page_size);
    cfg.max_retries = toml_u32(f, "max_retries", cfg.max_retries);
    cfg.retry_backoff_ms = toml_u32(f, "retry_backoff_ms", cfg.retry_backoff_ms);
    cfg.request_timeout_ms = toml_u32(f, "request_timeout_ms", cfg.request_timeout_ms);
    cfg.overall_timeout_ms = toml_u32(f, "overall_timeout_ms", cfg.overall_timeout_ms);
    cfg.allow_invalid_certs = f["allow_invalid_certs"].value_or(false);
    cfg.username = f["username"].value_or(""s);
    cfg.password = f["password"].value_or(""s);
    return cfg;
}

ImportConfig ConfigLoader::extract_import(const toml::table& root) {
    ImportConfig cfg;
    const auto* import = root["import"].as_table();
    if (!import) return cfg;
    const auto& i = *import;

    cfg.vacuum = i["vacuum"].value_or(false);
    cfg.disable_foreign_key_checks = i["disable_foreign_key_checks"].value_or(false);
    cfg.syside_compat = i["syside_compat"].value_or(false);

    if (const auto* aliases = i["relation_aliases"].as_table()) {
        for (const auto& [key, val] : *aliases) {
            const auto* name = val.as_string();
            if (!name) {
                throw std::runtime_error(
                    std::format("import.relation_aliases.{} must be a string", key.str()));
            }
            cfg.relation_aliases.insert_or_assign(std::string(key.str()), name->get());
        }
    }
    return cfg;
}

void ConfigLoader::apply_credential_env(FetchConfig& fetch) {
    if (!fetch.username.empty() || !fetch.password.empty()) return;
    if (const char* user = std::getenv("SYSML_USERNAME")) fetch.username = user;
    if (const char* pass = std::getenv("SYSML_PASSWORD")) fetch.password = pass;
}

AppConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    AppConfig config;
    config.logging = extract_logging(tbl);
    config.schema = extract_schema(tbl);
    config.schema_file = tbl["schema"]["file"].value_or(""s);
    config.fetch = extract_fetch(tbl);
    config.import = extract_import(tbl);
    apply_credential_env(config.fetch);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_config_file(config_path);
        utils::log::debug(std::format("loaded config from {}", config_path));
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_config_text(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_defaults() {
    AppConfig config;
    apply_credential_env(config.fetch);
    return validate_and_return(std::move(config));
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error, got \"{}\"", config.logging.level));
    }

    if (config.schema.id_field.empty()) {
        errors.emplace_back("schema.id_field must not be empty");
    }
    if (config.schema.type_field.empty()) {
        errors.emplace_back("schema.type_field must not be empty");
    }
    if (config.schema.id_field == config.schema.type_field && !config.schema.id_field.empty()) {
        errors.emplace_back("schema.id_field and schema.type_field must differ");
    }

    if (config.fetch.max_retries > kMaxRetries) {
        errors.push_back(std::format("fetch.max_retries must be <= {}, got {}",
                                     kMaxRetries, config.fetch.max_retries));
    }
    if (config.fetch.request_timeout_ms == 0) {
        errors.emplace_back("fetch.request_timeout_ms must be > 0");
    }
    if (!config.fetch.password.empty() && config.fetch.username.empty()) {
        errors.emplace_back("fetch.password is set but fetch.username is not");
    }

    for (const auto& [property, name] : config.import.relation_aliases) {
        if (name.empty()) {
            errors.push_back(std::format("import.relation_aliases.{} must not be empty", property));
        }
    }

    return errors;
}

} // namespace sysmlsql
