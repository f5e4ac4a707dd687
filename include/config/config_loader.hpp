#pragma once

#include "config/config_types.hpp"

#include <toml.hpp>

#include <string>
#include <vector>

namespace sysmlsql {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads sysml-sql.toml
 *
 * Every section and key is optional. String values may reference
 * environment variables as ${NAME}; a top-level `include` (string or array
 * of strings) merges other files underneath the including one.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file
     * @param config_path Path to the .toml file
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML text
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Config with defaults only, plus credentials from the environment
     */
    [[nodiscard]] static LoadResult load_defaults();

    // Empty if valid
    [[nodiscard]] static std::vector<std::string> validate_config(const AppConfig& config);

private:
    static LoggingConfig extract_logging(const toml::table& root);
    static SchemaConventions extract_schema(const toml::table& root);
    static FetchConfig extract_fetch(const toml::table& root);
    static ImportConfig extract_import(const toml::table& root);
    static AppConfig extract_all_sections(const toml::table& root);

    // SYSML_USERNAME / SYSML_PASSWORD when the file sets no credentials
    static void apply_credential_env(FetchConfig& fetch);

    static LoadResult validate_and_return(AppConfig config);
};

} // namespace sysmlsql
