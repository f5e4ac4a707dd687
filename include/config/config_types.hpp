#pragma once

#include "schema/schema_types.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace sysmlsql {

// ============================================================================
// Configuration Types
// ============================================================================

struct LoggingConfig {
    std::string level = "info";     // debug | info | warn | error
};

struct FetchConfig {
    uint32_t page_size = 0;                 // 0 = server default
    uint32_t max_retries = 3;
    uint32_t retry_backoff_ms = 500;        // doubled after every retry
    uint32_t request_timeout_ms = 30000;
    uint32_t overall_timeout_ms = 0;        // 0 = unlimited
    bool allow_invalid_certs = false;
    std::string username;                   // empty = no basic auth
    std::string password;
};

struct ImportConfig {
    bool vacuum = false;
    bool disable_foreign_key_checks = false;
    bool syside_compat = false;             // accept "true"/"false" strings for is* columns
    // JSON property -> relation name; [import.relation_aliases] entries add to or replace these
    std::map<std::string, std::string> relation_aliases = {
        {"definedBy", "definition"},
        {"ownedBy", "owner"},
    };
};

struct AppConfig {
    LoggingConfig logging;
    SchemaConventions schema;
    std::string schema_file;                // [schema] file; empty = bundled schema
    FetchConfig fetch;
    ImportConfig import;
};

} // namespace sysmlsql
