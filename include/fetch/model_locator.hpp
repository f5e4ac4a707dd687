#pragma once

#include "core/error.hpp"
#include "fetch/api_client.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace sysmlsql {

/**
 * @brief Which model to fetch, as given on the command line
 *
 * Exactly one of project_id / project_name must be set. At most one of
 * commit_id / branch_id / branch_name may be set; none selects the head of
 * the project's default branch.
 */
struct ModelSelector {
    std::string project_id;
    std::string project_name;   // unique prefix of a project name
    std::string commit_id;
    std::string branch_id;
    std::string branch_name;    // unique prefix of a branch name
};

struct ModelRef {
    std::string project_id;
    std::string commit_id;
};

/**
 * @brief Resolves a ModelSelector to concrete project and commit ids
 *
 * Name lookups match on prefix. An exact name match wins over prefix matches;
 * otherwise exactly one candidate must match.
 */
class ModelLocator {
public:
    explicit ModelLocator(ApiClient& client) : client_(client) {}

    [[nodiscard]] Result<ModelRef, FetchError> locate(const ModelSelector& selector);

private:
    [[nodiscard]] Result<nlohmann::json, FetchError> find_project(const std::string& name_prefix);
    [[nodiscard]] Result<std::string, FetchError> branch_head(const std::string& project_id,
                                                              const std::string& branch_id);
    [[nodiscard]] Result<std::string, FetchError> named_branch_head(const std::string& project_id,
                                                                    const std::string& name_prefix);
    [[nodiscard]] Result<nlohmann::json, FetchError> list(const std::string& path);

    ApiClient& client_;
};

} // namespace sysmlsql
