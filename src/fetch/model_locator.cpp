#include "fetch/model_locator.hpp"
#include "fetch/paginated_fetcher.hpp"
#include "core/utils.hpp"

#include <format>
#include <vector>

namespace sysmlsql {

namespace {

// "@id" of a nested {"@id": ...} member, empty if absent
std::string nested_id(const nlohmann::json& obj, const char* member) {
    if (!obj.is_object()) return {};
    const auto it = obj.find(member);
    if (it == obj.end() || !it->is_object()) return {};
    const auto id = it->find("@id");
    if (id == it->end() || !id->is_string()) return {};
    return id->get<std::string>();
}

std::string string_member(const nlohmann::json& obj, const char* member) {
    if (!obj.is_object()) return {};
    const auto it = obj.find(member);
    if (it == obj.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

std::string describe(const nlohmann::json& entry) {
    return std::format("\"{}\" ({})", string_member(entry, "name"), string_member(entry, "@id"));
}

/**
 * Picks the single entry whose name starts with prefix. An entry named
 * exactly prefix is preferred when several match.
 */
Result<nlohmann::json, FetchError> match_by_name(const nlohmann::json& entries,
                                                 const std::string& prefix,
                                                 const std::string& what,
                                                 const std::string& url) {
    using R = Result<nlohmann::json, FetchError>;

    std::vector<const nlohmann::json*> matches;
    const nlohmann::json* exact = nullptr;
    for (const auto& entry : entries) {
        const auto name = string_member(entry, "name");
        if (!name.starts_with(prefix)) continue;
        matches.push_back(&entry);
        if (name == prefix && exact == nullptr) exact = &entry;
    }

    if (matches.size() == 1) return R::ok(*matches.front());
    if (matches.size() > 1 && exact != nullptr) return R::ok(*exact);

    std::vector<std::string> candidates;
    if (matches.empty()) {
        for (const auto& entry : entries) candidates.push_back(describe(entry));
        return R::error(FetchError{.kind = FetchErrorKind::MODEL_NOT_FOUND, .url = url,
            .detail = std::format("no {} name starts with \"{}\"; available: {}", what, prefix,
                                  candidates.empty() ? "none" : utils::join(candidates, ", "))});
    }
    for (const auto* entry : matches) candidates.push_back(describe(*entry));
    return R::error(FetchError{.kind = FetchErrorKind::AMBIGUOUS_MODEL, .url = url,
        .detail = std::format("{} {}s match \"{}\": {}", matches.size(), what, prefix,
                              utils::join(candidates, ", "))});
}

} // anonymous namespace

Result<ModelRef, FetchError> ModelLocator::locate(const ModelSelector& selector) {
    using R = Result<ModelRef, FetchError>;

    if (selector.project_id.empty() == selector.project_name.empty()) {
        return R::error(FetchError{.kind = FetchErrorKind::INVALID_REQUEST,
            .detail = "exactly one of project id and project name must be given"});
    }
    const int commit_selectors = !selector.commit_id.empty() + !selector.branch_id.empty() +
                                 !selector.branch_name.empty();
    if (commit_selectors > 1) {
        return R::error(FetchError{.kind = FetchErrorKind::INVALID_REQUEST,
            .detail = "commit id, branch id and branch name are mutually exclusive"});
    }

    ModelRef ref;
    nlohmann::json project;

    if (!selector.project_id.empty()) {
        ref.project_id = selector.project_id;
        utils::log::debug(std::format("using project id {}", ref.project_id));
    } else {
        auto found = find_project(selector.project_name);
        if (found.is_error()) return R::error(found.err());
        project = std::move(found.value());
        ref.project_id = string_member(project, "@id");
        utils::log::info(std::format("project \"{}\" resolved to {}", selector.project_name,
                                     ref.project_id));
    }

    if (!selector.commit_id.empty()) {
        ref.commit_id = selector.commit_id;
    } else if (!selector.branch_id.empty()) {
        auto head = branch_head(ref.project_id, selector.branch_id);
        if (head.is_error()) return R::error(head.err());
        ref.commit_id = std::move(head.value());
    } else if (!selector.branch_name.empty()) {
        auto head = named_branch_head(ref.project_id, selector.branch_name);
        if (head.is_error()) return R::error(head.err());
        ref.commit_id = std::move(head.value());
    } else {
        if (project.is_null()) {
            auto fetched = client_.get_json(client_.url_for(std::format("projects/{}", ref.project_id)));
            if (fetched.is_error()) return R::error(fetched.err());
            project = std::move(fetched.value());
        }
        const auto branch_id = nested_id(project, "defaultBranch");
        if (branch_id.empty()) {
            return R::error(FetchError{.kind = FetchErrorKind::MODEL_NOT_FOUND,
                .url = client_.url_for(std::format("projects/{}", ref.project_id)),
                .detail = "project has no default branch"});
        }
        auto head = branch_head(ref.project_id, branch_id);
        if (head.is_error()) return R::error(head.err());
        ref.commit_id = std::move(head.value());
    }

    utils::log::info(std::format("selected commit {} of project {}", ref.commit_id, ref.project_id));
    return R::ok(std::move(ref));
}

Result<nlohmann::json, FetchError> ModelLocator::find_project(const std::string& name_prefix) {
    auto projects = list("projects");
    if (projects.is_error()) return projects;
    return match_by_name(projects.value(), name_prefix, "project", client_.url_for("projects"));
}

Result<std::string, FetchError> ModelLocator::branch_head(const std::string& project_id,
                                                          const std::string& branch_id) {
    using R = Result<std::string, FetchError>;

    const auto url = client_.url_for(std::format("projects/{}/branches/{}", project_id, branch_id));
    auto branch = client_.get_json(url);
    if (branch.is_error()) return R::error(branch.err());

    auto head = nested_id(branch.value(), "head");
    if (head.empty()) {
        return R::error(FetchError{.kind = FetchErrorKind::MODEL_NOT_FOUND, .url = url,
                                   .detail = "branch has no head commit"});
    }
    return R::ok(std::move(head));
}

Result<std::string, FetchError> ModelLocator::named_branch_head(const std::string& project_id,
                                                                const std::string& name_prefix) {
    using R = Result<std::string, FetchError>;

    const auto path = std::format("projects/{}/branches", project_id);
    auto branches = list(path);
    if (branches.is_error()) return R::error(branches.err());

    auto branch = match_by_name(branches.value(), name_prefix, "branch", client_.url_for(path));
    if (branch.is_error()) return R::error(branch.err());

    auto head = nested_id(branch.value(), "head");
    if (head.empty()) {
        return R::error(FetchError{.kind = FetchErrorKind::MODEL_NOT_FOUND, .url = client_.url_for(path),
            .detail = std::format("branch {} has no head commit", describe(branch.value()))});
    }
    return R::ok(std::move(head));
}

Result<nlohmann::json, FetchError> ModelLocator::list(const std::string& path) {
    // Listings are paginated like element collections
    PaginatedFetcher fetcher(client_, PaginatedFetcher::Config{});
    return fetcher.fetch_collection(client_.url_for(path));
}

} // namespace sysmlsql
