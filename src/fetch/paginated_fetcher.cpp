#include "fetch/paginated_fetcher.hpp"
#include "fetch/link_header.hpp"
#include "fetch/url.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <unordered_set>

namespace sysmlsql {

namespace {

FetchError pagination_error(const std::string& url, std::string detail) {
    return FetchError{.kind = FetchErrorKind::MALFORMED_PAGINATION, .url = url,
                      .attempts = 1, .detail = std::move(detail)};
}

FetchError page_error(const std::string& url, std::string detail) {
    return FetchError{.kind = FetchErrorKind::MALFORMED_PAGE, .url = url,
                      .attempts = 1, .detail = std::move(detail)};
}

Result<Done, FetchError> write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<Done, FetchError>::error(FetchError{.kind = FetchErrorKind::IO_ERROR,
            .detail = std::format("cannot open {} for writing", path.string())});
    }
    out << content;
    out.flush();
    if (!out) {
        return Result<Done, FetchError>::error(FetchError{.kind = FetchErrorKind::IO_ERROR,
            .detail = std::format("cannot write {}", path.string())});
    }
    return Result<Done, FetchError>::ok(Done{});
}

} // anonymous namespace

PaginatedFetcher::PaginatedFetcher(ApiClient& client, Config config)
    : client_(client), config_(std::move(config)) {}

std::string PaginatedFetcher::elements_path(const std::string& project_id,
                                            const std::string& commit_id,
                                            uint32_t page_size) {
    auto path = std::format("projects/{}/commits/{}/elements", project_id, commit_id);
    if (page_size > 0) path += std::format("?page[size]={}", page_size);
    return path;
}

Result<nlohmann::json, FetchError> PaginatedFetcher::fetch(const std::string& project_id,
                                                           const std::string& commit_id) {
    if (!client_.deadline_armed()) client_.start_operation();
    const auto url = client_.url_for(elements_path(project_id, commit_id, config_.page_size));
    utils::log::info(std::format("fetching elements of project {} at commit {}", project_id, commit_id));
    return fetch_collection(url, !config_.dump_pages_dir.empty());
}

std::future<Result<nlohmann::json, FetchError>> PaginatedFetcher::fetch_async(
    std::string project_id, std::string commit_id) {
    return std::async(std::launch::async,
        [this, project = std::move(project_id), commit = std::move(commit_id)] {
            return fetch(project, commit);
        });
}

Result<nlohmann::json, FetchError> PaginatedFetcher::fetch_collection(const std::string& first_url,
                                                                      bool dump_pages) {
    using R = Result<nlohmann::json, FetchError>;

    stats_ = FetchStats{};
    const utils::Timer timer;

    auto current = parse_url(first_url);
    if (!current) {
        return R::error(FetchError{.kind = FetchErrorKind::INVALID_REQUEST, .url = first_url,
                                   .detail = "not an absolute http(s) URL"});
    }

    auto collection = nlohmann::json::array();
    std::unordered_set<std::string> visited{current->str()};
    utils::ProgressReporter progress("element");

    while (true) {
        const auto url = current->str();
        auto res = client_.get(url);
        if (res.is_error()) return R::error(res.err());
        const auto& resp = res.value();

        ++stats_.pages;
        if (dump_pages) {
            auto dumped = dump_page(stats_.pages, resp.body);
            if (dumped.is_error()) return R::error(dumped.err());
        }

        nlohmann::json page;
        try {
            page = nlohmann::json::parse(resp.body);
        } catch (const nlohmann::json::parse_error& e) {
            return R::error(page_error(url, e.what()));
        }
        if (!page.is_array()) {
            return R::error(page_error(url, std::format("expected a JSON array, got {}", page.type_name())));
        }
        if (page.empty()) {
            utils::log::warn(std::format("page {} ({}) is empty, ending pagination", stats_.pages, url));
            break;
        }

        for (auto& record : page) {
            collection.push_back(std::move(record));
        }
        stats_.elements = collection.size();
        progress.tick(stats_.elements);

        const auto link = resp.header("Link");
        if (!link) break;

        const auto links = parse_link_header(*link);
        if (!links) {
            return R::error(pagination_error(url, std::format("unparsable Link header: {}", *link)));
        }
        const auto next = find_link(*links, "next");
        if (!next) break;

        auto next_url = resolve_url(*current, *next);
        if (!next_url) {
            return R::error(pagination_error(url, std::format("next link {} is not an http(s) URL", *next)));
        }
        if (!visited.insert(next_url->str()).second) {
            return R::error(pagination_error(url,
                std::format("next link {} points at an already fetched page", next_url->str())));
        }
        utils::log::debug(std::format("next page: {}", next_url->str()));
        current = std::move(next_url);
    }

    stats_.elapsed = timer.elapsed_ms();
    progress.finish(stats_.elements);
    utils::log::info(std::format("fetched {} elements spread over {} pages in {}",
        stats_.elements, stats_.pages, utils::format_duration(timer.elapsed())));
    return R::ok(std::move(collection));
}

Result<Done, FetchError> PaginatedFetcher::dump_page(uint64_t page_number, const std::string& body) const {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::create_directories(config_.dump_pages_dir, ec);
    if (ec) {
        return Result<Done, FetchError>::error(FetchError{.kind = FetchErrorKind::IO_ERROR,
            .detail = std::format("cannot create {}: {}", config_.dump_pages_dir, ec.message())});
    }
    return write_file(fs::path(config_.dump_pages_dir) / std::format("page-{:05d}.json", page_number), body);
}

Result<Done, FetchError> PaginatedFetcher::dump_collection(const nlohmann::json& collection,
                                                           const std::string& path,
                                                           bool pretty) {
    utils::log::info(std::format("writing {} fetched elements to {}", collection.size(), path));
    return write_file(path, pretty ? collection.dump(2) : collection.dump());
}

} // namespace sysmlsql
