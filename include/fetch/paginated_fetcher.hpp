#pragma once

#include "core/error.hpp"
#include "fetch/api_client.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <future>
#include <string>

namespace sysmlsql {

struct FetchStats {
    uint64_t pages = 0;
    uint64_t elements = 0;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Retrieves a model's complete element collection page by page
 *
 * Pages are requested strictly one after another: the URL of page n+1 is
 * only known from the Link header of page n. Records are appended in page
 * order. Either the whole collection is returned or an error; raw pages
 * can be persisted as they arrive for callers that need partial progress.
 */
class PaginatedFetcher {
public:
    struct Config {
        uint32_t page_size = 0;         // 0 = server default
        std::string dump_pages_dir;     // empty = no page dumps
    };

    PaginatedFetcher(ApiClient& client, Config config);

    /**
     * @brief Elements endpoint of one commit of one project
     */
    [[nodiscard]] static std::string elements_path(const std::string& project_id,
                                                   const std::string& commit_id,
                                                   uint32_t page_size);

    /**
     * @brief Fetch every element of a commit
     *
     * Arms the client's overall timeout unless the caller already did, so a
     * deadline started before locating the model also bounds the fetch.
     *
     * @return JSON array of raw element records, in page order
     */
    [[nodiscard]] Result<nlohmann::json, FetchError> fetch(const std::string& project_id,
                                                           const std::string& commit_id);

    /**
     * @brief Follow the pagination chain starting at an absolute URL
     * @param dump_pages Write each raw page to the dump directory
     */
    [[nodiscard]] Result<nlohmann::json, FetchError> fetch_collection(const std::string& first_url,
                                                                      bool dump_pages = false);

    /**
     * @brief Run fetch() on a worker thread
     *
     * The fetcher and its ApiClient must outlive the future.
     */
    [[nodiscard]] std::future<Result<nlohmann::json, FetchError>> fetch_async(
        std::string project_id, std::string commit_id);

    void cancel() { client_.cancel(); }

    [[nodiscard]] const FetchStats& last_stats() const { return stats_; }

    /**
     * @brief Write a fetched collection to a file
     * @param pretty Indent with two spaces
     */
    [[nodiscard]] static Result<Done, FetchError> dump_collection(const nlohmann::json& collection,
                                                                  const std::string& path,
                                                                  bool pretty);

private:
    [[nodiscard]] Result<Done, FetchError> dump_page(uint64_t page_number, const std::string& body) const;

    ApiClient& client_;
    Config config_;
    FetchStats stats_;
};

} // namespace sysmlsql
