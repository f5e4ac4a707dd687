#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "fetch/http_transport.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>

namespace sysmlsql {

/**
 * @brief GET requests against a model API, with retries and deadlines
 *
 * Every request carries the configured basic-auth credentials and TLS
 * policy. Network errors, per-request timeouts, HTTP 5xx and HTTP 429 are
 * retried with exponential backoff; anything else fails at once. An overall
 * deadline, armed by start_operation(), bounds requests and backoff sleeps
 * together.
 *
 * cancel() may be called from any thread; the pending request, or the next
 * one, fails with FetchErrorKind::CANCELLED.
 */
class ApiClient {
public:
    ApiClient(std::string base_url, FetchConfig config, IHttpTransport& transport);

    /**
     * @brief Absolute URL of a path below the base URL
     * @param path e.g. "projects/123/branches" (leading '/' optional)
     */
    [[nodiscard]] std::string url_for(std::string_view path) const;

    [[nodiscard]] Result<HttpResponse, FetchError> get(const std::string& url);

    /**
     * @brief GET and parse the body as JSON
     * @return MALFORMED_PAGE if the body is not JSON
     */
    [[nodiscard]] Result<nlohmann::json, FetchError> get_json(const std::string& url);

    // Arms, or re-arms, the overall timeout; a no-op when none is configured
    void start_operation();
    [[nodiscard]] bool deadline_armed() const { return deadline_.has_value(); }

    void cancel();
    [[nodiscard]] bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    [[nodiscard]] const std::string& base_url() const { return base_url_; }
    [[nodiscard]] const FetchConfig& config() const { return config_; }

private:
    // Sleeps for delay or until cancelled; false if interrupted by cancel()
    bool wait_backoff(std::chrono::milliseconds delay);

    [[nodiscard]] std::optional<std::chrono::milliseconds> remaining() const;

    std::string base_url_;
    FetchConfig config_;
    IHttpTransport& transport_;

    std::optional<std::chrono::steady_clock::time_point> deadline_;

    std::atomic<bool> cancelled_{false};
    std::mutex cancel_mutex_;
    std::condition_variable cancel_cv_;
};

} // namespace sysmlsql
