#include "fetch/api_client.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace sysmlsql {

namespace {

constexpr std::chrono::milliseconds kMaxBackoff{30000};
constexpr size_t kBodySnippetLength = 200;

std::string body_snippet(const std::string& body) {
    if (body.size() <= kBodySnippetLength) return body;
    return body.substr(0, kBodySnippetLength) + "...";
}

std::chrono::milliseconds backoff_delay(uint32_t base_ms, uint32_t attempt) {
    std::chrono::milliseconds delay{base_ms};
    for (uint32_t i = 1; i < attempt && delay < kMaxBackoff; ++i) {
        delay *= 2;
    }
    return std::min(delay, kMaxBackoff);
}

} // anonymous namespace

ApiClient::ApiClient(std::string base_url, FetchConfig config, IHttpTransport& transport)
    : base_url_(std::move(base_url)), config_(std::move(config)), transport_(transport) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::string ApiClient::url_for(std::string_view path) const {
    while (path.starts_with('/')) path.remove_prefix(1);
    return std::format("{}/{}", base_url_, path);
}

void ApiClient::start_operation() {
    if (config_.overall_timeout_ms == 0) {
        deadline_.reset();
        return;
    }
    deadline_ = std::chrono::steady_clock::now() +
                std::chrono::milliseconds(config_.overall_timeout_ms);
}

void ApiClient::cancel() {
    {
        std::lock_guard<std::mutex> lock(cancel_mutex_);
        cancelled_.store(true, std::memory_order_release);
    }
    cancel_cv_.notify_all();
    utils::log::info("fetch cancellation requested");
}

bool ApiClient::wait_backoff(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(cancel_mutex_);
    return !cancel_cv_.wait_for(lock, delay, [this] { return is_cancelled(); });
}

std::optional<std::chrono::milliseconds> ApiClient::remaining() const {
    if (!deadline_) return std::nullopt;
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        *deadline_ - std::chrono::steady_clock::now());
    return std::max(left, std::chrono::milliseconds{0});
}

Result<HttpResponse, FetchError> ApiClient::get(const std::string& url) {
    using R = Result<HttpResponse, FetchError>;

    HttpRequest req;
    req.url = url;
    req.verify_tls = !config_.allow_invalid_certs;
    req.headers.emplace_back("Accept", "application/json");
    if (!config_.username.empty()) {
        req.credentials = BasicCredentials{config_.username, config_.password};
    }

    const uint32_t max_attempts = config_.max_retries + 1;
    FetchError last{.kind = FetchErrorKind::TRANSIENT_EXHAUSTED, .url = url};
    bool last_was_timeout = false;

    for (uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
        if (is_cancelled()) {
            return R::error(FetchError{.kind = FetchErrorKind::CANCELLED, .url = url,
                                       .attempts = attempt - 1, .detail = "cancelled"});
        }

        const auto left = remaining();
        if (left && left->count() == 0) {
            return R::error(FetchError{.kind = FetchErrorKind::TIMEOUT, .url = url,
                .attempts = attempt - 1,
                .detail = std::format("overall timeout of {} ms expired", config_.overall_timeout_ms)});
        }
        req.timeout = std::chrono::milliseconds(config_.request_timeout_ms);
        if (left && *left < req.timeout) req.timeout = *left;

        utils::log::debug(std::format("GET {} (attempt {}/{})", url, attempt, max_attempts));
        auto res = transport_.request(req);

        if (res.is_error()) {
            const auto& te = res.err();
            switch (te.kind) {
                case TransportErrorKind::TLS:
                    return R::error(FetchError{.kind = FetchErrorKind::TLS_FAILURE, .url = url,
                                               .attempts = attempt, .detail = te.detail});
                case TransportErrorKind::INVALID_REQUEST:
                    return R::error(FetchError{.kind = FetchErrorKind::INVALID_REQUEST, .url = url,
                                               .attempts = attempt, .detail = te.detail});
                case TransportErrorKind::TIMEOUT:
                    last_was_timeout = true;
                    break;
                case TransportErrorKind::NETWORK:
                    last_was_timeout = false;
                    break;
            }
            last.http_status = 0;
            last.detail = te.detail;
        } else {
            auto& resp = res.value();
            if (resp.is_success()) return R::ok(std::move(resp));
            if (resp.status < 500 && resp.status != 429) {
                return R::error(FetchError{.kind = FetchErrorKind::HTTP_STATUS, .url = url,
                    .http_status = resp.status, .attempts = attempt,
                    .detail = body_snippet(resp.body)});
            }
            last_was_timeout = false;
            last.http_status = resp.status;
            last.detail = body_snippet(resp.body);
        }

        if (attempt == max_attempts) break;

        const auto delay = backoff_delay(config_.retry_backoff_ms, attempt);
        if (const auto left_now = remaining(); left_now && *left_now <= delay) {
            return R::error(FetchError{.kind = FetchErrorKind::TIMEOUT, .url = url,
                .http_status = last.http_status, .attempts = attempt,
                .detail = std::format("overall timeout of {} ms expires before the next retry",
                                      config_.overall_timeout_ms)});
        }

        utils::log::warn(std::format("request to {} failed ({}), retry {}/{} in {} ms",
            url, last.http_status != 0 ? std::format("HTTP {}", last.http_status) : last.detail,
            attempt, config_.max_retries, delay.count()));

        if (!wait_backoff(delay)) {
            return R::error(FetchError{.kind = FetchErrorKind::CANCELLED, .url = url,
                                       .attempts = attempt, .detail = "cancelled"});
        }
    }

    last.kind = last_was_timeout ? FetchErrorKind::TIMEOUT : FetchErrorKind::TRANSIENT_EXHAUSTED;
    last.attempts = max_attempts;
    return R::error(std::move(last));
}

Result<nlohmann::json, FetchError> ApiClient::get_json(const std::string& url) {
    using R = Result<nlohmann::json, FetchError>;

    auto res = get(url);
    if (res.is_error()) return R::error(res.err());

    try {
        return R::ok(nlohmann::json::parse(res.value().body));
    } catch (const nlohmann::json::parse_error& e) {
        return R::error(FetchError{.kind = FetchErrorKind::MALFORMED_PAGE, .url = url,
                                   .attempts = 1, .detail = e.what()});
    }
}

} // namespace sysmlsql
