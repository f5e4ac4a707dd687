#pragma once

#include "core/error.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sysmlsql {

struct BasicCredentials {
    std::string username;
    std::string password;
};

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::optional<BasicCredentials> credentials;
    bool verify_tls = true;
    std::chrono::milliseconds timeout{30000};
};

struct HttpResponse {
    int status = 0;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    /**
     * @brief Case-insensitive header lookup
     *
     * Repeated headers are combined into one comma separated value, which is
     * how list-valued headers such as Link are defined to merge.
     */
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;

    [[nodiscard]] bool is_success() const { return status >= 200 && status < 300; }
};

enum class TransportErrorKind : uint8_t {
    NETWORK,            // connect/read/write failure
    TIMEOUT,            // per-request timeout
    TLS,                // handshake or certificate verification failure
    INVALID_REQUEST     // URL or method the transport cannot issue
};

struct TransportError {
    TransportErrorKind kind = TransportErrorKind::NETWORK;
    std::string detail;

    [[nodiscard]] std::string message() const { return detail; }
};

/**
 * @brief Abstract HTTP transport
 *
 * Issues one request and returns the response as received; retries,
 * pagination and status interpretation belong to the caller.
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    [[nodiscard]] virtual Result<HttpResponse, TransportError> request(const HttpRequest& req) = 0;
};

/**
 * @brief IHttpTransport over httplib::Client
 *
 * One client per request origin; HTTPS support comes from OpenSSL.
 * Redirects are followed.
 */
class HttplibTransport : public IHttpTransport {
public:
    Result<HttpResponse, TransportError> request(const HttpRequest& req) override;
};

} // namespace sysmlsql
