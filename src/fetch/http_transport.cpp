#include "fetch/http_transport.hpp"
#include "fetch/url.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>

namespace sysmlsql {

std::optional<std::string> HttpResponse::header(std::string_view name) const {
    const auto wanted = utils::to_lower(std::string(name));
    std::optional<std::string> out;
    for (const auto& [key, value] : headers) {
        if (utils::to_lower(key) != wanted) continue;
        if (out) {
            *out += ", ";
            *out += value;
        } else {
            out = value;
        }
    }
    return out;
}

Result<HttpResponse, TransportError> HttplibTransport::request(const HttpRequest& req) {
    using R = Result<HttpResponse, TransportError>;

    if (req.method != "GET") {
        return R::error(TransportError{TransportErrorKind::INVALID_REQUEST,
            std::format("unsupported method {}", req.method)});
    }
    const auto url = parse_url(req.url);
    if (!url) {
        return R::error(TransportError{TransportErrorKind::INVALID_REQUEST,
            std::format("not an absolute http(s) URL: {}", req.url)});
    }

    httplib::Client cli(url->origin());
    cli.set_connection_timeout(req.timeout);
    cli.set_read_timeout(req.timeout);
    cli.set_write_timeout(req.timeout);
    cli.set_follow_location(true);
    cli.enable_server_certificate_verification(req.verify_tls);
    if (req.credentials) {
        cli.set_basic_auth(req.credentials->username, req.credentials->password);
    }

    httplib::Headers headers;
    for (const auto& [key, value] : req.headers) {
        headers.emplace(key, value);
    }

    auto res = cli.Get(url->target, headers);
    if (!res) {
        const auto err = res.error();
        const auto detail = httplib::to_string(err);
        switch (err) {
            case httplib::Error::SSLConnection:
            case httplib::Error::SSLLoadingCerts:
            case httplib::Error::SSLServerVerification:
                return R::error(TransportError{TransportErrorKind::TLS, detail});
            case httplib::Error::ConnectionTimeout:
                return R::error(TransportError{TransportErrorKind::TIMEOUT, detail});
            case httplib::Error::Read:
                // httplib does not tell an expired read timeout from a reset
                return R::error(TransportError{TransportErrorKind::NETWORK,
                    std::format("{} (no response within {} ms or connection reset)",
                                detail, req.timeout.count())});
            default:
                return R::error(TransportError{TransportErrorKind::NETWORK, detail});
        }
    }

    HttpResponse out;
    out.status = res->status;
    out.body = std::move(res->body);
    out.headers.reserve(res->headers.size());
    for (const auto& [key, value] : res->headers) {
        out.headers.emplace_back(key, value);
    }
    return R::ok(std::move(out));
}

} // namespace sysmlsql
