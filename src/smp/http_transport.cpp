#include <peppol_lookup/smp/http_transport.hpp>
#include <peppol_lookup/core/log.hpp>

#include <httplib.h>

namespace peppol_lookup {

namespace {

// Longest response body echoed into the debug log.
constexpr size_t kMaxBodyLog = 4000;

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Connection;
    }
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

void LogResponse(int status, const std::string& body) {
    LogInfo("http", "  < " + std::to_string(status) + " (" +
                        std::to_string(body.size()) + " bytes)");
    if (body.empty()) return;
    if (body.size() <= kMaxBodyLog) {
        LogDebug("http", "  < body: " + body);
    } else {
        LogDebug("http", "  < body: " + body.substr(0, kMaxBodyLog) + "... (truncated)");
    }
}

} // anonymous namespace

HttpTransport::HttpTransport(const HttpTransportOptions& options)
    : options_(options) {}

Result<HttpResponse, Error> HttpTransport::Get(std::string_view base_url,
                                               std::string_view path,
                                               const HttpHeaders& headers) {
    const std::string url = std::string(base_url) + std::string(path);

    httplib::Client client{std::string(base_url)};
    if (!client.is_valid()) {
        return Result<HttpResponse, Error>::Err(Error{
            "Get", url, std::nullopt,
            "Unsupported or malformed base URL '" + std::string(base_url) + "'",
            ErrorCategory::Config});
    }
    client.set_connection_timeout(options_.connect_timeout);
    client.set_read_timeout(options_.read_timeout);
    client.set_follow_location(options_.follow_redirects);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (options_.disable_tls_verify) {
        client.enable_server_certificate_verification(false);
    }
#endif

    httplib::Headers hdrs;
    for (const auto& [key, value] : headers) {
        hdrs.emplace(key, value);
    }

    LogInfo("http", "GET " + url);
    auto res = client.Get(std::string(path), hdrs);
    if (!res) {
        const auto http_error = res.error();
        return Result<HttpResponse, Error>::Err(Error{
            "Get", url, std::nullopt,
            "HTTP request failed: " + httplib::to_string(http_error),
            CategoryFromHttpTransportError(http_error)});
    }
    LogResponse(res->status, res->body);
    return Result<HttpResponse, Error>::Ok(HttpResponse{
        res->status, ToHttpHeaders(res->headers), res->body});
}

} // namespace peppol_lookup
