#pragma once

#include <peppol_lookup/smp/i_http_transport.hpp>

#include <chrono>

namespace peppol_lookup {

struct HttpTransportOptions {
    std::chrono::seconds connect_timeout{5};
    std::chrono::seconds read_timeout{10};
    bool disable_tls_verify = false;
    bool follow_redirects = true;
};

// ---------------------------------------------------------------------------
// HttpTransport — IHttpTransport implemented with cpp-httplib.
//
// A fresh httplib::Client is created per request; no connection, cookie or
// header state survives between lookups. httplib stays out of this header.
// ---------------------------------------------------------------------------
class HttpTransport : public IHttpTransport {
public:
    explicit HttpTransport(const HttpTransportOptions& options = {});

    [[nodiscard]] Result<HttpResponse, Error> Get(
        std::string_view base_url,
        std::string_view path,
        const HttpHeaders& headers = {}) override;

private:
    HttpTransportOptions options_;
};

} // namespace peppol_lookup
