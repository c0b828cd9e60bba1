#pragma once

#include <peppol_lookup/core/result.hpp>

#include <map>
#include <string>
#include <string_view>

namespace peppol_lookup {

// ---------------------------------------------------------------------------
// HttpHeaders — header name/value pairs. Names are case-sensitive in this
// representation; callers normalise as needed.
// ---------------------------------------------------------------------------
using HttpHeaders = std::map<std::string, std::string>;

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
};

// ---------------------------------------------------------------------------
// IHttpTransport — abstract HTTP GET.
//
// The metadata client talks to a different SMP host on every lookup, so the
// target is passed per call as a base URL ("http://host[:port]") plus a path.
// Transport failures are Err; any HTTP status, success or not, is Ok and left
// to the caller to interpret.
// ---------------------------------------------------------------------------
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    IHttpTransport(const IHttpTransport&) = delete;
    IHttpTransport& operator=(const IHttpTransport&) = delete;
    IHttpTransport(IHttpTransport&&) = delete;
    IHttpTransport& operator=(IHttpTransport&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Get(
        std::string_view base_url,
        std::string_view path,
        const HttpHeaders& headers = {}) = 0;

protected:
    IHttpTransport() = default;
};

} // namespace peppol_lookup
