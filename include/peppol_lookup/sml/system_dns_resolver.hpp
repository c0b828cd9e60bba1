#pragma once

#include <peppol_lookup/sml/i_dns_resolver.hpp>

#include <chrono>

namespace peppol_lookup {

struct DnsResolverOptions {
    std::chrono::milliseconds timeout{5000};
};

// ---------------------------------------------------------------------------
// SystemDnsResolver — IDnsResolver backed by getaddrinfo(3).
//
// getaddrinfo has no timeout of its own, so each lookup runs on a detached
// worker thread and the caller waits at most options.timeout for it. A lookup
// that overruns is reported as ErrorCategory::Timeout; the worker finishes in
// the background and its answer is discarded.
// ---------------------------------------------------------------------------
class SystemDnsResolver : public IDnsResolver {
public:
    explicit SystemDnsResolver(const DnsResolverOptions& options = {});

    [[nodiscard]] Result<std::vector<std::string>, Error> ResolveAddresses(
        std::string_view hostname) override;

private:
    DnsResolverOptions options_;
};

} // namespace peppol_lookup
