#include <peppol_lookup/sml/system_dns_resolver.hpp>
#include <peppol_lookup/core/log.hpp>

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>

#include <future>
#include <memory>
#include <thread>

namespace peppol_lookup {

namespace {

Error MakeDnsError(const std::string& hostname,
                   const std::string& message,
                   ErrorCategory category) {
    return Error{"ResolveAddresses", hostname, std::nullopt, message, category};
}

ErrorCategory CategoryFromGaiError(int code) {
    switch (code) {
        case EAI_NONAME:
#ifdef EAI_NODATA
        case EAI_NODATA:
#endif
            return ErrorCategory::NotFound;
        case EAI_AGAIN:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Connection;
    }
}

// Render one addrinfo entry as text; empty for families we do not handle.
std::string AddressToString(const addrinfo* entry) {
    char buf[INET6_ADDRSTRLEN] = {};
    const char* p = nullptr;
    if (entry->ai_family == AF_INET) {
        const auto* sin = reinterpret_cast<const sockaddr_in*>(entry->ai_addr);
        p = ::inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
    } else if (entry->ai_family == AF_INET6) {
        const auto* sin6 = reinterpret_cast<const sockaddr_in6*>(entry->ai_addr);
        p = ::inet_ntop(AF_INET6, &sin6->sin6_addr, buf, sizeof(buf));
    }
    return p ? std::string(p) : std::string();
}

// Blocking lookup; runs on the worker thread.
Result<std::vector<std::string>, Error> LookupBlocking(const std::string& hostname) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    const int ret = ::getaddrinfo(hostname.c_str(), nullptr, &hints, &res);
    if (ret != 0) {
        return Result<std::vector<std::string>, Error>::Err(
            MakeDnsError(hostname, std::string("name resolution failed: ") + gai_strerror(ret),
                         CategoryFromGaiError(ret)));
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(res, &::freeaddrinfo);

    std::vector<std::string> addresses;
    for (const addrinfo* entry = res; entry != nullptr; entry = entry->ai_next) {
        auto text = AddressToString(entry);
        if (!text.empty()) {
            addresses.push_back(std::move(text));
        }
    }
    if (addresses.empty()) {
        return Result<std::vector<std::string>, Error>::Err(
            MakeDnsError(hostname, "name resolved to no usable address",
                         ErrorCategory::NotFound));
    }
    return Result<std::vector<std::string>, Error>::Ok(std::move(addresses));
}

} // anonymous namespace

SystemDnsResolver::SystemDnsResolver(const DnsResolverOptions& options)
    : options_(options) {}

Result<std::vector<std::string>, Error> SystemDnsResolver::ResolveAddresses(
    std::string_view hostname) {
    const std::string host(hostname);
    LogDebug("dns", "getaddrinfo " + host);

    auto promise = std::make_shared<std::promise<Result<std::vector<std::string>, Error>>>();
    auto future = promise->get_future();
    std::thread([promise, host]() {
        promise->set_value(LookupBlocking(host));
    }).detach();

    if (future.wait_for(options_.timeout) != std::future_status::ready) {
        LogDebug("dns", host + ": no answer within " +
                            std::to_string(options_.timeout.count()) + " ms");
        return Result<std::vector<std::string>, Error>::Err(
            MakeDnsError(host,
                         "name resolution timed out after " +
                             std::to_string(options_.timeout.count()) + " ms",
                         ErrorCategory::Timeout));
    }

    auto result = future.get();
    if (result.IsOk()) {
        LogDebug("dns", host + " -> " + result.Value().front() +
                            (result.Value().size() > 1
                                 ? " (+" + std::to_string(result.Value().size() - 1) + " more)"
                                 : std::string()));
    }
    return result;
}

} // namespace peppol_lookup
