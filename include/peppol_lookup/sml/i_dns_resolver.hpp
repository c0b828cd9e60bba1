#pragma once

#include <peppol_lookup/core/result.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace peppol_lookup {

// ---------------------------------------------------------------------------
// IDnsResolver — abstract address lookup.
//
// The directory resolver depends on this interface rather than on the system
// resolver so that SML lookups can be tested offline via MockDnsResolver.
// An Ok result holds at least one textual address.
// ---------------------------------------------------------------------------
class IDnsResolver {
public:
    virtual ~IDnsResolver() = default;

    IDnsResolver(const IDnsResolver&) = delete;
    IDnsResolver& operator=(const IDnsResolver&) = delete;
    IDnsResolver(IDnsResolver&&) = delete;
    IDnsResolver& operator=(IDnsResolver&&) = delete;

    [[nodiscard]] virtual Result<std::vector<std::string>, Error> ResolveAddresses(
        std::string_view hostname) = 0;

protected:
    IDnsResolver() = default;
};

} // namespace peppol_lookup
