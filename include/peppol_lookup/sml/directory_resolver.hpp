#pragma once

#include <peppol_lookup/core/types.hpp>
#include <peppol_lookup/sml/i_dns_resolver.hpp>

#include <cassert>
#include <optional>
#include <string>
#include <string_view>

namespace peppol_lookup {

// ---------------------------------------------------------------------------
// LookupResult — outcome of an SML lookup: Found(hostname) or NotFound.
//
// NotFound covers every DNS failure. The SML signals "not registered" by the
// absence of a record, and a DNS client cannot tell that apart from a lost
// answer without resolver-specific error codes.
// ---------------------------------------------------------------------------
class LookupResult {
public:
    static LookupResult Found(std::string hostname) {
        return LookupResult(std::move(hostname));
    }
    static LookupResult NotFound() { return LookupResult(std::nullopt); }

    [[nodiscard]] bool IsFound() const noexcept { return hostname_.has_value(); }
    [[nodiscard]] bool IsNotFound() const noexcept { return !hostname_.has_value(); }

    /// Only valid when IsFound().
    [[nodiscard]] const std::string& Hostname() const {
        assert(IsFound() && "Hostname() called on a NotFound LookupResult");
        return *hostname_;
    }

    bool operator==(const LookupResult& other) const { return hostname_ == other.hostname_; }
    bool operator!=(const LookupResult& other) const { return !(*this == other); }

private:
    explicit LookupResult(std::optional<std::string> hostname)
        : hostname_(std::move(hostname)) {}

    std::optional<std::string> hostname_;
};

// ---------------------------------------------------------------------------
// SML directory resolution.
// ---------------------------------------------------------------------------

/// "b-{md5}.iso6523-actorid-upis.{root_domain}".
[[nodiscard]] std::string BuildDirectoryHostname(
    const ParticipantIdentifier& participant,
    std::string_view root_domain);

/// One fresh DNS query for the participant's directory hostname.
[[nodiscard]] LookupResult ResolveParticipant(
    IDnsResolver& resolver,
    const ParticipantIdentifier& participant,
    std::string_view root_domain);

} // namespace peppol_lookup
