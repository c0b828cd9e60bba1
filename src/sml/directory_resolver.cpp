#include <peppol_lookup/sml/directory_resolver.hpp>
#include <peppol_lookup/sml/participant_hash.hpp>
#include <peppol_lookup/core/log.hpp>

namespace peppol_lookup {

std::string BuildDirectoryHostname(const ParticipantIdentifier& participant,
                                   std::string_view root_domain) {
    return "b-" + HashParticipant(participant) + "." + kParticipantSchemePath +
           "." + std::string(root_domain);
}

LookupResult ResolveParticipant(IDnsResolver& resolver,
                                const ParticipantIdentifier& participant,
                                std::string_view root_domain) {
    auto hostname = BuildDirectoryHostname(participant, root_domain);
    LogInfo("sml", participant.Canonical() + " -> " + hostname);

    auto addresses = resolver.ResolveAddresses(hostname);
    if (addresses.IsErr()) {
        LogDebug("sml", "treating as unregistered: " + addresses.Error().ToString());
        return LookupResult::NotFound();
    }
    if (addresses.Value().empty()) {
        LogDebug("sml", hostname + " resolved to an empty address list");
        return LookupResult::NotFound();
    }
    return LookupResult::Found(std::move(hostname));
}

} // namespace peppol_lookup
