#pragma once

#include <peppol_lookup/core/types.hpp>

#include <string>
#include <string_view>

namespace peppol_lookup {

// ---------------------------------------------------------------------------
// Participant hashing for SML hostnames.
//
// The SML publishes one DNS name per participant, keyed by the MD5 digest of
// the canonical identifier "{icd}:{value}". The digest must match byte for
// byte what the SML computed at registration time, so the input is the
// identifier exactly as given (no case folding).
// ---------------------------------------------------------------------------

/// Lowercase hex MD5 of arbitrary bytes.
[[nodiscard]] std::string Md5Hex(std::string_view data);

/// Lowercase hex MD5 of the participant's canonical form (32 characters).
[[nodiscard]] std::string HashParticipant(const ParticipantIdentifier& participant);

} // namespace peppol_lookup
