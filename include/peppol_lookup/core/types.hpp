#pragma once

#include <peppol_lookup/core/result.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace peppol_lookup {

/// Identifier scheme path used in SML hostnames and SMP URLs.
constexpr const char* kParticipantSchemePath = "iso6523-actorid-upis";

// ---------------------------------------------------------------------------
// ParticipantIdentifier — PEPPOL participant in the iso6523-actorid-upis
// scheme, e.g. ("0192", "921605900").
//
// Rules:
//   - scheme_id (the ICD) is non-empty and contains no ':'
//   - value is non-empty
//   - neither part contains control characters
// ---------------------------------------------------------------------------
class ParticipantIdentifier {
public:
    static Result<ParticipantIdentifier, std::string> Create(
        std::string_view scheme_id, std::string_view value);

    /// Split "{scheme_id}:{value}" at the first ':'.
    static Result<ParticipantIdentifier, std::string> Parse(
        std::string_view canonical);

    [[nodiscard]] const std::string& SchemeId() const noexcept { return scheme_id_; }
    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    /// "{scheme_id}:{value}" — the string that is hashed and URL-encoded.
    [[nodiscard]] std::string Canonical() const { return scheme_id_ + ":" + value_; }

    bool operator==(const ParticipantIdentifier& other) const {
        return scheme_id_ == other.scheme_id_ && value_ == other.value_;
    }
    bool operator!=(const ParticipantIdentifier& other) const {
        return !(*this == other);
    }

private:
    ParticipantIdentifier(std::string scheme_id, std::string value)
        : scheme_id_(std::move(scheme_id)), value_(std::move(value)) {}

    std::string scheme_id_;
    std::string value_;
};

} // namespace peppol_lookup

namespace std {

template <>
struct hash<peppol_lookup::ParticipantIdentifier> {
    size_t operator()(const peppol_lookup::ParticipantIdentifier& p) const noexcept {
        return hash<string>{}(p.Canonical());
    }
};

} // namespace std
