#include <peppol_lookup/core/types.hpp>

#include <algorithm>

namespace peppol_lookup {

namespace {

bool HasControlChar(std::string_view s) {
    return std::any_of(s.begin(), s.end(), [](char c) {
        const auto uc = static_cast<unsigned char>(c);
        return uc < 0x20 || uc == 0x7F;
    });
}

} // anonymous namespace

Result<ParticipantIdentifier, std::string> ParticipantIdentifier::Create(
    std::string_view scheme_id, std::string_view value) {
    using R = Result<ParticipantIdentifier, std::string>;
    if (scheme_id.empty()) {
        return R::Err("Participant scheme (ICD) must not be empty");
    }
    if (value.empty()) {
        return R::Err("Participant identifier must not be empty");
    }
    if (scheme_id.find(':') != std::string_view::npos) {
        return R::Err("Participant scheme (ICD) must not contain ':', got '" +
                      std::string(scheme_id) + "'");
    }
    if (HasControlChar(scheme_id) || HasControlChar(value)) {
        return R::Err("Participant identifier must not contain control characters");
    }
    return R::Ok(ParticipantIdentifier(std::string(scheme_id), std::string(value)));
}

Result<ParticipantIdentifier, std::string> ParticipantIdentifier::Parse(
    std::string_view canonical) {
    const auto colon = canonical.find(':');
    if (colon == std::string_view::npos) {
        return Result<ParticipantIdentifier, std::string>::Err(
            "Expected '{icd}:{identifier}', got '" + std::string(canonical) + "'");
    }
    return Create(canonical.substr(0, colon), canonical.substr(colon + 1));
}

} // namespace peppol_lookup
