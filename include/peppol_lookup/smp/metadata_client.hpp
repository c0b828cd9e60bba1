#pragma once

#include <peppol_lookup/core/result.hpp>
#include <peppol_lookup/core/types.hpp>
#include <peppol_lookup/smp/i_http_transport.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace peppol_lookup {

/// Marker that precedes the document type identifier in a decoded
/// ServiceMetadataReference href.
constexpr const char* kDocumentTypeMarker = "busdox-docid-qns::";

// ---------------------------------------------------------------------------
// SMP metadata client — free functions over IHttpTransport.
//
// GET {scheme}://{smp_host}/iso6523-actorid-upis::{urlencoded participant}
// returns a ServiceGroup document. Each ServiceMetadataReference in it points
// at one document type the participant accepts:
//
//   <ns3:ServiceMetadataReference
//       href="http://smp/iso6523-actorid-upis%3A%3A0192%3A921605900/services/
//             busdox-docid-qns%3A%3Aurn%3Aoasis%3A...%3A%3AInvoice%23%23..."/>
// ---------------------------------------------------------------------------

/// "/iso6523-actorid-upis::" followed by the URL-encoded canonical identifier.
[[nodiscard]] std::string BuildMetadataPath(const ParticipantIdentifier& participant);

/// "http://" or "https://" followed by the SMP hostname.
[[nodiscard]] std::string BuildMetadataBaseUrl(std::string_view smp_hostname,
                                               bool use_https = false);

/// Full query URL: base URL plus path.
[[nodiscard]] std::string BuildMetadataUrl(std::string_view smp_hostname,
                                           const ParticipantIdentifier& participant,
                                           bool use_https = false);

/// Document type embedded in one href, or nullopt when the href carries no
/// document type marker.
[[nodiscard]] std::optional<std::string> ExtractDocumentType(std::string_view href);

/// Document types referenced by a ServiceGroup body, in document order,
/// duplicates kept. Err only when the body is not well-formed XML.
[[nodiscard]] Result<std::vector<std::string>, Error> ParseServiceMetadataReferences(
    std::string_view body);

/// Query the participant's SMP and return the document types it accepts.
/// Transport failures and non-2xx statuses are Err; no retries.
[[nodiscard]] Result<std::vector<std::string>, Error> FetchDocumentTypes(
    IHttpTransport& transport,
    std::string_view smp_hostname,
    const ParticipantIdentifier& participant,
    bool use_https = false);

} // namespace peppol_lookup
