#include <peppol_lookup/smp/metadata_client.hpp>
#include <peppol_lookup/core/log.hpp>
#include <peppol_lookup/core/url.hpp>

#include <tinyxml2.h>

#include <cctype>
#include <cstring>

namespace peppol_lookup {

namespace {

constexpr const char* kReferenceElement = "ServiceMetadataReference";

// Element name without its namespace prefix ("ns3:Foo" -> "Foo").
std::string_view LocalName(std::string_view name) {
    const auto colon = name.rfind(':');
    return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

// Depth-first walk collecting hrefs of every ServiceMetadataReference.
void CollectReferenceHrefs(const tinyxml2::XMLElement* element,
                           std::vector<std::string>& hrefs) {
    for (; element != nullptr; element = element->NextSiblingElement()) {
        if (LocalName(element->Name()) == kReferenceElement) {
            const char* href = element->Attribute("href");
            hrefs.emplace_back(href ? href : "");
        }
        CollectReferenceHrefs(element->FirstChildElement(), hrefs);
    }
}

// Value of the href attribute inside one start tag's attribute text, if any.
std::optional<std::string> HrefAttribute(std::string_view attributes) {
    size_t pos = 0;
    while ((pos = attributes.find("href", pos)) != std::string_view::npos) {
        const bool at_name_start =
            pos == 0 || std::isspace(static_cast<unsigned char>(attributes[pos - 1]));
        size_t i = pos + 4;
        pos = i;
        if (!at_name_start) continue;
        while (i < attributes.size() &&
               std::isspace(static_cast<unsigned char>(attributes[i]))) ++i;
        if (i >= attributes.size() || attributes[i] != '=') continue;
        ++i;
        while (i < attributes.size() &&
               std::isspace(static_cast<unsigned char>(attributes[i]))) ++i;
        if (i >= attributes.size() || (attributes[i] != '"' && attributes[i] != '\'')) {
            continue;
        }
        const char quote = attributes[i];
        const auto close = attributes.find(quote, i + 1);
        if (close == std::string_view::npos) return std::nullopt;
        return std::string(attributes.substr(i + 1, close - i - 1));
    }
    return std::nullopt;
}

// Text scan for ServiceMetadataReference start tags in a body tinyxml2
// rejected. Truncated or loosely formed bodies still yield their
// complete references.
std::vector<std::string> ScanReferenceHrefs(std::string_view body) {
    std::vector<std::string> hrefs;
    size_t pos = 0;
    while ((pos = body.find('<', pos)) != std::string_view::npos) {
        const size_t name_start = pos + 1;
        size_t name_end = name_start;
        while (name_end < body.size() && body[name_end] != '>' && body[name_end] != '/' &&
               !std::isspace(static_cast<unsigned char>(body[name_end]))) {
            ++name_end;
        }
        pos = name_end;
        if (LocalName(body.substr(name_start, name_end - name_start)) != kReferenceElement) {
            continue;
        }

        const auto tag_end = body.find('>', name_end);
        if (tag_end == std::string_view::npos) break;
        if (auto href = HrefAttribute(body.substr(name_end, tag_end - name_end))) {
            hrefs.push_back(std::move(*href));
        }
        pos = tag_end;
    }
    return hrefs;
}

} // anonymous namespace

std::string BuildMetadataPath(const ParticipantIdentifier& participant) {
    return std::string("/") + kParticipantSchemePath + "::" +
           UrlEncode(participant.Canonical());
}

std::string BuildMetadataBaseUrl(std::string_view smp_hostname, bool use_https) {
    return (use_https ? "https://" : "http://") + std::string(smp_hostname);
}

std::string BuildMetadataUrl(std::string_view smp_hostname,
                             const ParticipantIdentifier& participant,
                             bool use_https) {
    return BuildMetadataBaseUrl(smp_hostname, use_https) + BuildMetadataPath(participant);
}

std::optional<std::string> ExtractDocumentType(std::string_view href) {
    const auto decoded = UrlDecode(href);
    const auto marker = decoded.find(kDocumentTypeMarker);
    if (marker == std::string::npos) {
        return std::nullopt;
    }
    const auto start = marker + std::strlen(kDocumentTypeMarker);
    const auto end = decoded.find('#', start);
    return decoded.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

Result<std::vector<std::string>, Error> ParseServiceMetadataReferences(
    std::string_view body) {
    std::vector<std::string> hrefs;
    tinyxml2::XMLDocument doc;
    if (doc.Parse(body.data(), body.size()) == tinyxml2::XML_SUCCESS) {
        CollectReferenceHrefs(doc.RootElement(), hrefs);
    } else {
        const char* err = doc.ErrorStr();
        const std::string reason = err != nullptr ? err : "";
        hrefs = ScanReferenceHrefs(body);
        if (hrefs.empty()) {
            std::string message = "SMP response is not well-formed XML";
            if (!reason.empty()) {
                message += ": " + reason;
            }
            return Result<std::vector<std::string>, Error>::Err(Error{
                "ParseServiceMetadataReferences", "", std::nullopt, message,
                ErrorCategory::MalformedResponse});
        }
        LogWarn("smp", "SMP response is not well-formed XML, scanned " +
                           std::to_string(hrefs.size()) + " reference(s) from text");
    }

    std::vector<std::string> document_types;
    for (const auto& href : hrefs) {
        if (auto doc_type = ExtractDocumentType(href)) {
            document_types.push_back(std::move(*doc_type));
        } else {
            LogDebug("smp", "skipping reference without document type: '" + href + "'");
        }
    }
    return Result<std::vector<std::string>, Error>::Ok(std::move(document_types));
}

Result<std::vector<std::string>, Error> FetchDocumentTypes(
    IHttpTransport& transport,
    std::string_view smp_hostname,
    const ParticipantIdentifier& participant,
    bool use_https) {
    const auto base_url = BuildMetadataBaseUrl(smp_hostname, use_https);
    const auto path = BuildMetadataPath(participant);

    auto response = transport.Get(base_url, path);
    if (response.IsErr()) {
        return Result<std::vector<std::string>, Error>::Err(std::move(response).Error());
    }

    const auto& http = response.Value();
    if (http.status_code < 200 || http.status_code >= 300) {
        return Result<std::vector<std::string>, Error>::Err(
            Error::FromHttpStatus("FetchDocumentTypes", base_url + path,
                                  http.status_code, http.body));
    }

    auto parsed = ParseServiceMetadataReferences(http.body);
    if (parsed.IsErr()) {
        auto error = std::move(parsed).Error();
        error.operation = "FetchDocumentTypes";
        error.endpoint = base_url + path;
        return Result<std::vector<std::string>, Error>::Err(std::move(error));
    }
    LogInfo("smp", std::to_string(parsed.Value().size()) + " document type(s) from " +
                       std::string(smp_hostname));
    return parsed;
}

} // namespace peppol_lookup
