#include <peppol_lookup/core/result.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>

namespace peppol_lookup {

namespace {

// Longest slice of an error body kept in a message.
constexpr size_t kMaxBodySnippet = 200;

// Reduce an error body to a short single-line snippet. Markup is kept as-is;
// SMP servers answer errors with plain text, HTML or XML depending on vendor.
std::optional<std::string> BodySnippet(const std::string& body) {
    std::string snippet;
    snippet.reserve(std::min(body.size(), kMaxBodySnippet));
    bool last_space = true;
    for (char c : body) {
        if (snippet.size() >= kMaxBodySnippet) {
            snippet += "...";
            break;
        }
        const bool space = c == ' ' || c == '\n' || c == '\r' || c == '\t';
        if (space) {
            if (!last_space) {
                snippet += ' ';
            }
        } else {
            snippet += c;
        }
        last_space = space;
    }
    while (!snippet.empty() && snippet.back() == ' ') {
        snippet.pop_back();
    }
    if (snippet.empty()) return std::nullopt;
    return snippet;
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    ErrorCategory category = ErrorCategory::HttpStatus;
    std::string message;

    switch (status_code) {
        case 400:
            message = "Bad request";
            break;
        case 401:
        case 403:
            message = "Access to service metadata denied";
            break;
        case 404:
            category = ErrorCategory::NotFound;
            message = "Participant unknown to the metadata publisher";
            break;
        case 408:
        case 504:
            category = ErrorCategory::Timeout;
            message = "Metadata publisher timed out";
            break;
        case 500:
            message = "Metadata publisher internal error";
            break;
        case 502:
        case 503:
            category = ErrorCategory::Connection;
            message = "Metadata publisher unavailable";
            break;
        default:
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }

    if (auto snippet = BodySnippet(response_body)) {
        message += ": " + *snippet;
    }

    return Error{operation, endpoint, status_code, message, category};
}

std::string Error::ToJson() const {
    nlohmann::json inner = {
        {"category", CategoryName()},
        {"operation", operation},
        {"message", message},
        {"exit_code", ExitCode()},
    };
    if (!endpoint.empty()) {
        inner["endpoint"] = endpoint;
    }
    if (http_status.has_value()) {
        inner["http_status"] = *http_status;
    }
    return nlohmann::json{{"error", inner}}.dump();
}

} // namespace peppol_lookup
