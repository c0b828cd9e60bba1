#pragma once

#include <optional>
#include <string>

namespace peppol_lookup {

/// Participant looked up when none is given: Snapbooks AS, Norwegian
/// organisation number 921605900 (ICD 0192).
constexpr const char* kDefaultIcd = "0192";
constexpr const char* kDefaultIdentifier = "921605900";

/// Environment variable consulted for the SML root domain when neither the
/// command line nor the config file sets one.
constexpr const char* kSmlDomainEnvVar = "PEPPOL_SML_DOMAIN";

struct AppConfig {
    // Participant; empty until ApplyDefaults fills in the reference case.
    std::string icd;
    std::string identifier;

    // Protocol
    std::optional<std::string> sml_domain;
    bool use_https = false;
    bool insecure = false;  // skip TLS certificate verification

    // Transport limits
    int dns_timeout_ms = 5000;
    int connect_timeout_seconds = 5;
    int read_timeout_seconds = 10;

    // Output
    bool json_output = false;
    std::optional<bool> color;  // unset: follow the terminal
    int verbosity = 0;
    std::optional<std::string> log_file;
};

} // namespace peppol_lookup
