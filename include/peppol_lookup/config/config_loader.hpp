#pragma once

#include <peppol_lookup/config/app_config.hpp>
#include <peppol_lookup/core/result.hpp>
#include <peppol_lookup/core/types.hpp>
#include <peppol_lookup/sml/system_dns_resolver.hpp>
#include <peppol_lookup/smp/http_transport.hpp>
#include <peppol_lookup/workflow/lookup_workflow.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace peppol_lookup {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Result of parsing the command line: the CLI-level config plus the path
// given with -c/--config, if any.
struct CliConfig {
    AppConfig config;
    std::optional<std::string> config_file;
};

// Parse CLI arguments. Accepts "ICD IDENTIFIER" or "ICD:IDENTIFIER" as
// positionals; both are optional.
Result<CliConfig, Error> LoadFromCli(int argc, const char* const* argv);

// True when "--json" appears before any "--" terminator. Lets errors raised
// while loading the config honour the requested output mode.
bool JsonOutputRequested(int argc, const char* const* argv);

// Merge two configs: values set in cli_overrides replace those in yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Fill unset fields: participant defaults to the reference case, sml_domain
// to $PEPPOL_SML_DOMAIN or the PEPPOL test SML.
AppConfig ApplyDefaults(AppConfig config);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Typed views of a validated config.
Result<ParticipantIdentifier, Error> ParticipantFromConfig(const AppConfig& config);
LookupOptions ToLookupOptions(const AppConfig& config);
DnsResolverOptions ToDnsResolverOptions(const AppConfig& config);
HttpTransportOptions ToHttpTransportOptions(const AppConfig& config);

} // namespace peppol_lookup
