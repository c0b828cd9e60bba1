#include <peppol_lookup/config/config_loader.hpp>

#include <peppol_lookup/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <vector>

namespace peppol_lookup {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, ErrorCategory::Config};
}

// Split "{icd}:{identifier}" positionals; a single positional without ':'
// is rejected because the identifier alone does not name a participant.
Result<void, Error> ApplyParticipantArgs(const std::vector<std::string>& args,
                                         AppConfig& config) {
    if (args.size() == 2) {
        config.icd = args[0];
        config.identifier = args[1];
        return Result<void, Error>::Ok();
    }
    if (args.size() == 1) {
        auto parsed = ParticipantIdentifier::Parse(args[0]);
        if (parsed.IsErr()) {
            return Result<void, Error>::Err(
                MakeConfigError("Invalid participant: " + parsed.Error()));
        }
        config.icd = parsed.Value().SchemeId();
        config.identifier = parsed.Value().Value();
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    try {
        const YAML::Node root = YAML::LoadFile(std::string(file_path));

        if (const auto participant = root["participant"]) {
            if (participant["icd"]) {
                config.icd = participant["icd"].as<std::string>();
            }
            if (participant["identifier"]) {
                config.identifier = participant["identifier"].as<std::string>();
            }
        }

        if (root["sml_domain"]) {
            config.sml_domain = root["sml_domain"].as<std::string>();
        }
        if (root["https"]) {
            config.use_https = root["https"].as<bool>();
        }
        if (root["insecure"]) {
            config.insecure = root["insecure"].as<bool>();
        }

        if (const auto timeouts = root["timeouts"]) {
            if (timeouts["dns_ms"]) {
                config.dns_timeout_ms = timeouts["dns_ms"].as<int>();
            }
            if (timeouts["connect"]) {
                config.connect_timeout_seconds = timeouts["connect"].as<int>();
            }
            if (timeouts["read"]) {
                config.read_timeout_seconds = timeouts["read"].as<int>();
            }
        }

        if (root["json_output"]) {
            config.json_output = root["json_output"].as<bool>();
        }
        if (root["color"]) {
            config.color = root["color"].as<bool>();
        }
        if (root["verbosity"]) {
            config.verbosity = root["verbosity"].as<int>();
        }
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file '" + std::string(file_path) +
                            "': " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    // -v is the verbosity counter; --version is handled in main.
    argparse::ArgumentParser program("peppol-lookup", kVersion,
                                     argparse::default_arguments::help);
    program.add_description(
        "Look up a PEPPOL participant in the SML and list the document types "
        "its SMP publishes.");

    program.add_argument("participant")
        .help("ICD and identifier (\"0192 921605900\" or \"0192:921605900\")")
        .nargs(0, 2);

    program.add_argument("--sml-domain")
        .help("SML root domain (default: $PEPPOL_SML_DOMAIN or " +
              std::string(kDefaultSmlDomain) + ")");
    program.add_argument("--https")
        .help("Query the SMP over HTTPS")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--insecure")
        .help("Skip TLS certificate verification with --https")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--dns-timeout")
        .help("DNS timeout in milliseconds")
        .scan<'i', int>();
    program.add_argument("--connect-timeout")
        .help("HTTP connect timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--read-timeout")
        .help("HTTP read timeout in seconds")
        .scan<'i', int>();

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Write JSON log lines to this file");

    int verbosity = 0;
    program.add_argument("-v", "--verbose")
        .help("Increase log verbosity (-v info, -vv debug)")
        .action([&](const auto&) { ++verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliConfig cli;
    AppConfig& config = cli.config;

    if (auto positionals = program.present<std::vector<std::string>>("participant")) {
        auto applied = ApplyParticipantArgs(*positionals, config);
        if (applied.IsErr()) {
            return Result<CliConfig, Error>::Err(std::move(applied).Error());
        }
    }

    if (auto val = program.present("--sml-domain")) {
        config.sml_domain = *val;
    }
    if (program.get<bool>("--https")) {
        config.use_https = true;
    }
    if (program.get<bool>("--insecure")) {
        config.insecure = true;
    }
    if (auto val = program.present<int>("--dns-timeout")) {
        config.dns_timeout_ms = *val;
    }
    if (auto val = program.present<int>("--connect-timeout")) {
        config.connect_timeout_seconds = *val;
    }
    if (auto val = program.present<int>("--read-timeout")) {
        config.read_timeout_seconds = *val;
    }

    if (auto val = program.present("--config")) {
        cli.config_file = *val;
    }
    if (program.get<bool>("--json")) {
        config.json_output = true;
    }
    if (program.get<bool>("--no-color")) {
        config.color = false;
    } else if (program.get<bool>("--color")) {
        config.color = true;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    config.verbosity = verbosity;

    return Result<CliConfig, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
bool JsonOutputRequested(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        if (arg == "--") {
            return false;
        }
        if (arg == "--json") {
            return true;
        }
    }
    return false;
}

AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    const AppConfig defaults;
    AppConfig merged = yaml_base;

    if (!cli_overrides.icd.empty()) {
        merged.icd = cli_overrides.icd;
    }
    if (!cli_overrides.identifier.empty()) {
        merged.identifier = cli_overrides.identifier;
    }
    if (cli_overrides.sml_domain.has_value()) {
        merged.sml_domain = cli_overrides.sml_domain;
    }
    if (cli_overrides.use_https) {
        merged.use_https = true;
    }
    if (cli_overrides.insecure) {
        merged.insecure = true;
    }

    if (cli_overrides.dns_timeout_ms != defaults.dns_timeout_ms) {
        merged.dns_timeout_ms = cli_overrides.dns_timeout_ms;
    }
    if (cli_overrides.connect_timeout_seconds != defaults.connect_timeout_seconds) {
        merged.connect_timeout_seconds = cli_overrides.connect_timeout_seconds;
    }
    if (cli_overrides.read_timeout_seconds != defaults.read_timeout_seconds) {
        merged.read_timeout_seconds = cli_overrides.read_timeout_seconds;
    }

    if (cli_overrides.json_output) {
        merged.json_output = true;
    }
    if (cli_overrides.color.has_value()) {
        merged.color = cli_overrides.color;
    }
    if (cli_overrides.verbosity > 0) {
        merged.verbosity = cli_overrides.verbosity;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ApplyDefaults
// ---------------------------------------------------------------------------
AppConfig ApplyDefaults(AppConfig config) {
    if (config.icd.empty() && config.identifier.empty()) {
        config.icd = kDefaultIcd;
        config.identifier = kDefaultIdentifier;
    }
    if (!config.sml_domain.has_value()) {
        const char* env_val = std::getenv(kSmlDomainEnvVar);
        if (env_val != nullptr && *env_val != '\0') {
            config.sml_domain = std::string(env_val);
        } else {
            config.sml_domain = std::string(kDefaultSmlDomain);
        }
    }
    return config;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    auto participant = ParticipantFromConfig(config);
    if (participant.IsErr()) {
        return Result<void, Error>::Err(std::move(participant).Error());
    }
    if (!config.sml_domain.has_value() || config.sml_domain->empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: sml_domain"));
    }
    const auto& domain = *config.sml_domain;
    if (domain.front() == '.' || domain.back() == '.' ||
        domain.find_first_of(" /:") != std::string::npos) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid SML domain '" + domain + "'"));
    }
    if (config.insecure && !config.use_https) {
        return Result<void, Error>::Err(MakeConfigError("insecure requires https"));
    }
    if (config.dns_timeout_ms <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("DNS timeout must be positive, got " +
                            std::to_string(config.dns_timeout_ms)));
    }
    if (config.connect_timeout_seconds <= 0 || config.read_timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("HTTP timeouts must be positive"));
    }
    if (config.verbosity < 0) {
        return Result<void, Error>::Err(MakeConfigError("Verbosity must not be negative"));
    }
    return Result<void, Error>::Ok();
}

Result<ParticipantIdentifier, Error> ParticipantFromConfig(const AppConfig& config) {
    auto participant = ParticipantIdentifier::Create(config.icd, config.identifier);
    if (participant.IsErr()) {
        return Result<ParticipantIdentifier, Error>::Err(
            MakeConfigError("Invalid participant: " + participant.Error()));
    }
    return Result<ParticipantIdentifier, Error>::Ok(std::move(participant).Value());
}

LookupOptions ToLookupOptions(const AppConfig& config) {
    LookupOptions options;
    if (config.sml_domain.has_value()) {
        options.sml_domain = *config.sml_domain;
    }
    options.use_https = config.use_https;
    return options;
}

DnsResolverOptions ToDnsResolverOptions(const AppConfig& config) {
    return DnsResolverOptions{std::chrono::milliseconds(config.dns_timeout_ms)};
}

HttpTransportOptions ToHttpTransportOptions(const AppConfig& config) {
    HttpTransportOptions options;
    options.connect_timeout = std::chrono::seconds(config.connect_timeout_seconds);
    options.read_timeout = std::chrono::seconds(config.read_timeout_seconds);
    options.disable_tls_verify = config.insecure;
    return options;
}

} // namespace peppol_lookup
