#include <peppol_lookup/cli/output_formatter.hpp>
#include <peppol_lookup/config/config_loader.hpp>
#include <peppol_lookup/core/log.hpp>
#include <peppol_lookup/core/terminal.hpp>
#include <peppol_lookup/core/version.hpp>
#include <peppol_lookup/sml/system_dns_resolver.hpp>
#include <peppol_lookup/smp/http_transport.hpp>
#include <peppol_lookup/workflow/lookup_workflow.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <string_view>

namespace {

using namespace peppol_lookup;

bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--version") {
            std::cout << "peppol-lookup " << kVersion << "\n";
            return true;
        }
    }
    return false;
}

bool ResolveColor(const AppConfig& config, bool is_tty) {
    if (config.color.has_value()) {
        return *config.color;
    }
    return is_tty && !NoColorEnvSet();
}

// Log lines go to --log-file as JSON when given, otherwise to stderr.
Result<void, Error> InitLogging(const AppConfig& config) {
    const auto level = LogLevelFromVerbosity(config.verbosity);
    if (config.log_file.has_value()) {
        static std::ofstream log_stream;
        log_stream.open(*config.log_file, std::ios::out | std::ios::app);
        if (!log_stream) {
            return Result<void, Error>::Err(Error{
                "InitLogging", *config.log_file, std::nullopt,
                "cannot open log file for writing", ErrorCategory::Config});
        }
        InitGlobalLogger(std::make_unique<JsonSink>(log_stream), level);
        return Result<void, Error>::Ok();
    }
    InitGlobalLogger(
        std::make_unique<ColorConsoleSink>(ResolveColor(config, IsStderrTty())),
        level);
    return Result<void, Error>::Ok();
}

Result<AppConfig, Error> LoadConfig(int argc, const char* const* argv) {
    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        return Result<AppConfig, Error>::Err(std::move(cli).Error());
    }
    auto parsed = std::move(cli).Value();

    AppConfig config = parsed.config;
    if (parsed.config_file.has_value()) {
        auto yaml = LoadFromYaml(*parsed.config_file);
        if (yaml.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(yaml).Error());
        }
        config = MergeConfigs(yaml.Value(), parsed.config);
    }

    config = ApplyDefaults(std::move(config));
    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(std::move(valid).Error());
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }

    auto config_result = LoadConfig(argc, argv);
    if (config_result.IsErr()) {
        OutputFormatter(JsonOutputRequested(argc, argv), false)
            .PrintError(config_result.Error());
        return config_result.Error().ExitCode();
    }
    const auto config = std::move(config_result).Value();

    OutputFormatter formatter(config.json_output, ResolveColor(config, IsStdoutTty()));

    auto logging = InitLogging(config);
    if (logging.IsErr()) {
        formatter.PrintError(logging.Error());
        return logging.Error().ExitCode();
    }

    auto participant = ParticipantFromConfig(config);
    if (participant.IsErr()) {
        formatter.PrintError(participant.Error());
        return participant.Error().ExitCode();
    }

    SystemDnsResolver resolver(ToDnsResolverOptions(config));
    HttpTransport transport(ToHttpTransportOptions(config));
    LookupWorkflow workflow(resolver, transport, ToLookupOptions(config));

    auto report = workflow.Run(participant.Value());
    if (report.IsErr()) {
        formatter.PrintError(report.Error());
        return report.Error().ExitCode();
    }

    formatter.PrintReport(report.Value());
    return ExitCodeFor(report.Value());
}
