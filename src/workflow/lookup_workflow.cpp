#include <peppol_lookup/workflow/lookup_workflow.hpp>
#include <peppol_lookup/core/log.hpp>
#include <peppol_lookup/sml/directory_resolver.hpp>
#include <peppol_lookup/smp/metadata_client.hpp>

#include <algorithm>
#include <exception>
#include <optional>

namespace peppol_lookup {

namespace {

bool Contains(const std::vector<std::string>& values, const char* needle) {
    return std::find(values.begin(), values.end(), needle) != values.end();
}

std::chrono::milliseconds ElapsedSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

} // anonymous namespace

BillingSupport CheckBillingSupport(const std::vector<std::string>& document_types) {
    return BillingSupport{Contains(document_types, kBisBillingInvoice),
                          Contains(document_types, kBisBillingCreditNote)};
}

int ExitCodeFor(const LookupReport& report) {
    return report.outcome == LookupOutcome::Participant ? kExitSuccess : kExitNotParticipant;
}

LookupWorkflow::LookupWorkflow(IDnsResolver& resolver,
                               IHttpTransport& transport,
                               LookupOptions options)
    : resolver_(resolver), transport_(transport), options_(std::move(options)) {}

Result<LookupReport, Error> LookupWorkflow::Run(const ParticipantIdentifier& participant) const {
    const auto start = std::chrono::steady_clock::now();

    LookupReport report;
    report.participant = participant.Canonical();

    std::optional<LookupResult> resolved;
    try {
        resolved = ResolveParticipant(resolver_, participant, options_.sml_domain);
    } catch (const std::exception& e) {
        return Result<LookupReport, Error>::Err(Error{
            "LookupWorkflow", "", std::nullopt,
            std::string("participant resolution failed: ") + e.what(),
            ErrorCategory::Internal});
    }
    const auto& lookup = *resolved;
    if (lookup.IsNotFound()) {
        LogInfo("lookup", report.participant + " is not registered in " + options_.sml_domain);
        report.outcome = LookupOutcome::NotParticipant;
        report.elapsed = ElapsedSince(start);
        return Result<LookupReport, Error>::Ok(std::move(report));
    }

    report.hostname = lookup.Hostname();
    report.smp_url = BuildMetadataUrl(report.hostname, participant, options_.use_https);

    auto document_types = FetchDocumentTypes(transport_, report.hostname, participant,
                                             options_.use_https);
    if (document_types.IsErr()) {
        LogDebug("lookup", document_types.Error().ToString());
        return Result<LookupReport, Error>::Err(std::move(document_types).Error());
    }

    report.outcome = LookupOutcome::Participant;
    report.document_types = std::move(document_types).Value();
    report.billing = CheckBillingSupport(report.document_types);
    report.elapsed = ElapsedSince(start);
    LogInfo("lookup", report.participant + ": " +
                          std::to_string(report.document_types.size()) +
                          " document type(s) in " + std::to_string(report.elapsed.count()) +
                          " ms");
    return Result<LookupReport, Error>::Ok(std::move(report));
}

} // namespace peppol_lookup
