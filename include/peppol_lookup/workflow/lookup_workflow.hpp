#pragma once

#include <peppol_lookup/core/result.hpp>
#include <peppol_lookup/core/types.hpp>
#include <peppol_lookup/sml/i_dns_resolver.hpp>
#include <peppol_lookup/smp/i_http_transport.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace peppol_lookup {

/// SML root domain of the PEPPOL test network.
constexpr const char* kDefaultSmlDomain = "edelivery.tech.ec.europa.eu";

/// PEPPOL BIS Billing 3.0 document types.
constexpr const char* kBisBillingInvoice =
    "urn:oasis:names:specification:ubl:schema:xsd:Invoice-2::Invoice";
constexpr const char* kBisBillingCreditNote =
    "urn:oasis:names:specification:ubl:schema:xsd:CreditNote-2::CreditNote";

// ---------------------------------------------------------------------------
// LookupOptions — protocol parameters for one lookup.
// ---------------------------------------------------------------------------
struct LookupOptions {
    std::string sml_domain = kDefaultSmlDomain;
    bool use_https = false;
};

// ---------------------------------------------------------------------------
// BillingSupport — which BIS Billing 3.0 document types are accepted.
// ---------------------------------------------------------------------------
struct BillingSupport {
    bool invoice = false;
    bool credit_note = false;

    bool operator==(const BillingSupport& other) const {
        return invoice == other.invoice && credit_note == other.credit_note;
    }
};

/// Exact-string membership test of the two BIS Billing 3.0 identifiers.
[[nodiscard]] BillingSupport CheckBillingSupport(
    const std::vector<std::string>& document_types);

// ---------------------------------------------------------------------------
// LookupOutcome — the two non-error terminal states.
// ---------------------------------------------------------------------------
enum class LookupOutcome {
    Participant,     // SML record found, SMP answered
    NotParticipant,  // no SML record
};

// ---------------------------------------------------------------------------
// LookupReport — what a successful run found.
// hostname, smp_url, document_types and billing are only meaningful for
// LookupOutcome::Participant.
// ---------------------------------------------------------------------------
struct LookupReport {
    std::string participant;  // canonical "{icd}:{identifier}"
    LookupOutcome outcome = LookupOutcome::NotParticipant;
    std::string hostname;
    std::string smp_url;
    std::vector<std::string> document_types;
    BillingSupport billing;
    std::chrono::milliseconds elapsed{0};
};

/// Process exit codes for a successful run. Errors use Error::ExitCode().
constexpr int kExitSuccess = 0;
constexpr int kExitNotParticipant = 3;

/// 0 for a participant, 3 when the SML has no record.
[[nodiscard]] int ExitCodeFor(const LookupReport& report);

// ---------------------------------------------------------------------------
// LookupWorkflow — SML resolution followed by the SMP query.
//
//   resolve --NotFound--> NotParticipant (Ok)
//      |
//    Found --fetch fails--> Err
//      |                 (hashing failure is an Internal Err)
//      |
//    fetch ok --> Participant (Ok)
//
// Holds references only; resolver and transport must outlive the workflow.
// Run() keeps no state between calls.
// ---------------------------------------------------------------------------
class LookupWorkflow {
public:
    LookupWorkflow(IDnsResolver& resolver,
                   IHttpTransport& transport,
                   LookupOptions options);

    LookupWorkflow(const LookupWorkflow&) = delete;
    LookupWorkflow& operator=(const LookupWorkflow&) = delete;
    LookupWorkflow(LookupWorkflow&&) = delete;
    LookupWorkflow& operator=(LookupWorkflow&&) = delete;

    [[nodiscard]] Result<LookupReport, Error> Run(const ParticipantIdentifier& participant) const;

private:
    IDnsResolver& resolver_;
    IHttpTransport& transport_;
    LookupOptions options_;
};

} // namespace peppol_lookup
