#pragma once

#include <peppol_lookup/core/result.hpp>
#include <peppol_lookup/workflow/lookup_workflow.hpp>

#include <iostream>
#include <string>

namespace peppol_lookup {

// ---------------------------------------------------------------------------
// OutputFormatter — human-readable and JSON rendering of lookup reports.
//
// Human mode follows the classic lookup layout:
//
//   SMP hostname: b-....iso6523-actorid-upis.edelivery.tech.ec.europa.eu
//
//   Supported document identifiers:
//   - urn:...
//
//   PEPPOL BIS Billing 3.0 Support:
//   - Supports Invoice
//
// In color mode the billing section is an FTXUI table instead.
// ---------------------------------------------------------------------------
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode, bool color_mode = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr)
        : json_mode_(json_mode), color_mode_(color_mode && !json_mode),
          out_(out), err_(err) {}

    // Print a lookup report (either outcome) to stdout.
    void PrintReport(const LookupReport& report) const;

    // Print an error to stderr.
    void PrintError(const Error& error) const;

private:
    void PrintParticipant(const LookupReport& report) const;
    void PrintBillingTable(const BillingSupport& billing) const;

    bool json_mode_;
    bool color_mode_;
    std::ostream& out_;
    std::ostream& err_;
};

// JSON document for a report; also used by PrintReport in JSON mode.
std::string ReportToJson(const LookupReport& report);

} // namespace peppol_lookup
