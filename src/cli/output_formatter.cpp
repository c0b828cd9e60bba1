#include <peppol_lookup/cli/output_formatter.hpp>
#include <peppol_lookup/core/ansi.hpp>

#include <nlohmann/json.hpp>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

#include <vector>

namespace peppol_lookup {

namespace {

using namespace peppol_lookup::ansi;

const char* OutcomeName(LookupOutcome outcome) {
    switch (outcome) {
        case LookupOutcome::Participant:    return "participant";
        case LookupOutcome::NotParticipant: return "not_participant";
    }
    return "unknown";
}

} // anonymous namespace

std::string ReportToJson(const LookupReport& report) {
    const bool registered = report.outcome == LookupOutcome::Participant;
    nlohmann::json j = {
        {"participant", report.participant},
        {"outcome", OutcomeName(report.outcome)},
        {"registered", registered},
        {"elapsed_ms", report.elapsed.count()},
    };
    if (registered) {
        j["hostname"] = report.hostname;
        j["smp_url"] = report.smp_url;
        j["document_types"] = report.document_types;
        j["bis_billing"] = {
            {"invoice", report.billing.invoice},
            {"credit_note", report.billing.credit_note},
        };
    }
    return j.dump();
}

void OutputFormatter::PrintReport(const LookupReport& report) const {
    if (json_mode_) {
        out_ << ReportToJson(report) << "\n";
        return;
    }

    if (report.outcome == LookupOutcome::NotParticipant) {
        if (color_mode_) {
            out_ << kYellow << "Not a PEPPOL participant: " << kReset
                 << kBold << report.participant << kReset << "\n";
        } else {
            out_ << "Not a PEPPOL participant: " << report.participant << "\n";
        }
        return;
    }

    PrintParticipant(report);
}

void OutputFormatter::PrintParticipant(const LookupReport& report) const {
    if (color_mode_) {
        out_ << kBold << "SMP hostname: " << kReset << kCyan << report.hostname
             << kReset << "\n";
    } else {
        out_ << "SMP hostname: " << report.hostname << "\n";
    }

    out_ << "\nSupported document identifiers:\n";
    if (report.document_types.empty()) {
        out_ << (color_mode_ ? kDim : "") << "(none)" << (color_mode_ ? kReset : "")
             << "\n";
    }
    for (const auto& doc_type : report.document_types) {
        out_ << "- " << doc_type << "\n";
    }

    out_ << "\nPEPPOL BIS Billing 3.0 Support:\n";
    if (color_mode_) {
        PrintBillingTable(report.billing);
        return;
    }
    if (report.billing.invoice) {
        out_ << "- Supports Invoice\n";
    }
    if (report.billing.credit_note) {
        out_ << "- Supports Credit Note\n";
    }
}

void OutputFormatter::PrintBillingTable(const BillingSupport& billing) const {
    const auto yes_no = [](bool supported) {
        return std::string(supported ? "yes" : "no");
    };
    std::vector<std::vector<std::string>> rows = {
        {"Document", "Identifier", "Supported"},
        {"Invoice", kBisBillingInvoice, yes_no(billing.invoice)},
        {"Credit Note", kBisBillingCreditNote, yes_no(billing.credit_note)},
    };

    auto table = ftxui::Table(rows);
    table.SelectRow(0).Decorate(ftxui::bold);
    table.SelectRow(0).BorderBottom(ftxui::LIGHT);
    table.SelectColumn(2).DecorateCells(ftxui::center);

    auto element = table.Render();
    auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(element));
    ftxui::Render(screen, element);
    out_ << screen.ToString() << "\n";
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }
    if (color_mode_) {
        err_ << kRed << "Error: " << kReset << error.ToString() << "\n";
    } else {
        err_ << "Error: " << error.ToString() << "\n";
    }
}

} // namespace peppol_lookup
