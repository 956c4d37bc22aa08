#pragma once
// Converts between store rows and the partner's tab-delimited line format.
//
// Outbound line (5 or 6 fields):
//   installation \t operand \t start(dd.mm.yyyy) \t end(dd.mm.yyyy) \t unit [\t period]
// The period field is omitted iff operand equals the no-period operand.
//
// Inbound line (>= 7 fields):
//   bill_period \t account \t installation \t rate_group \t agreement \t date \t value
#include <string>
#include <utility>
#include <vector>
#include "exchange_record.hpp"
#include "../utils/status.hpp"

namespace ifx {

class RecordCodec {
public:
    explicit RecordCodec(std::string no_period_operand)
        : no_period_operand_(std::move(no_period_operand)) {}

    // Export ordering: installation asc, no-period operand first, start date asc
    [[nodiscard]] bool export_order_less(const PendingRecord& a, const PendingRecord& b) const;
    void sort_for_export(std::vector<PendingRecord>& records) const;

    // Encode one PendingRecord into a line (no trailing newline)
    Status encode(const PendingRecord& rec, std::string& line) const;

    // Inverse of encode; used to verify a written batch file
    Status decode_outbound(const std::string& line, PendingRecord& rec) const;

    // Decode one inbound partner line, stamping source_file
    static Status decode_inbound(const std::string& line, const std::string& source_file,
                                 ImportedRecord& rec);

    // Parse a complete inbound file body; any bad line fails the whole file.
    // Empty lines are skipped, CRLF endings accepted.
    static Status decode_inbound_file(const std::string& content, const std::string& source_file,
                                      std::vector<ImportedRecord>& records);

    [[nodiscard]] const std::string& no_period_operand() const { return no_period_operand_; }

    // Date helpers: both validate the calendar date
    static bool partner_to_iso_date(const std::string& partner, std::string& iso);
    static bool iso_to_partner_date(const std::string& iso, std::string& partner);

    // Locale-independent decimal parse, entire token must be consumed
    static bool parse_decimal(const std::string& s, double& out);
    static std::string format_decimal(double v);

    static std::vector<std::string> split_tabs(const std::string& line);

private:
    std::string no_period_operand_;
};

} // namespace ifx
