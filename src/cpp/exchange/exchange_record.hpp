#pragma once
// =============================================================================
// Record types exchanged with the partner system
//
//   PendingRecord  -- outbound row selected for export (status PENDING)
//   ImportedRecord -- one parsed line of a partner-supplied inbound file
//
// Dates travel as ISO "YYYY-MM-DD" strings between store and codec; the
// partner wire format uses "DD.MM.YYYY" in both directions.
// =============================================================================

#include <cstdint>
#include <string>

namespace ifx {

// Outbound status values stored in the outbound table
inline constexpr const char* kStatusPending = "PENDING";
inline constexpr const char* kStatusSent = "SENT";

struct PendingRecord {
    std::string installation;
    std::string operand;
    std::string start_date;      // YYYY-MM-DD
    std::string end_date;        // YYYY-MM-DD
    std::string allocation_unit;
    std::string period;          // Empty only for the no-period operand
    int64_t id = 0;              // Store row id; mark_sent updates exactly these rows
};

struct ImportedRecord {
    std::string bill_period;
    std::string account;
    std::string installation;
    std::string rate_group;
    std::string agreement_id;
    std::string reading_date;    // YYYY-MM-DD, converted from partner format
    double unit_value = 0.0;
    std::string source_file;     // Originating file name (ledger key)
};

} // namespace ifx
