#include "record_codec.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <sstream>

namespace ifx {

namespace {

bool all_digits(const std::string& s, size_t pos, size_t len) {
    if (pos + len > s.size()) return false;
    for (size_t i = pos; i < pos + len; ++i) {
        if (s[i] < '0' || s[i] > '9') return false;
    }
    return true;
}

int to_int(const std::string& s, size_t pos, size_t len) {
    int v = 0;
    for (size_t i = pos; i < pos + len; ++i) v = v * 10 + (s[i] - '0');
    return v;
}

bool valid_calendar_date(int year, int month, int day) {
    static const int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (year < 1 || month < 1 || month > 12 || day < 1) return false;
    int max_day = days_in_month[month - 1];
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    if (month == 2 && leap) max_day = 29;
    return day <= max_day;
}

} // namespace

// ============================================================================
// Primitive helpers
// ============================================================================

std::vector<std::string> RecordCodec::split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t tab = line.find('\t', start);
        if (tab == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    return fields;
}

bool RecordCodec::partner_to_iso_date(const std::string& partner, std::string& iso) {
    // DD.MM.YYYY
    if (partner.size() != 10 || partner[2] != '.' || partner[5] != '.') return false;
    if (!all_digits(partner, 0, 2) || !all_digits(partner, 3, 2) || !all_digits(partner, 6, 4))
        return false;

    int day = to_int(partner, 0, 2);
    int month = to_int(partner, 3, 2);
    int year = to_int(partner, 6, 4);
    if (!valid_calendar_date(year, month, day)) return false;

    iso = partner.substr(6, 4) + "-" + partner.substr(3, 2) + "-" + partner.substr(0, 2);
    return true;
}

bool RecordCodec::iso_to_partner_date(const std::string& iso, std::string& partner) {
    // YYYY-MM-DD
    if (iso.size() != 10 || iso[4] != '-' || iso[7] != '-') return false;
    if (!all_digits(iso, 0, 4) || !all_digits(iso, 5, 2) || !all_digits(iso, 8, 2))
        return false;

    int year = to_int(iso, 0, 4);
    int month = to_int(iso, 5, 2);
    int day = to_int(iso, 8, 2);
    if (!valid_calendar_date(year, month, day)) return false;

    partner = iso.substr(8, 2) + "." + iso.substr(5, 2) + "." + iso.substr(0, 4);
    return true;
}

bool RecordCodec::parse_decimal(const std::string& s, double& out) {
    if (s.empty()) return false;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    double v = 0.0;
    auto [ptr, ec] = std::from_chars(first, last, v, std::chars_format::general);
    if (ec != std::errc() || ptr != last) return false;
    if (!std::isfinite(v)) return false;
    out = v;
    return true;
}

std::string RecordCodec::format_decimal(double v) {
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    if (ec != std::errc()) return "0";
    return std::string(buf, ptr);
}

// ============================================================================
// Outbound
// ============================================================================

bool RecordCodec::export_order_less(const PendingRecord& a, const PendingRecord& b) const {
    if (a.installation != b.installation) return a.installation < b.installation;

    int pa = a.operand == no_period_operand_ ? 0 : 1;
    int pb = b.operand == no_period_operand_ ? 0 : 1;
    if (pa != pb) return pa < pb;

    // ISO dates compare correctly as strings
    return a.start_date < b.start_date;
}

void RecordCodec::sort_for_export(std::vector<PendingRecord>& records) const {
    std::stable_sort(records.begin(), records.end(),
        [this](const PendingRecord& a, const PendingRecord& b) {
            return export_order_less(a, b);
        });
}

Status RecordCodec::encode(const PendingRecord& rec, std::string& line) const {
    std::string start, end;
    if (!iso_to_partner_date(rec.start_date, start)) {
        return Status::failure(ErrorKind::VALIDATION,
            "installation " + rec.installation + ": invalid start date '" + rec.start_date + "'");
    }
    if (!iso_to_partner_date(rec.end_date, end)) {
        return Status::failure(ErrorKind::VALIDATION,
            "installation " + rec.installation + ": invalid end date '" + rec.end_date + "'");
    }

    bool with_period = rec.operand != no_period_operand_;
    if (with_period && rec.period.empty()) {
        return Status::failure(ErrorKind::VALIDATION,
            "installation " + rec.installation + ": operand " + rec.operand +
            " requires a period");
    }

    line = rec.installation + '\t' + rec.operand + '\t' + start + '\t' + end + '\t' +
           rec.allocation_unit;
    if (with_period) {
        line += '\t';
        line += rec.period;
    }
    return Status::success();
}

Status RecordCodec::decode_outbound(const std::string& line, PendingRecord& rec) const {
    auto fields = split_tabs(line);
    if (fields.size() < 5) {
        return Status::failure(ErrorKind::VALIDATION,
            "expected at least 5 fields, got " + std::to_string(fields.size()));
    }

    size_t expected = fields[1] == no_period_operand_ ? 5 : 6;
    if (fields.size() != expected) {
        return Status::failure(ErrorKind::VALIDATION,
            "operand " + fields[1] + " expects " + std::to_string(expected) +
            " fields, got " + std::to_string(fields.size()));
    }

    PendingRecord r;
    r.installation = fields[0];
    r.operand = fields[1];
    if (!partner_to_iso_date(fields[2], r.start_date) ||
        !partner_to_iso_date(fields[3], r.end_date)) {
        return Status::failure(ErrorKind::VALIDATION,
            "invalid date in '" + fields[2] + "' / '" + fields[3] + "'");
    }
    r.allocation_unit = fields[4];
    if (expected == 6) r.period = fields[5];

    rec = std::move(r);
    return Status::success();
}

// ============================================================================
// Inbound
// ============================================================================

Status RecordCodec::decode_inbound(const std::string& line, const std::string& source_file,
                                   ImportedRecord& rec) {
    auto fields = split_tabs(line);
    if (fields.size() < 7) {
        return Status::failure(ErrorKind::VALIDATION,
            "expected at least 7 tab-separated fields, got " + std::to_string(fields.size()));
    }

    ImportedRecord r;
    r.bill_period = fields[0];
    r.account = fields[1];
    r.installation = fields[2];
    r.rate_group = fields[3];
    r.agreement_id = fields[4];

    if (!partner_to_iso_date(fields[5], r.reading_date)) {
        return Status::failure(ErrorKind::VALIDATION,
            "reading date '" + fields[5] + "' does not match DD.MM.YYYY");
    }
    if (!parse_decimal(fields[6], r.unit_value)) {
        return Status::failure(ErrorKind::VALIDATION,
            "unit value '" + fields[6] + "' is not a decimal number");
    }

    r.source_file = source_file;
    rec = std::move(r);
    return Status::success();
}

Status RecordCodec::decode_inbound_file(const std::string& content, const std::string& source_file,
                                        std::vector<ImportedRecord>& records) {
    std::vector<ImportedRecord> parsed;
    std::istringstream iss(content);
    std::string line;
    size_t line_no = 0;

    while (std::getline(iss, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        ImportedRecord rec;
        Status s = decode_inbound(line, source_file, rec);
        if (!s.ok()) {
            s.error = source_file + " line " + std::to_string(line_no) + ": " + s.error;
            return s;
        }
        parsed.push_back(std::move(rec));
    }

    records = std::move(parsed);
    return Status::success();
}

} // namespace ifx
