#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <fstream>
#include <nlohmann/json.hpp>
#include "utils/status.hpp"

namespace ifx {

// Which pipelines a run executes
enum class RunMode { OUTBOUND, INBOUND, BOTH };

inline const char* run_mode_str(RunMode m) {
    switch (m) {
        case RunMode::OUTBOUND: return "outbound";
        case RunMode::INBOUND:  return "inbound";
        case RunMode::BOTH:     return "both";
    }
    return "??";
}

inline bool parse_run_mode(const std::string& s, RunMode& out) {
    if (s == "outbound") { out = RunMode::OUTBOUND; return true; }
    if (s == "inbound")  { out = RunMode::INBOUND;  return true; }
    if (s == "both")     { out = RunMode::BOTH;     return true; }
    return false;
}

// Fixed-wait retry for every remote operation (no backoff growth)
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds wait{5000};
};

// Relational store connection
struct DbConnection {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string user;
    std::string password;
    std::string database = "exchange";
    int connect_timeout_s = 10;
};

// Partner FTP endpoint; empty user means anonymous login
struct FtpConfig {
    std::string host;
    uint16_t port = 21;
    std::string user;
    std::string password;
    std::string remote_root;  // Prefix for every remote path
    bool passive = true;
    long timeout_s = 60;
};

struct OutboundConfig {
    std::string table = "exchange_outbound";
    std::string remote_dir = "/out";
    std::string staging_dir = "/var/lib/ifx/outbound";
    std::string archive_dir = "/var/lib/ifx/archive/outbound";
    std::string file_prefix = "EXPORT";
    std::string file_ext = "txt";
    std::string marker_ext = "ok";
    std::string sequence_suffix = "0001";
    std::string no_period_operand = "LP";  // Operand exported without period field
};

struct InboundConfig {
    std::string table = "exchange_inbound";
    std::string ledger_table = "exchange_import_ledger";  // One row per imported file
    std::string remote_dir = "/in";
    std::string completed_subdir = "completed";
    std::string file_pattern = "*.txt";
    std::string marker_ext = "ok";
    std::string staging_dir = "/var/lib/ifx/inbound";
    std::string archive_dir = "/var/lib/ifx/archive/inbound";
};

// Full exchange configuration, passed explicitly into every component
struct ExchangeConfig {
    DbConnection database;
    FtpConfig ftp;
    RetryPolicy retry;
    OutboundConfig outbound;
    InboundConfig inbound;

    std::string report_dir = "/var/lib/ifx/reports";
    std::string log_file;           // Empty: stderr only
    std::string log_level = "info";

    // Checks values that would otherwise fail late (mid-run)
    [[nodiscard]] Status validate() const;

    static Status from_json(const std::string& path, ExchangeConfig& out);
};

// Table names are interpolated into SQL text, only plain identifiers allowed
inline bool is_sql_identifier(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '_' || c == '.';
        if (!ok) return false;
    }
    return !(s[0] >= '0' && s[0] <= '9');
}

inline Status ExchangeConfig::validate() const {
    auto bad = [](const std::string& what) {
        return Status::failure(ErrorKind::CONFIGURATION, what);
    };

    if (ftp.host.empty()) return bad("ftp.host is required");
    if (retry.max_attempts < 1) return bad("retry.max_attempts must be >= 1");
    if (retry.wait.count() < 0) return bad("retry.wait_s must not be negative");
    if (!is_sql_identifier(outbound.table)) return bad("outbound.table is not a valid identifier");
    if (!is_sql_identifier(inbound.table)) return bad("inbound.table is not a valid identifier");
    if (!is_sql_identifier(inbound.ledger_table))
        return bad("inbound.ledger_table is not a valid identifier");
    if (outbound.sequence_suffix.empty() ||
        outbound.sequence_suffix.find_first_not_of("0123456789") != std::string::npos)
        return bad("outbound.sequence_suffix must be digits");
    if (outbound.file_prefix.empty()) return bad("outbound.file_prefix is required");
    if (outbound.marker_ext.empty() || inbound.marker_ext.empty())
        return bad("marker_ext is required");
    if (outbound.marker_ext == outbound.file_ext)
        return bad("outbound.marker_ext must differ from outbound.file_ext");
    if (outbound.no_period_operand.empty()) return bad("outbound.no_period_operand is required");
    if (outbound.staging_dir.empty() || outbound.archive_dir.empty() ||
        inbound.staging_dir.empty() || inbound.archive_dir.empty())
        return bad("staging and archive directories are required");
    if (inbound.file_pattern.empty()) return bad("inbound.file_pattern is required");
    if (inbound.completed_subdir.empty() ||
        inbound.completed_subdir.find('/') != std::string::npos)
        return bad("inbound.completed_subdir must be a single directory name");
    return Status::success();
}

inline Status ExchangeConfig::from_json(const std::string& path, ExchangeConfig& out) {
    std::ifstream f(path);
    if (!f.is_open()) {
        return Status::failure(ErrorKind::CONFIGURATION, "cannot open config file " + path);
    }

    ExchangeConfig cfg;
    try {
        nlohmann::json j;
        f >> j;

        if (j.contains("database")) {
            const auto& d = j["database"];
            cfg.database.host = d.value("host", cfg.database.host);
            cfg.database.port = d.value("port", cfg.database.port);
            cfg.database.user = d.value("user", cfg.database.user);
            cfg.database.password = d.value("password", cfg.database.password);
            cfg.database.database = d.value("database", cfg.database.database);
            cfg.database.connect_timeout_s = d.value("connect_timeout_s", cfg.database.connect_timeout_s);
        }

        if (j.contains("ftp")) {
            const auto& x = j["ftp"];
            cfg.ftp.host = x.value("host", cfg.ftp.host);
            cfg.ftp.port = x.value("port", cfg.ftp.port);
            cfg.ftp.user = x.value("user", cfg.ftp.user);
            cfg.ftp.password = x.value("password", cfg.ftp.password);
            cfg.ftp.remote_root = x.value("remote_root", cfg.ftp.remote_root);
            cfg.ftp.passive = x.value("passive", cfg.ftp.passive);
            cfg.ftp.timeout_s = x.value("timeout_s", cfg.ftp.timeout_s);
        }

        if (j.contains("retry")) {
            cfg.retry.max_attempts = j["retry"].value("max_attempts", cfg.retry.max_attempts);
            double wait_s = j["retry"].value("wait_s",
                std::chrono::duration<double>(cfg.retry.wait).count());
            cfg.retry.wait = std::chrono::milliseconds(static_cast<int64_t>(wait_s * 1000.0));
        }

        if (j.contains("outbound")) {
            const auto& o = j["outbound"];
            cfg.outbound.table = o.value("table", cfg.outbound.table);
            cfg.outbound.remote_dir = o.value("remote_dir", cfg.outbound.remote_dir);
            cfg.outbound.staging_dir = o.value("staging_dir", cfg.outbound.staging_dir);
            cfg.outbound.archive_dir = o.value("archive_dir", cfg.outbound.archive_dir);
            cfg.outbound.file_prefix = o.value("file_prefix", cfg.outbound.file_prefix);
            cfg.outbound.file_ext = o.value("file_ext", cfg.outbound.file_ext);
            cfg.outbound.marker_ext = o.value("marker_ext", cfg.outbound.marker_ext);
            cfg.outbound.sequence_suffix = o.value("sequence_suffix", cfg.outbound.sequence_suffix);
            cfg.outbound.no_period_operand = o.value("no_period_operand", cfg.outbound.no_period_operand);
        }

        if (j.contains("inbound")) {
            const auto& i = j["inbound"];
            cfg.inbound.table = i.value("table", cfg.inbound.table);
            cfg.inbound.ledger_table = i.value("ledger_table", cfg.inbound.ledger_table);
            cfg.inbound.remote_dir = i.value("remote_dir", cfg.inbound.remote_dir);
            cfg.inbound.completed_subdir = i.value("completed_subdir", cfg.inbound.completed_subdir);
            cfg.inbound.file_pattern = i.value("file_pattern", cfg.inbound.file_pattern);
            cfg.inbound.marker_ext = i.value("marker_ext", cfg.inbound.marker_ext);
            cfg.inbound.staging_dir = i.value("staging_dir", cfg.inbound.staging_dir);
            cfg.inbound.archive_dir = i.value("archive_dir", cfg.inbound.archive_dir);
        }

        cfg.report_dir = j.value("report_dir", cfg.report_dir);
        cfg.log_file = j.value("log_file", cfg.log_file);
        cfg.log_level = j.value("log_level", cfg.log_level);
    } catch (const nlohmann::json::exception& e) {
        return Status::failure(ErrorKind::CONFIGURATION,
            "malformed config " + path + ": " + e.what());
    }

    Status v = cfg.validate();
    if (!v.ok()) return v;

    out = std::move(cfg);
    return Status::success();
}

} // namespace ifx
