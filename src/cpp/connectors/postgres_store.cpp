#include "postgres_store.hpp"
#include "../exchange/record_codec.hpp"
#include "../utils/logger.hpp"
#include <cstdlib>
#include <cstring>

namespace ifx {

Status PostgresStore::connect(const DbConnection& conn) {
    disconnect();

    std::string port = std::to_string(conn.port);
    std::string timeout = std::to_string(conn.connect_timeout_s);
    const char* keywords[] = {
        "host", "port", "dbname", "user", "password",
        "connect_timeout", "application_name", nullptr
    };
    const char* values[] = {
        conn.host.c_str(), port.c_str(), conn.database.c_str(),
        conn.user.c_str(), conn.password.c_str(),
        timeout.c_str(), "ifx-exchange", nullptr
    };

    conn_ = PQconnectdbParams(keywords, values, 0);
    if (PQstatus(conn_) != CONNECTION_OK) {
        std::string err = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        LOG_ERR("[postgres] Connection to %s:%u/%s failed: %s",
            conn.host.c_str(), conn.port, conn.database.c_str(), err.c_str());
        return Status::failure(ErrorKind::CONNECTION, "postgres connect failed: " + err);
    }

    LOG_INF("[postgres] Connected to %s:%u/%s (server %s)",
        conn.host.c_str(), conn.port, conn.database.c_str(),
        PQparameterStatus(conn_, "server_version"));
    return Status::success();
}

void PostgresStore::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PostgresStore::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

Status PostgresStore::reconnect(const DbConnection& conn) {
    if (conn_) {
        PQreset(conn_);
        if (PQstatus(conn_) == CONNECTION_OK) {
            LOG_INF("[postgres] PQreset successful (server %s)",
                PQparameterStatus(conn_, "server_version"));
            return Status::success();
        }
        LOG_WRN("[postgres] PQreset failed: %s -- falling back to full reconnect",
            PQerrorMessage(conn_));
    }
    return connect(conn);
}

Status PostgresStore::failure(const char* what) {
    std::string err = conn_ ? PQerrorMessage(conn_) : "not connected";
    if (!is_connected()) {
        return Status::failure(ErrorKind::CONNECTION,
            std::string(what) + ": connection lost: " + err);
    }
    return Status::failure(ErrorKind::PERSISTENCE, std::string(what) + ": " + err);
}

Status PostgresStore::exec(const char* sql) {
    if (!conn_) return failure("statement");
    PGresult* res = PQexec(conn_, sql);
    bool ok = (PQresultStatus(res) == PGRES_COMMAND_OK ||
               PQresultStatus(res) == PGRES_TUPLES_OK);
    PQclear(res);
    if (!ok) {
        LOG_ERR("[postgres] SQL error: %s\n  SQL: %s", PQerrorMessage(conn_), sql);
        return failure("statement");
    }
    return Status::success();
}

Status PostgresStore::exec_params(const std::string& sql, const std::vector<std::string>& params,
                                  PGresult** out) {
    if (!conn_) return failure("query");

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) values.push_back(p.c_str());

    PGresult* res = PQexecParams(conn_, sql.c_str(), static_cast<int>(values.size()),
        nullptr, values.data(), nullptr, nullptr, 0);
    ExecStatusType st = PQresultStatus(res);
    if (st != PGRES_COMMAND_OK && st != PGRES_TUPLES_OK) {
        LOG_ERR("[postgres] SQL error: %s\n  SQL: %s", PQerrorMessage(conn_), sql.c_str());
        PQclear(res);
        return failure("query");
    }

    if (out) {
        *out = res;
    } else {
        PQclear(res);
    }
    return Status::success();
}

std::string PostgresStore::to_pg_array(const std::vector<std::string>& values) {
    std::string out = "{";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ',';
        out += '"';
        for (char c : values[i]) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        out += '"';
    }
    out += '}';
    return out;
}

// --- Schema ---

Status PostgresStore::create_schema() {
    LOG_INF("[postgres] Creating exchange tables %s, %s, %s",
        outbound_table_.c_str(), inbound_table_.c_str(), ledger_table_.c_str());

    std::string sql =
        "CREATE TABLE IF NOT EXISTS " + outbound_table_ + " ("
        "  id BIGSERIAL PRIMARY KEY,"
        "  installation TEXT NOT NULL,"
        "  operand TEXT NOT NULL,"
        "  start_date DATE NOT NULL,"
        "  end_date DATE NOT NULL,"
        "  allocation_unit TEXT NOT NULL,"
        "  period TEXT,"
        "  status TEXT NOT NULL DEFAULT 'PENDING' CHECK (status IN ('PENDING', 'SENT')),"
        "  sent_file_name TEXT,"
        "  sent_at TIMESTAMP"
        ")";
    Status s = exec(sql.c_str());
    if (!s.ok()) return s;

    // Index names cannot be schema-qualified
    std::string out_idx = outbound_table_;
    std::string in_idx = inbound_table_;
    for (auto& c : out_idx) if (c == '.') c = '_';
    for (auto& c : in_idx) if (c == '.') c = '_';

    sql = "CREATE INDEX IF NOT EXISTS " + out_idx + "_status_idx ON " +
          outbound_table_ + " (status)";
    s = exec(sql.c_str());
    if (!s.ok()) return s;

    sql = "CREATE TABLE IF NOT EXISTS " + inbound_table_ + " ("
        "  id BIGSERIAL PRIMARY KEY,"
        "  bill_period TEXT NOT NULL,"
        "  account TEXT NOT NULL,"
        "  installation TEXT NOT NULL,"
        "  rate_group TEXT NOT NULL,"
        "  agreement_id TEXT NOT NULL,"
        "  reading_date DATE NOT NULL,"
        "  unit_value DOUBLE PRECISION NOT NULL,"
        "  source_file TEXT NOT NULL,"
        "  imported_at TIMESTAMPTZ NOT NULL DEFAULT now()"
        ")";
    s = exec(sql.c_str());
    if (!s.ok()) return s;

    sql = "CREATE INDEX IF NOT EXISTS " + in_idx + "_source_file_idx ON " +
          inbound_table_ + " (source_file)";
    s = exec(sql.c_str());
    if (!s.ok()) return s;

    // Primary key turns a concurrent double import into a failed commit
    sql = "CREATE TABLE IF NOT EXISTS " + ledger_table_ + " ("
        "  file_name TEXT PRIMARY KEY,"
        "  record_count BIGINT NOT NULL,"
        "  imported_at TIMESTAMPTZ NOT NULL DEFAULT now()"
        ")";
    return exec(sql.c_str());
}

// --- Outbound ---

Status PostgresStore::select_pending(const std::string& no_period_operand,
                                     std::vector<PendingRecord>& out) {
    std::string sql =
        "SELECT id, installation, operand,"
        "  to_char(start_date, 'YYYY-MM-DD'), to_char(end_date, 'YYYY-MM-DD'),"
        "  allocation_unit, COALESCE(period, '')"
        " FROM " + outbound_table_ +
        " WHERE status = 'PENDING'"
        " ORDER BY installation,"
        "  CASE WHEN operand = $1 THEN 0 ELSE 1 END,"
        "  start_date";

    PGresult* res = nullptr;
    Status s = exec_params(sql, {no_period_operand}, &res);
    if (!s.ok()) return s;

    out.clear();
    int nrows = PQntuples(res);
    out.reserve(nrows);
    for (int i = 0; i < nrows; ++i) {
        PendingRecord r;
        r.id = std::strtoll(PQgetvalue(res, i, 0), nullptr, 10);
        r.installation = PQgetvalue(res, i, 1);
        r.operand = PQgetvalue(res, i, 2);
        r.start_date = PQgetvalue(res, i, 3);
        r.end_date = PQgetvalue(res, i, 4);
        r.allocation_unit = PQgetvalue(res, i, 5);
        r.period = PQgetvalue(res, i, 6);
        out.push_back(std::move(r));
    }
    PQclear(res);

    LOG_DBG("[postgres] %d pending rows in %s", nrows, outbound_table_.c_str());
    return Status::success();
}

std::string PostgresStore::mark_sent_sql(const std::string& outbound_table) {
    // Single statement: the PENDING -> SENT transition is atomic for readers.
    // Keyed on row id so rows inserted after the select are never stamped.
    return "UPDATE " + outbound_table +
           " SET status = 'SENT', sent_file_name = $1, sent_at = $2::timestamp"
           " WHERE id = ANY($3::bigint[]) AND status = 'PENDING'";
}

Status PostgresStore::mark_sent(const std::vector<PendingRecord>& exported,
                                const std::string& file_name,
                                const std::string& sent_at,
                                int64_t& rows_updated) {
    std::vector<std::string> ids;
    ids.reserve(exported.size());
    for (const auto& r : exported) ids.push_back(std::to_string(r.id));

    PGresult* res = nullptr;
    Status s = exec_params(mark_sent_sql(outbound_table_),
        {file_name, sent_at, to_pg_array(ids)}, &res);
    if (!s.ok()) return s;

    rows_updated = std::strtoll(PQcmdTuples(res), nullptr, 10);
    PQclear(res);
    return Status::success();
}

Status PostgresStore::is_batch_sent(const std::string& file_name, bool& sent) {
    std::string sql = "SELECT 1 FROM " + outbound_table_ +
                      " WHERE sent_file_name = $1 AND status = 'SENT' LIMIT 1";
    PGresult* res = nullptr;
    Status s = exec_params(sql, {file_name}, &res);
    if (!s.ok()) return s;
    sent = PQntuples(res) > 0;
    PQclear(res);
    return Status::success();
}

// --- Inbound ledger ---

Status PostgresStore::is_file_imported(const std::string& file_name, bool& imported) {
    std::string sql = "SELECT 1 FROM " + ledger_table_ + " WHERE file_name = $1";
    PGresult* res = nullptr;
    Status s = exec_params(sql, {file_name}, &res);
    if (!s.ok()) return s;
    imported = PQntuples(res) > 0;
    PQclear(res);
    return Status::success();
}

Status PostgresStore::record_import(const std::string& file_name, int64_t record_count) {
    std::string sql = "INSERT INTO " + ledger_table_ +
                      " (file_name, record_count) VALUES ($1, $2::bigint)";
    return exec_params(sql, {file_name, std::to_string(record_count)});
}

Status PostgresStore::begin() { return exec("BEGIN"); }

Status PostgresStore::commit() { return exec("COMMIT"); }

Status PostgresStore::rollback() { return exec("ROLLBACK"); }

Status PostgresStore::lock_file_name(const std::string& file_name) {
    // Released automatically at COMMIT/ROLLBACK
    return exec_params("SELECT pg_advisory_xact_lock(hashtext($1))", {file_name});
}

Status PostgresStore::insert_record(const ImportedRecord& rec) {
    std::string sql =
        "INSERT INTO " + inbound_table_ +
        " (bill_period, account, installation, rate_group, agreement_id,"
        "  reading_date, unit_value, source_file)"
        " VALUES ($1, $2, $3, $4, $5, $6::date, $7::double precision, $8)";

    return exec_params(sql,
        {rec.bill_period, rec.account, rec.installation, rec.rate_group,
         rec.agreement_id, rec.reading_date, RecordCodec::format_decimal(rec.unit_value),
         rec.source_file});
}

} // namespace ifx
