#pragma once
// PostgreSQL exchange store
// Uses libpq (C API); one connection held for the whole run
#include "exchange_store.hpp"
#include <libpq-fe.h>

namespace ifx {

class PostgresStore : public ExchangeStore {
public:
    PostgresStore(std::string outbound_table, std::string inbound_table,
                  std::string ledger_table)
        : outbound_table_(std::move(outbound_table)),
          inbound_table_(std::move(inbound_table)),
          ledger_table_(std::move(ledger_table)) {}

    ~PostgresStore() override { disconnect(); }

    PostgresStore(const PostgresStore&) = delete;
    PostgresStore& operator=(const PostgresStore&) = delete;

    Status connect(const DbConnection& conn) override;
    void disconnect() override;
    [[nodiscard]] bool is_connected() const override;
    [[nodiscard]] const char* store_name() const override { return "postgres"; }

    // Override: use PQreset for faster reconnection (reuses connection params)
    Status reconnect(const DbConnection& conn) override;

    Status create_schema() override;

    Status select_pending(const std::string& no_period_operand,
                          std::vector<PendingRecord>& out) override;
    Status mark_sent(const std::vector<PendingRecord>& exported,
                     const std::string& file_name,
                     const std::string& sent_at,
                     int64_t& rows_updated) override;
    Status is_batch_sent(const std::string& file_name, bool& sent) override;

    Status is_file_imported(const std::string& file_name, bool& imported) override;
    Status record_import(const std::string& file_name, int64_t record_count) override;
    Status begin() override;
    Status commit() override;
    Status rollback() override;
    Status lock_file_name(const std::string& file_name) override;
    Status insert_record(const ImportedRecord& rec) override;

    // Text form of a PostgreSQL array literal: {"a","b"}
    static std::string to_pg_array(const std::vector<std::string>& values);

    // PENDING -> SENT for the exported row ids ($1 file, $2 sent_at, $3 ids)
    static std::string mark_sent_sql(const std::string& outbound_table);

private:
    std::string outbound_table_;
    std::string inbound_table_;
    std::string ledger_table_;
    PGconn* conn_ = nullptr;

    // Execute a statement without parameters
    Status exec(const char* sql);
    // Execute with text parameters; on success res holds the result (caller must PQclear)
    Status exec_params(const std::string& sql, const std::vector<std::string>& params,
                       PGresult** res = nullptr);
    // Map a failed command to CONNECTION (link lost) or PERSISTENCE
    Status failure(const char* what);
};

} // namespace ifx
