#pragma once
// Abstract relational store behind both pipelines.
//
// Outbound table: candidates with status PENDING -> SENT.
// Inbound table:  imported records; its source_file column is the ledger
//                 that decides whether a partner file was already applied.
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>
#include "../config.hpp"
#include "../exchange/exchange_record.hpp"
#include "../utils/logger.hpp"
#include "../utils/status.hpp"

namespace ifx {

class ExchangeStore {
public:
    virtual ~ExchangeStore() = default;

    virtual Status connect(const DbConnection& conn) = 0;
    virtual void disconnect() = 0;
    [[nodiscard]] virtual bool is_connected() const = 0;
    [[nodiscard]] virtual const char* store_name() const = 0;

    // Create the outbound, inbound and ledger tables if missing
    virtual Status create_schema() = 0;

    // --- Outbound ---

    // All PENDING rows, ordered installation / no-period operand first / start date
    virtual Status select_pending(const std::string& no_period_operand,
                                  std::vector<PendingRecord>& out) = 0;

    // One set-based UPDATE: exported rows (by id) still PENDING -> SENT,
    // stamped with file_name and sent_at ("YYYY-MM-DD HH:MM:SS")
    virtual Status mark_sent(const std::vector<PendingRecord>& exported,
                             const std::string& file_name,
                             const std::string& sent_at,
                             int64_t& rows_updated) = 0;

    // True if any row was acknowledged under this batch file name
    virtual Status is_batch_sent(const std::string& file_name, bool& sent) = 0;

    // --- Inbound ledger ---

    // One ledger entry per committed file name, including files without records
    virtual Status is_file_imported(const std::string& file_name, bool& imported) = 0;
    // Adds the ledger entry; must run inside the file's transaction.
    // A second entry for the same name fails (unique file name).
    virtual Status record_import(const std::string& file_name, int64_t record_count) = 0;

    virtual Status begin() = 0;
    virtual Status commit() = 0;
    virtual Status rollback() = 0;

    // Serializes ledger-check-then-insert for one file name until the
    // surrounding transaction ends
    virtual Status lock_file_name(const std::string& file_name) = 0;

    virtual Status insert_record(const ImportedRecord& rec) = 0;

    // Connection resilience: default disconnect + connect
    virtual Status reconnect(const DbConnection& conn) {
        disconnect();
        return connect(conn);
    }

    // Connect (or verify the connection) with the run's fixed-wait retry policy
    Status ensure_connected(const DbConnection& conn, const RetryPolicy& policy) {
        if (is_connected()) return Status::success();

        Status last;
        for (int attempt = 1; attempt <= policy.max_attempts; ++attempt) {
            if (attempt > 1) {
                LOG_WRN("[%s] Connect attempt %d/%d in %lld ms...",
                    store_name(), attempt, policy.max_attempts,
                    static_cast<long long>(policy.wait.count()));
                std::this_thread::sleep_for(policy.wait);
            }
            last = reconnect(conn);
            if (last.ok()) return last;
            LOG_ERR("[%s] Connect attempt %d failed: %s",
                store_name(), attempt, last.error.c_str());
        }
        return Status::failure(ErrorKind::CONNECTION,
            std::string(store_name()) + " unreachable after " +
            std::to_string(policy.max_attempts) + " attempts: " + last.error);
    }
};

// RAII transaction scope: rolls back unless commit() succeeded
class StoreTransaction {
public:
    explicit StoreTransaction(ExchangeStore& store) : store_(store) {}

    ~StoreTransaction() {
        if (active_) {
            Status s = store_.rollback();
            if (!s.ok()) {
                LOG_ERR("[%s] Rollback failed: %s", store_.store_name(), s.error.c_str());
            }
        }
    }

    StoreTransaction(const StoreTransaction&) = delete;
    StoreTransaction& operator=(const StoreTransaction&) = delete;

    Status begin() {
        Status s = store_.begin();
        active_ = s.ok();
        return s;
    }

    Status commit() {
        Status s = store_.commit();
        // Failed commit still needs the rollback from the destructor
        active_ = !s.ok();
        return s;
    }

    [[nodiscard]] bool active() const { return active_; }

private:
    ExchangeStore& store_;
    bool active_ = false;
};

} // namespace ifx
