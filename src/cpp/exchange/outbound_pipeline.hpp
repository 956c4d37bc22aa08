#pragma once
// =============================================================================
// Outbound export pipeline
//
//   1. select PENDING rows (export order)       -- none: NOTHING_TO_DO
//   2. write <prefix>_<run_id>_<seq>.<ext> (first seq not already staged or
//      archived), verify non-empty and complete
//   3. write zero-byte marker <prefix>_<run_id>_<seq>.<marker_ext>
//   4. upload data file, THEN marker (marker = "transfer complete")
//   5. one UPDATE PENDING -> SENT by row id with file name + send time
//
// Any failure before 5 leaves the rows PENDING; the next run exports them
// again under a new file name. A failure in 5 after a successful upload is
// the accepted at-least-once window: the file is delivered, the rows stay
// PENDING and will be delivered again under a distinguishable name.
// =============================================================================

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../config.hpp"
#include "../connectors/exchange_store.hpp"
#include "../connectors/transfer_client.hpp"
#include "local_files.hpp"
#include "record_codec.hpp"
#include "run_context.hpp"

namespace ifx {

enum class BatchStatus { PENDING, UPLOADED, ACKNOWLEDGED };

inline const char* batch_status_str(BatchStatus s) {
    switch (s) {
        case BatchStatus::PENDING:      return "pending";
        case BatchStatus::UPLOADED:     return "uploaded";
        case BatchStatus::ACKNOWLEDGED: return "acknowledged";
    }
    return "??";
}

struct ExportBatch {
    std::string file_name;
    std::string marker_name;
    std::filesystem::path local_path;
    std::filesystem::path marker_path;
    int64_t record_count = 0;
    int64_t byte_size = 0;
    BatchStatus status = BatchStatus::PENDING;
};

enum class OutboundOutcome { NOTHING_TO_DO, EXPORTED, FAILED };

inline const char* outbound_outcome_str(OutboundOutcome o) {
    switch (o) {
        case OutboundOutcome::NOTHING_TO_DO: return "nothing_to_do";
        case OutboundOutcome::EXPORTED:      return "exported";
        case OutboundOutcome::FAILED:        return "failed";
    }
    return "??";
}

struct OutboundResult {
    OutboundOutcome outcome = OutboundOutcome::FAILED;
    ExportBatch batch;
    Status status;
    int64_t rows_marked = 0;
    int64_t duration_ms = 0;
    // Upload finished but the SENT update did not: rows will be re-exported
    bool delivered_unacknowledged = false;

    nlohmann::json to_json() const;
};

class OutboundPipeline {
public:
    OutboundPipeline(const OutboundConfig& config, ExchangeStore& store,
                     TransferClient& transfer);

    OutboundResult run(const RunContext& ctx);

    // <prefix>_<run_id>_<sequence>.<ext>, sequence from the config
    [[nodiscard]] std::string batch_file_name(const RunContext& ctx) const;
    // Same, sequence zero-padded to the configured suffix width
    [[nodiscard]] std::string batch_file_name(const RunContext& ctx, long sequence) const;
    // First sequence whose name is in neither staging nor archive, so two
    // runs within one second never reuse (and overwrite) a batch name
    Status choose_batch_name(const RunContext& ctx, std::string& name) const;
    // Same base name, marker extension
    [[nodiscard]] std::string marker_file_name(const std::string& batch_file) const;
    [[nodiscard]] bool is_batch_file(const std::string& name) const;
    [[nodiscard]] bool is_marker_file(const std::string& name) const;

    // Resolve batch files a crashed run left in the staging directory:
    // acknowledged batches are archived, unacknowledged ones deleted
    // (their rows are still PENDING and get a fresh batch).
    Status recover_staging(std::vector<RecoveryAction>& actions);

private:
    OutboundConfig config_;
    ExchangeStore& store_;
    TransferClient& transfer_;
    RecordCodec codec_;

    Status write_batch(const std::vector<PendingRecord>& records, ExportBatch& batch);
    Status verify_batch(ExportBatch& batch);
    Status write_marker(const ExportBatch& batch);
    Status publish(ExportBatch& batch);
    void archive_batch(const ExportBatch& batch);
    // Drop staged files of a batch that was not acknowledged
    void discard_batch(const ExportBatch& batch);
};

} // namespace ifx
