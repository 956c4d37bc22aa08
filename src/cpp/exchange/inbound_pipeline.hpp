#pragma once
// =============================================================================
// Inbound import pipeline
//
// Per candidate file, strictly sequential:
//   Discovered -> ledger check -> Skipped
//              -> Downloaded -> parsed (whole file) -> Persisted (one transaction)
//              -> Archived -> RemoteRelocated | RemoteRelocateFailed
//
// Phase 1 (download, parse, transactional insert) must commit before
// phase 2 (local archive, remote relocate) starts. Phase 2 failures are
// warnings and never unwind phase 1: the ledger already holds the file.
// =============================================================================

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../config.hpp"
#include "../connectors/exchange_store.hpp"
#include "../connectors/transfer_client.hpp"
#include "local_files.hpp"
#include "run_context.hpp"

namespace ifx {

enum class FileState {
    DISCOVERED,
    SKIPPED,
    DOWNLOADED,
    PERSISTED,
    ARCHIVED,
    REMOTE_RELOCATED,
    REMOTE_RELOCATE_FAILED,
    FAILED
};

inline const char* file_state_str(FileState s) {
    switch (s) {
        case FileState::DISCOVERED:             return "discovered";
        case FileState::SKIPPED:                return "skipped";
        case FileState::DOWNLOADED:             return "downloaded";
        case FileState::PERSISTED:              return "persisted";
        case FileState::ARCHIVED:               return "archived";
        case FileState::REMOTE_RELOCATED:       return "remote_relocated";
        case FileState::REMOTE_RELOCATE_FAILED: return "remote_relocate_failed";
        case FileState::FAILED:                 return "failed";
    }
    return "??";
}

// Result of the ledger check for one candidate
enum class CandidateDecision { PROCESS, SKIP };

struct ImportCandidate {
    std::string name;
    std::string discovered_at;  // YYYY-MM-DD HH:MM:SS
};

struct FileOutcome {
    ImportCandidate candidate;
    FileState state = FileState::DISCOVERED;
    int64_t records = 0;
    Status status;                      // Set when state == FAILED
    std::vector<std::string> warnings;  // Phase 2 problems

    nlohmann::json to_json() const;
};

struct InboundResult {
    Status status;  // Run-level: listing / connection failures
    std::vector<FileOutcome> files;
    int64_t duration_ms = 0;

    [[nodiscard]] int64_t count(FileState state) const;
    // Run-level failure or any file that could not be imported
    [[nodiscard]] bool ok() const;

    nlohmann::json to_json() const;
};

class InboundPipeline {
public:
    InboundPipeline(const InboundConfig& config, ExchangeStore& store,
                    TransferClient& transfer);

    InboundResult run(const RunContext& ctx);

    // Remote names matching the partner pattern; marker files and the
    // completed subdirectory excluded
    Status discover(std::vector<ImportCandidate>& candidates);
    [[nodiscard]] bool is_candidate_name(const std::string& name) const;

    // Ledger lookup: SKIP if this file name was already committed
    Status check_candidate(const ImportCandidate& candidate, CandidateDecision& decision);

    FileOutcome process_candidate(const ImportCandidate& candidate);

    // Resolve files a crashed run left in the staging directory: already in
    // the ledger -> archive, otherwise delete (re-downloaded next run)
    Status recover_staging(std::vector<RecoveryAction>& actions);

private:
    InboundConfig config_;
    ExchangeStore& store_;
    TransferClient& transfer_;
    bool completed_dir_ready_ = false;

    // Phase 1: one transaction, re-checks the ledger under the file-name lock
    Status persist(const std::string& file_name, const std::vector<ImportedRecord>& records,
                   CandidateDecision& decision);
    // Phase 2, remote half: move into <remote_dir>/<completed_subdir>/
    Status relocate_remote(const std::string& file_name);
};

} // namespace ifx
