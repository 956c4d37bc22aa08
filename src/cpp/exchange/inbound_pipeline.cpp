#include "inbound_pipeline.hpp"
#include "local_files.hpp"
#include "record_codec.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"
#include <fnmatch.h>
#include <filesystem>

namespace ifx {
namespace fs = std::filesystem;

nlohmann::json FileOutcome::to_json() const {
    nlohmann::json j = {
        {"file", candidate.name},
        {"discovered_at", candidate.discovered_at},
        {"state", file_state_str(state)},
        {"records", records}
    };
    if (!status.ok()) {
        j["error_kind"] = error_kind_str(status.kind);
        j["error"] = status.error;
    }
    if (!warnings.empty()) j["warnings"] = warnings;
    return j;
}

int64_t InboundResult::count(FileState state) const {
    int64_t n = 0;
    for (const auto& f : files) {
        if (f.state == state) ++n;
    }
    return n;
}

bool InboundResult::ok() const {
    return status.ok() && count(FileState::FAILED) == 0;
}

nlohmann::json InboundResult::to_json() const {
    nlohmann::json files_json = nlohmann::json::array();
    for (const auto& f : files) files_json.push_back(f.to_json());

    return {
        {"error_kind", error_kind_str(status.kind)},
        {"error", status.error},
        {"duration_ms", duration_ms},
        {"imported", count(FileState::REMOTE_RELOCATED) +
                     count(FileState::REMOTE_RELOCATE_FAILED)},
        {"skipped", count(FileState::SKIPPED)},
        {"failed", count(FileState::FAILED)},
        {"files", files_json}
    };
}

InboundPipeline::InboundPipeline(const InboundConfig& config, ExchangeStore& store,
                                 TransferClient& transfer)
    : config_(config), store_(store), transfer_(transfer) {}

// ============================================================================
// Discovery + ledger check
// ============================================================================

bool InboundPipeline::is_candidate_name(const std::string& name) const {
    // NLST also lists the relocation target directory
    if (name == config_.completed_subdir) return false;

    const std::string marker = "." + config_.marker_ext;
    if (name.size() >= marker.size() &&
        name.compare(name.size() - marker.size(), marker.size(), marker) == 0) {
        return false;
    }
    return fnmatch(config_.file_pattern.c_str(), name.c_str(), 0) == 0;
}

Status InboundPipeline::discover(std::vector<ImportCandidate>& candidates) {
    std::vector<std::string> names;
    Status s = transfer_.list(config_.remote_dir, names);
    if (!s.ok()) return s;

    std::string now = format_local_time(std::chrono::system_clock::now(), "%Y-%m-%d %H:%M:%S");
    candidates.clear();
    for (const auto& name : names) {
        if (!is_candidate_name(name)) continue;
        candidates.push_back({name, now});
    }

    LOG_INF("[inbound] %s: %zu entries, %zu candidates",
        config_.remote_dir.c_str(), names.size(), candidates.size());
    return Status::success();
}

Status InboundPipeline::check_candidate(const ImportCandidate& candidate,
                                        CandidateDecision& decision) {
    bool imported = false;
    Status s = store_.is_file_imported(candidate.name, imported);
    if (!s.ok()) return s;
    decision = imported ? CandidateDecision::SKIP : CandidateDecision::PROCESS;
    return Status::success();
}

// ============================================================================
// Phase 1: transactional persist
// ============================================================================

Status InboundPipeline::persist(const std::string& file_name,
                                const std::vector<ImportedRecord>& records,
                                CandidateDecision& decision) {
    StoreTransaction tx(store_);
    Status s = tx.begin();
    if (!s.ok()) return s;

    s = store_.lock_file_name(file_name);
    if (!s.ok()) return s;

    // Another run may have committed this file since the first check
    bool imported = false;
    s = store_.is_file_imported(file_name, imported);
    if (!s.ok()) return s;
    if (imported) {
        decision = CandidateDecision::SKIP;
        return Status::success();  // tx destructor rolls back
    }

    for (size_t i = 0; i < records.size(); ++i) {
        s = store_.insert_record(records[i]);
        if (!s.ok()) {
            s.error = file_name + " record " + std::to_string(i + 1) + ": " + s.error;
            return s;
        }
    }

    // Ledger entry commits with the records; empty files are recorded too
    s = store_.record_import(file_name, static_cast<int64_t>(records.size()));
    if (!s.ok()) return s;

    s = tx.commit();
    if (!s.ok()) return s;

    decision = CandidateDecision::PROCESS;
    return Status::success();
}

// ============================================================================
// Phase 2: remote relocate
// ============================================================================

Status InboundPipeline::relocate_remote(const std::string& file_name) {
    std::string completed = join_remote_path(config_.remote_dir, config_.completed_subdir);

    if (!completed_dir_ready_) {
        Status s = transfer_.ensure_dir(completed);
        if (!s.ok()) return s;
        completed_dir_ready_ = true;
    }

    return transfer_.move(join_remote_path(config_.remote_dir, file_name),
                          join_remote_path(completed, file_name));
}

// ============================================================================
// Per-file state machine
// ============================================================================

FileOutcome InboundPipeline::process_candidate(const ImportCandidate& candidate) {
    FileOutcome outcome;
    outcome.candidate = candidate;
    const std::string& name = candidate.name;

    auto fail = [&](Status s) {
        outcome.state = FileState::FAILED;
        outcome.status = std::move(s);
        LOG_ERR("[inbound] %s: %s error: %s", name.c_str(),
            error_kind_str(outcome.status.kind), outcome.status.error.c_str());
        return outcome;
    };

    CandidateDecision decision = CandidateDecision::PROCESS;
    Status s = check_candidate(candidate, decision);
    if (!s.ok()) return fail(s);
    if (decision == CandidateDecision::SKIP) {
        LOG_INF("[inbound] %s already imported -- skipping", name.c_str());
        outcome.state = FileState::SKIPPED;
        return outcome;
    }

    // Download
    fs::path staging = fs::path(config_.staging_dir) / name;
    s = ensure_local_dir(config_.staging_dir);
    if (s.ok()) s = transfer_.download(join_remote_path(config_.remote_dir, name), staging.string());
    if (!s.ok()) return fail(s);
    outcome.state = FileState::DOWNLOADED;

    // Parse everything before touching the database
    std::vector<ImportedRecord> records;
    std::string content;
    s = read_local_file(staging, content);
    if (s.ok()) s = RecordCodec::decode_inbound_file(content, name, records);
    if (!s.ok()) {
        Status cleanup = remove_local_file(staging);
        if (!cleanup.ok()) LOG_WRN("[inbound] %s", cleanup.error.c_str());
        return fail(s);
    }

    // Phase 1
    s = persist(name, records, decision);
    if (!s.ok()) {
        Status cleanup = remove_local_file(staging);
        if (!cleanup.ok()) LOG_WRN("[inbound] %s", cleanup.error.c_str());
        return fail(s);
    }
    if (decision == CandidateDecision::SKIP) {
        LOG_WRN("[inbound] %s was imported concurrently -- skipping", name.c_str());
        Status cleanup = remove_local_file(staging);
        if (!cleanup.ok()) LOG_WRN("[inbound] %s", cleanup.error.c_str());
        outcome.state = FileState::SKIPPED;
        return outcome;
    }
    outcome.records = static_cast<int64_t>(records.size());
    outcome.state = FileState::PERSISTED;
    LOG_INF("[inbound] %s: %lld records committed", name.c_str(),
        static_cast<long long>(outcome.records));

    // Phase 2: local archive
    s = archive_file(staging, config_.archive_dir);
    if (s.ok()) {
        outcome.state = FileState::ARCHIVED;
    } else {
        LOG_WRN("[inbound] %s: archive failed (record is persisted): %s",
            name.c_str(), s.error.c_str());
        outcome.warnings.push_back(s.error);
    }

    // Phase 2: remote relocate
    s = relocate_remote(name);
    if (s.ok()) {
        outcome.state = FileState::REMOTE_RELOCATED;
    } else {
        LOG_WRN("[inbound] %s: remote relocate failed (record is persisted): %s",
            name.c_str(), s.error.c_str());
        outcome.warnings.push_back(s.error);
        outcome.state = FileState::REMOTE_RELOCATE_FAILED;
    }
    return outcome;
}

// ============================================================================
// Run
// ============================================================================

InboundResult InboundPipeline::run(const RunContext& ctx) {
    InboundResult result;
    Timer timer;
    timer.start();
    completed_dir_ready_ = false;

    LOG_INF("[inbound] Run %s: scanning %s for %s",
        ctx.run_id.c_str(), config_.remote_dir.c_str(), config_.file_pattern.c_str());

    std::vector<ImportCandidate> candidates;
    result.status = discover(candidates);
    if (!result.status.ok()) {
        LOG_ERR("[inbound] Listing %s failed: %s",
            config_.remote_dir.c_str(), result.status.error.c_str());
    } else {
        for (const auto& candidate : candidates) {
            FileOutcome outcome = process_candidate(candidate);
            ErrorKind kind = outcome.status.kind;
            result.files.push_back(std::move(outcome));

            // Parse/persist errors stay with their file; a lost connection or
            // an exhausted download aborts the run
            if (kind == ErrorKind::CONNECTION || kind == ErrorKind::TRANSFER) {
                result.status = result.files.back().status;
                LOG_ERR("[inbound] Aborting run after %s", candidate.name.c_str());
                break;
            }
        }
    }

    timer.stop();
    result.duration_ms = timer.elapsed_ms();
    LOG_INF("[inbound] Done: %lld imported, %lld skipped, %lld failed, %lld ms",
        static_cast<long long>(result.count(FileState::REMOTE_RELOCATED) +
                               result.count(FileState::REMOTE_RELOCATE_FAILED)),
        static_cast<long long>(result.count(FileState::SKIPPED)),
        static_cast<long long>(result.count(FileState::FAILED)),
        static_cast<long long>(result.duration_ms));
    return result;
}

// ============================================================================
// Crash recovery
// ============================================================================

Status InboundPipeline::recover_staging(std::vector<RecoveryAction>& actions) {
    std::error_code ec;
    if (!fs::is_directory(config_.staging_dir, ec)) return Status::success();

    std::vector<fs::path> leftovers;
    for (const auto& entry : fs::directory_iterator(config_.staging_dir, ec)) {
        if (entry.is_regular_file()) leftovers.push_back(entry.path());
    }
    if (ec) {
        return Status::failure(ErrorKind::PERSISTENCE,
            "cannot scan " + config_.staging_dir + ": " + ec.message());
    }

    for (const auto& path : leftovers) {
        std::string name = path.filename().string();
        bool imported = false;
        Status s = store_.is_file_imported(name, imported);
        if (!s.ok()) return s;

        if (imported) {
            LOG_WRN("[inbound] Recovery: %s is in the ledger, archiving", name.c_str());
            s = archive_file(path, config_.archive_dir);
            if (!s.ok()) return s;
            actions.push_back({path.string(), "archived", "already imported"});
        } else {
            LOG_WRN("[inbound] Recovery: %s not in the ledger, deleting", name.c_str());
            s = remove_local_file(path);
            if (!s.ok()) return s;
            actions.push_back({path.string(), "deleted", "not imported"});
        }
    }
    return Status::success();
}

} // namespace ifx
