#include "outbound_pipeline.hpp"
#include "local_files.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>

namespace ifx {
namespace fs = std::filesystem;

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

nlohmann::json OutboundResult::to_json() const {
    nlohmann::json j = {
        {"outcome", outbound_outcome_str(outcome)},
        {"duration_ms", duration_ms},
        {"error_kind", error_kind_str(status.kind)},
        {"error", status.error}
    };
    if (outcome != OutboundOutcome::NOTHING_TO_DO) {
        j["batch"] = {
            {"file_name", batch.file_name},
            {"marker_name", batch.marker_name},
            {"record_count", batch.record_count},
            {"byte_size", batch.byte_size},
            {"status", batch_status_str(batch.status)},
            {"rows_marked", rows_marked}
        };
        j["delivered_unacknowledged"] = delivered_unacknowledged;
    }
    return j;
}

OutboundPipeline::OutboundPipeline(const OutboundConfig& config, ExchangeStore& store,
                                   TransferClient& transfer)
    : config_(config), store_(store), transfer_(transfer),
      codec_(config.no_period_operand) {}

std::string OutboundPipeline::batch_file_name(const RunContext& ctx) const {
    return config_.file_prefix + "_" + ctx.run_id + "_" + config_.sequence_suffix +
           "." + config_.file_ext;
}

std::string OutboundPipeline::batch_file_name(const RunContext& ctx, long sequence) const {
    char seq[32];
    std::snprintf(seq, sizeof(seq), "%0*ld",
        static_cast<int>(config_.sequence_suffix.size()), sequence);
    return config_.file_prefix + "_" + ctx.run_id + "_" + seq + "." + config_.file_ext;
}

Status OutboundPipeline::choose_batch_name(const RunContext& ctx, std::string& name) const {
    long first = std::strtol(config_.sequence_suffix.c_str(), nullptr, 10);
    long last = 1;
    for (size_t i = 0; i < config_.sequence_suffix.size() && last < 1000000000L; ++i) last *= 10;

    std::error_code ec;
    for (long seq = first; seq < last; ++seq) {
        std::string candidate = batch_file_name(ctx, seq);
        if (fs::exists(fs::path(config_.staging_dir) / candidate, ec) ||
            fs::exists(fs::path(config_.archive_dir) / candidate, ec)) {
            LOG_WRN("[outbound] %s already used, trying next sequence", candidate.c_str());
            continue;
        }
        name = std::move(candidate);
        return Status::success();
    }
    return Status::failure(ErrorKind::PERSISTENCE,
        "no unused batch file name left for run " + ctx.run_id);
}

std::string OutboundPipeline::marker_file_name(const std::string& batch_file) const {
    std::string base = batch_file;
    std::string ext = "." + config_.file_ext;
    if (ends_with(base, ext)) base.erase(base.size() - ext.size());
    return base + "." + config_.marker_ext;
}

bool OutboundPipeline::is_batch_file(const std::string& name) const {
    return name.rfind(config_.file_prefix + "_", 0) == 0 &&
           ends_with(name, "." + config_.file_ext);
}

bool OutboundPipeline::is_marker_file(const std::string& name) const {
    return name.rfind(config_.file_prefix + "_", 0) == 0 &&
           ends_with(name, "." + config_.marker_ext);
}

// ============================================================================
// Steps 2-3: local batch + marker
// ============================================================================

Status OutboundPipeline::write_batch(const std::vector<PendingRecord>& records,
                                     ExportBatch& batch) {
    // Encode everything first so a bad row never leaves a half-written file
    std::vector<std::string> lines;
    lines.reserve(records.size());
    for (const auto& rec : records) {
        std::string line;
        Status s = codec_.encode(rec, line);
        if (!s.ok()) return s;
        lines.push_back(std::move(line));
    }

    std::ofstream out(batch.local_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return Status::failure(ErrorKind::PERSISTENCE,
            "cannot create batch file " + batch.local_path.string());
    }
    for (const auto& line : lines) {
        out << line << '\n';
    }
    out.close();
    if (out.fail()) {
        return Status::failure(ErrorKind::PERSISTENCE,
            "write failed for " + batch.local_path.string());
    }

    batch.record_count = static_cast<int64_t>(lines.size());
    return verify_batch(batch);
}

Status OutboundPipeline::verify_batch(ExportBatch& batch) {
    std::error_code ec;
    if (!fs::exists(batch.local_path, ec)) {
        return Status::failure(ErrorKind::PERSISTENCE,
            "batch file missing after write: " + batch.local_path.string());
    }
    auto size = fs::file_size(batch.local_path, ec);
    if (ec || size == 0) {
        return Status::failure(ErrorKind::PERSISTENCE,
            "batch file empty after write: " + batch.local_path.string());
    }
    batch.byte_size = static_cast<int64_t>(size);

    // Re-read: every line must decode and the count must match
    std::string content;
    Status s = read_local_file(batch.local_path, content);
    if (!s.ok()) return s;

    int64_t lines = 0;
    size_t pos = 0;
    while (pos < content.size()) {
        size_t nl = content.find('\n', pos);
        if (nl == std::string::npos) nl = content.size();
        PendingRecord decoded;
        s = codec_.decode_outbound(content.substr(pos, nl - pos), decoded);
        if (!s.ok()) {
            return Status::failure(ErrorKind::PERSISTENCE,
                "batch file " + batch.file_name + " line " + std::to_string(lines + 1) +
                " unreadable: " + s.error);
        }
        ++lines;
        pos = nl + 1;
    }
    if (lines != batch.record_count) {
        return Status::failure(ErrorKind::PERSISTENCE,
            "batch file " + batch.file_name + " has " + std::to_string(lines) +
            " lines, expected " + std::to_string(batch.record_count));
    }
    return Status::success();
}

Status OutboundPipeline::write_marker(const ExportBatch& batch) {
    std::ofstream marker(batch.marker_path, std::ios::binary | std::ios::trunc);
    if (!marker.is_open()) {
        return Status::failure(ErrorKind::PERSISTENCE,
            "cannot create marker file " + batch.marker_path.string());
    }
    marker.close();
    if (marker.fail()) {
        return Status::failure(ErrorKind::PERSISTENCE,
            "cannot close marker file " + batch.marker_path.string());
    }
    return Status::success();
}

// ============================================================================
// Step 4: publish (data strictly before marker)
// ============================================================================

Status OutboundPipeline::publish(ExportBatch& batch) {
    if (batch.byte_size <= 0) {
        return Status::failure(ErrorKind::VALIDATION,
            "refusing to publish empty batch " + batch.file_name);
    }

    Status s = transfer_.ensure_dir(config_.remote_dir);
    if (!s.ok()) return s;

    s = transfer_.upload(batch.local_path.string(),
                         join_remote_path(config_.remote_dir, batch.file_name));
    if (!s.ok()) return s;

    s = transfer_.upload(batch.marker_path.string(),
                         join_remote_path(config_.remote_dir, batch.marker_name));
    if (!s.ok()) {
        LOG_ERR("[outbound] Data file %s uploaded but marker failed -- partner will not "
                "consume it, rows stay PENDING", batch.file_name.c_str());
        return s;
    }

    batch.status = BatchStatus::UPLOADED;
    return Status::success();
}

void OutboundPipeline::discard_batch(const ExportBatch& batch) {
    for (const auto& path : {batch.local_path, batch.marker_path}) {
        Status s = remove_local_file(path);
        if (!s.ok()) {
            LOG_WRN("[outbound] %s", s.error.c_str());
        }
    }
}

void OutboundPipeline::archive_batch(const ExportBatch& batch) {
    Status s = archive_file(batch.local_path, config_.archive_dir);
    if (!s.ok()) {
        LOG_WRN("[outbound] %s", s.error.c_str());
    }
    s = remove_local_file(batch.marker_path);
    if (!s.ok()) {
        LOG_WRN("[outbound] %s", s.error.c_str());
    }
}

// ============================================================================
// Run
// ============================================================================

OutboundResult OutboundPipeline::run(const RunContext& ctx) {
    OutboundResult result;
    Timer timer;
    timer.start();

    auto finish = [&](OutboundOutcome outcome, Status status) {
        timer.stop();
        result.outcome = outcome;
        result.status = std::move(status);
        result.duration_ms = timer.elapsed_ms();
        return result;
    };

    // Step 1
    std::vector<PendingRecord> records;
    Status s = store_.select_pending(config_.no_period_operand, records);
    if (!s.ok()) {
        LOG_ERR("[outbound] Selecting pending rows failed: %s", s.error.c_str());
        return finish(OutboundOutcome::FAILED, s);
    }
    if (records.empty()) {
        LOG_INF("[outbound] No pending rows -- nothing to export");
        return finish(OutboundOutcome::NOTHING_TO_DO, Status::success());
    }
    // Store collation may differ from the partner's byte order
    codec_.sort_for_export(records);

    // Step 2
    ExportBatch& batch = result.batch;
    s = choose_batch_name(ctx, batch.file_name);
    if (!s.ok()) {
        LOG_ERR("[outbound] %s", s.error.c_str());
        return finish(OutboundOutcome::FAILED, s);
    }
    batch.marker_name = marker_file_name(batch.file_name);
    batch.local_path = fs::path(config_.staging_dir) / batch.file_name;
    batch.marker_path = fs::path(config_.staging_dir) / batch.marker_name;

    LOG_INF("[outbound] Exporting %zu rows to %s", records.size(), batch.file_name.c_str());

    s = ensure_local_dir(config_.staging_dir);
    if (s.ok()) s = write_batch(records, batch);
    if (!s.ok()) {
        LOG_ERR("[outbound] Writing %s failed: %s", batch.file_name.c_str(), s.error.c_str());
        discard_batch(batch);
        return finish(OutboundOutcome::FAILED, s);
    }

    // Step 3
    s = write_marker(batch);
    if (!s.ok()) {
        LOG_ERR("[outbound] %s", s.error.c_str());
        discard_batch(batch);
        return finish(OutboundOutcome::FAILED, s);
    }

    // Step 4
    s = publish(batch);
    if (!s.ok()) {
        LOG_ERR("[outbound] Publishing %s failed: %s", batch.file_name.c_str(), s.error.c_str());
        discard_batch(batch);
        return finish(OutboundOutcome::FAILED, s);
    }

    // Step 5
    s = store_.mark_sent(records, batch.file_name, ctx.started_at, result.rows_marked);
    if (!s.ok()) {
        result.delivered_unacknowledged = true;
        LOG_ERR("[outbound] %s was DELIVERED but marking rows SENT failed: %s",
            batch.file_name.c_str(), s.error.c_str());
        LOG_ERR("[outbound] Rows remain PENDING and will be re-sent under a new file name");
        return finish(OutboundOutcome::FAILED, s);
    }
    batch.status = BatchStatus::ACKNOWLEDGED;

    if (result.rows_marked != batch.record_count) {
        LOG_WRN("[outbound] %lld rows marked SENT for %lld exported lines (%s)",
            static_cast<long long>(result.rows_marked),
            static_cast<long long>(batch.record_count), batch.file_name.c_str());
    }

    archive_batch(batch);

    OutboundResult done = finish(OutboundOutcome::EXPORTED, Status::success());
    LOG_INF("[outbound] %s: %lld rows, %lld bytes, %lld ms",
        done.batch.file_name.c_str(), static_cast<long long>(done.batch.record_count),
        static_cast<long long>(done.batch.byte_size), static_cast<long long>(done.duration_ms));
    return done;
}

// ============================================================================
// Crash recovery
// ============================================================================

Status OutboundPipeline::recover_staging(std::vector<RecoveryAction>& actions) {
    std::error_code ec;
    if (!fs::is_directory(config_.staging_dir, ec)) return Status::success();

    std::vector<fs::path> batches;
    std::vector<fs::path> markers;
    for (const auto& entry : fs::directory_iterator(config_.staging_dir, ec)) {
        if (!entry.is_regular_file()) continue;
        std::string name = entry.path().filename().string();
        if (is_batch_file(name)) batches.push_back(entry.path());
        else if (is_marker_file(name)) markers.push_back(entry.path());
    }
    if (ec) {
        return Status::failure(ErrorKind::PERSISTENCE,
            "cannot scan " + config_.staging_dir + ": " + ec.message());
    }

    for (const auto& path : batches) {
        std::string name = path.filename().string();
        bool sent = false;
        Status s = store_.is_batch_sent(name, sent);
        if (!s.ok()) return s;

        fs::path marker = path.parent_path() / marker_file_name(name);
        if (sent) {
            LOG_WRN("[outbound] Recovery: %s was acknowledged, archiving", name.c_str());
            s = archive_file(path, config_.archive_dir);
            if (!s.ok()) return s;
            actions.push_back({path.string(), "archived", "rows already SENT"});
        } else {
            LOG_WRN("[outbound] Recovery: %s never acknowledged, deleting "
                    "(rows stay PENDING)", name.c_str());
            s = remove_local_file(path);
            if (!s.ok()) return s;
            actions.push_back({path.string(), "deleted", "rows still PENDING"});
        }
        if (fs::exists(marker, ec)) {
            s = remove_local_file(marker);
            if (!s.ok()) return s;
        }
    }

    for (const auto& marker : markers) {
        if (!fs::exists(marker, ec)) continue;  // removed with its batch above
        Status s = remove_local_file(marker);
        if (!s.ok()) return s;
        actions.push_back({marker.string(), "deleted", "orphan marker"});
    }
    return Status::success();
}

} // namespace ifx
