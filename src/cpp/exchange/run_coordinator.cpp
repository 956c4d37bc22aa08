#include "run_coordinator.hpp"
#include "local_files.hpp"
#include "../utils/logger.hpp"

namespace ifx {

static bool aborts_run(ErrorKind kind) {
    return kind == ErrorKind::CONNECTION || kind == ErrorKind::TRANSFER;
}

int RunSummary::exit_code() const {
    if (!status.ok()) {
        if (status.kind == ErrorKind::CONNECTION) return kExitConnectionError;
        if (status.kind == ErrorKind::CONFIGURATION) return kExitConfigError;
        return kExitRunFailed;
    }
    if (outbound_ran && outbound.outcome == OutboundOutcome::FAILED) return kExitRunFailed;
    if (inbound_ran && !inbound.ok()) return kExitRunFailed;
    return kExitOk;
}

nlohmann::json RunSummary::to_json() const {
    nlohmann::json recovery_json = nlohmann::json::array();
    for (const auto& a : recovery) {
        recovery_json.push_back({{"path", a.path}, {"action", a.action}, {"reason", a.reason}});
    }

    nlohmann::json j = {
        {"run_id", ctx.run_id},
        {"started_at", ctx.started_at},
        {"mode", run_mode_str(mode)},
        {"exit_code", exit_code()},
        {"error_kind", error_kind_str(status.kind)},
        {"error", status.error},
        {"recovery", recovery_json}
    };
    if (outbound_ran) j["outbound"] = outbound.to_json();
    if (inbound_ran) j["inbound"] = inbound.to_json();
    return j;
}

RunCoordinator::RunCoordinator(const ExchangeConfig& config, ExchangeStore& store,
                               TransferClient& transfer)
    : config_(config), store_(store),
      outbound_(config.outbound, store, transfer),
      inbound_(config.inbound, store, transfer),
      report_(config.report_dir) {}

Status RunCoordinator::bootstrap_directories() {
    for (const auto& dir : {config_.outbound.staging_dir, config_.outbound.archive_dir,
                            config_.inbound.staging_dir, config_.inbound.archive_dir,
                            config_.report_dir}) {
        Status s = ensure_local_dir(dir);
        if (!s.ok()) return s;
    }
    return Status::success();
}

Status RunCoordinator::recover(std::vector<RecoveryAction>& actions) {
    Status s = outbound_.recover_staging(actions);
    if (!s.ok()) return s;
    s = inbound_.recover_staging(actions);
    if (!s.ok()) return s;

    if (!actions.empty()) {
        LOG_WRN("[run] Recovered %zu staging files left by a previous run", actions.size());
    }
    return Status::success();
}

RunSummary& RunCoordinator::finish(RunSummary& summary) {
    Status s = report_.write(summary.ctx.run_id, summary.to_json());
    if (!s.ok()) {
        LOG_WRN("[run] %s", s.error.c_str());
    }

    int code = summary.exit_code();
    if (code == kExitOk) {
        LOG_INF("[run] Run %s complete", summary.ctx.run_id.c_str());
    } else {
        LOG_ERR("[run] Run %s FAILED (exit %d)%s%s", summary.ctx.run_id.c_str(), code,
            summary.status.ok() ? "" : ": ", summary.status.error.c_str());
    }
    return summary;
}

RunSummary RunCoordinator::run(RunMode mode, const RunContext& ctx) {
    RunSummary summary;
    summary.ctx = ctx;
    summary.mode = mode;

    LOG_INF("[run] Run %s started (mode: %s)", ctx.run_id.c_str(), run_mode_str(mode));

    summary.status = store_.ensure_connected(config_.database, config_.retry);
    if (!summary.status.ok()) return finish(summary);

    summary.status = bootstrap_directories();
    if (!summary.status.ok()) return finish(summary);

    summary.status = recover(summary.recovery);
    if (!summary.status.ok()) return finish(summary);

    if (mode == RunMode::OUTBOUND || mode == RunMode::BOTH) {
        summary.outbound = outbound_.run(ctx);
        summary.outbound_ran = true;
        if (aborts_run(summary.outbound.status.kind)) {
            summary.status = summary.outbound.status;
            return finish(summary);
        }
    }

    if (mode == RunMode::INBOUND || mode == RunMode::BOTH) {
        summary.inbound = inbound_.run(ctx);
        summary.inbound_ran = true;
        if (aborts_run(summary.inbound.status.kind)) {
            summary.status = summary.inbound.status;
        }
    }

    return finish(summary);
}

} // namespace ifx
