#pragma once
// Owns one exchange run: identity, step order and crash recovery.
//
//   connect store -> bootstrap local dirs -> recover staging leftovers
//   -> outbound -> inbound -> report
//
// A lost connection or an exhausted remote transfer aborts the remaining
// steps; per-file inbound errors and outbound validation/persistence errors
// do not stop the other pipeline.
#include <vector>
#include <nlohmann/json.hpp>
#include "../config.hpp"
#include "../connectors/exchange_store.hpp"
#include "../connectors/transfer_client.hpp"
#include "inbound_pipeline.hpp"
#include "outbound_pipeline.hpp"
#include "run_context.hpp"
#include "run_report.hpp"

namespace ifx {

// Process exit codes
inline constexpr int kExitOk = 0;
inline constexpr int kExitRunFailed = 1;
inline constexpr int kExitConfigError = 2;
inline constexpr int kExitConnectionError = 3;

struct RunSummary {
    RunContext ctx;
    RunMode mode = RunMode::BOTH;
    Status status;  // Run-level failure (aborted the run)
    std::vector<RecoveryAction> recovery;

    bool outbound_ran = false;
    OutboundResult outbound;
    bool inbound_ran = false;
    InboundResult inbound;

    [[nodiscard]] int exit_code() const;
    nlohmann::json to_json() const;
};

class RunCoordinator {
public:
    RunCoordinator(const ExchangeConfig& config, ExchangeStore& store,
                   TransferClient& transfer);

    RunSummary run(RunMode mode, const RunContext& ctx);

private:
    ExchangeConfig config_;
    ExchangeStore& store_;
    OutboundPipeline outbound_;
    InboundPipeline inbound_;
    RunReport report_;

    Status bootstrap_directories();
    Status recover(std::vector<RecoveryAction>& actions);
    RunSummary& finish(RunSummary& summary);
};

} // namespace ifx
