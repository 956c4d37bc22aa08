// =============================================================================
// ifx-exchange -- partner interface exchange over FTP
//
// OUTBOUND: PENDING rows -> tab-delimited batch file + marker -> FTP -> SENT
// INBOUND:  FTP listing -> ledger check -> download -> parse -> one DB
//           transaction per file -> local archive -> remote "completed" dir
//
// Delivery is at-least-once; inbound application is idempotent per file name.
// =============================================================================

#include <cstdlib>
#include <cstring>
#include <curl/curl.h>

#include "config.hpp"
#include "utils/logger.hpp"
#include "connectors/postgres_store.hpp"
#include "connectors/ftp_transfer_client.hpp"
#include "exchange/run_context.hpp"
#include "exchange/run_coordinator.hpp"

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s --config PATH [OPTIONS]\n"
        "\n"
        "Options:\n"
        "  --config PATH       JSON config file (required)\n"
        "  --mode MODE         outbound, inbound or both (default: both)\n"
        "  --init-schema       Create the exchange tables, then exit\n"
        "  --verbose           Enable debug logging\n"
        "  --help              Show this help\n"
        "\n"
        "Exit codes: 0 ok, 1 run failed, 2 configuration error, 3 connection error\n",
        prog);
}

int main(int argc, char* argv[]) {
    std::string config_path;
    ifx::RunMode mode = ifx::RunMode::BOTH;
    bool init_schema = false;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return ifx::kExitOk;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--mode") == 0 && i + 1 < argc) {
            if (!ifx::parse_run_mode(argv[++i], mode)) {
                std::fprintf(stderr, "Invalid mode: %s\n", argv[i]);
                print_usage(argv[0]);
                return ifx::kExitConfigError;
            }
        } else if (std::strcmp(argv[i], "--init-schema") == 0) {
            init_schema = true;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else {
            std::fprintf(stderr, "Unknown option: %s\n", argv[i]);
            print_usage(argv[0]);
            return ifx::kExitConfigError;
        }
    }

    if (config_path.empty()) {
        LOG_ERR("--config is required");
        print_usage(argv[0]);
        return ifx::kExitConfigError;
    }

    ifx::ExchangeConfig cfg;
    ifx::Status s = ifx::ExchangeConfig::from_json(config_path, cfg);
    if (!s.ok()) {
        LOG_ERR("Configuration error: %s", s.error.c_str());
        return ifx::kExitConfigError;
    }

    ifx::g_log_level = verbose ? ifx::LogLevel::DEBUG : ifx::parse_log_level(cfg.log_level);
    if (!cfg.log_file.empty() && !ifx::log_open_file(cfg.log_file)) {
        LOG_ERR("Configuration error: cannot open log file %s", cfg.log_file.c_str());
        return ifx::kExitConfigError;
    }

    LOG_INF("=== ifx-exchange ===");
    LOG_INF("Config: %s, FTP %s:%u, DB %s:%u/%s",
        config_path.c_str(), cfg.ftp.host.c_str(), cfg.ftp.port,
        cfg.database.host.c_str(), cfg.database.port, cfg.database.database.c_str());

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        LOG_ERR("curl_global_init failed");
        ifx::log_close_file();
        return ifx::kExitRunFailed;
    }

    int exit_code = ifx::kExitOk;
    {
        ifx::PostgresStore store(cfg.outbound.table, cfg.inbound.table,
                                 cfg.inbound.ledger_table);
        ifx::FtpTransferClient ftp(cfg.ftp, cfg.retry);

        if (init_schema) {
            s = store.ensure_connected(cfg.database, cfg.retry);
            if (s.ok()) s = store.create_schema();
            if (!s.ok()) {
                LOG_ERR("Schema creation failed: %s", s.error.c_str());
                exit_code = s.kind == ifx::ErrorKind::CONNECTION ? ifx::kExitConnectionError
                                                                 : ifx::kExitRunFailed;
            } else {
                LOG_INF("Exchange tables ready");
            }
        } else {
            ifx::RunCoordinator coordinator(cfg, store, ftp);
            ifx::RunSummary summary = coordinator.run(mode, ifx::RunContext::now());
            exit_code = summary.exit_code();
        }

        store.disconnect();
    }

    curl_global_cleanup();
    ifx::log_close_file();
    return exit_code;
}
