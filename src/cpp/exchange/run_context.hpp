#pragma once
// Identity of one exchange run, fixed when the run starts and passed
// explicitly into every pipeline step.
#include <chrono>
#include <string>
#include "../utils/timer.hpp"

namespace ifx {

struct RunContext {
    std::string run_id;         // YYYYMMDD_HHMMSS, also used in batch file names
    std::string started_at;     // YYYY-MM-DD HH:MM:SS, stamped as sent_at
    std::chrono::system_clock::time_point started{};

    static RunContext at(std::chrono::system_clock::time_point tp) {
        RunContext ctx;
        ctx.started = tp;
        ctx.run_id = format_local_time(tp, "%Y%m%d_%H%M%S");
        ctx.started_at = format_local_time(tp, "%Y-%m-%d %H:%M:%S");
        return ctx;
    }

    static RunContext now() { return at(std::chrono::system_clock::now()); }
};

} // namespace ifx
