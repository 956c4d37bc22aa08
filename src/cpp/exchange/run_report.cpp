#include "run_report.hpp"
#include "../utils/logger.hpp"
#include <fstream>

namespace ifx {

Status RunReport::write(const std::string& run_id, const nlohmann::json& report) const {
    Status s = ensure_local_dir(dir_);
    if (!s.ok()) return s;

    auto path = report_path(run_id);
    std::ofstream f(path);
    if (!f.is_open()) {
        return Status::failure(ErrorKind::PERSISTENCE, "cannot write report " + path);
    }
    f << report.dump(2);
    f.close();
    if (f.fail()) {
        return Status::failure(ErrorKind::PERSISTENCE, "write failed for report " + path);
    }

    LOG_INF("[run] Report saved to %s", path.c_str());
    return Status::success();
}

} // namespace ifx
