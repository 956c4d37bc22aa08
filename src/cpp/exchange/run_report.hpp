#pragma once
// =============================================================================
// Run report -- one JSON document per exchange run
//
// Written to <report_dir>/run_<run_id>.json after every run, successful or
// not, so operators can see which batch or file a failure belongs to.
// =============================================================================

#include <string>
#include <nlohmann/json.hpp>
#include "local_files.hpp"
#include "../utils/status.hpp"

namespace ifx {

class RunReport {
public:
    explicit RunReport(std::string report_dir) : dir_(std::move(report_dir)) {}

    Status write(const std::string& run_id, const nlohmann::json& report) const;

    [[nodiscard]] std::string report_path(const std::string& run_id) const {
        return dir_ + "/run_" + run_id + ".json";
    }

    [[nodiscard]] const std::string& dir() const { return dir_; }

private:
    std::string dir_;
};

} // namespace ifx
