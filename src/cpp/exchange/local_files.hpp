#pragma once
// Local staging / archive helpers. std::filesystem errors are reported as
// Status instead of exceptions.
#include <filesystem>
#include <string>
#include "../utils/status.hpp"

namespace ifx {

// One staging leftover found by a pipeline's recover_staging()
struct RecoveryAction {
    std::string path;
    std::string action;  // "archived" or "deleted"
    std::string reason;
};

Status ensure_local_dir(const std::filesystem::path& dir);

// Copy src into dir (overwriting an older archive copy), then delete src
Status archive_file(const std::filesystem::path& src, const std::filesystem::path& dir);

// Missing files are not an error
Status remove_local_file(const std::filesystem::path& path);

Status read_local_file(const std::filesystem::path& path, std::string& content);

} // namespace ifx
