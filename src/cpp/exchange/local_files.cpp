#include "local_files.hpp"
#include <fstream>
#include <sstream>

namespace ifx {
namespace fs = std::filesystem;

Status ensure_local_dir(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Status::failure(ErrorKind::CONFIGURATION,
            "cannot create directory " + dir.string() + ": " + ec.message());
    }
    return Status::success();
}

Status archive_file(const fs::path& src, const fs::path& dir) {
    Status s = ensure_local_dir(dir);
    if (!s.ok()) return s;

    std::error_code ec;
    fs::path dst = dir / src.filename();
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Status::failure(ErrorKind::PERSISTENCE,
            "cannot archive " + src.string() + " to " + dst.string() + ": " + ec.message());
    }
    return remove_local_file(src);
}

Status remove_local_file(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        return Status::failure(ErrorKind::PERSISTENCE,
            "cannot remove " + path.string() + ": " + ec.message());
    }
    return Status::success();
}

Status read_local_file(const fs::path& path, std::string& content) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return Status::failure(ErrorKind::VALIDATION, "cannot open " + path.string());
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) {
        return Status::failure(ErrorKind::VALIDATION, "read error on " + path.string());
    }
    content = ss.str();
    return Status::success();
}

} // namespace ifx
