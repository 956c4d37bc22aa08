#include "transfer_client.hpp"
#include "../utils/logger.hpp"
#include <thread>

namespace ifx {

std::string join_remote_path(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (name.empty()) return dir;
    std::string out = dir;
    while (!out.empty() && out.back() == '/') out.pop_back();
    size_t skip = 0;
    while (skip < name.size() && name[skip] == '/') ++skip;
    return out + "/" + name.substr(skip);
}

Status TransferClient::with_retry(const char* op, const std::string& target,
                                  const std::function<Status()>& attempt) {
    Status last;
    for (int i = 1; i <= policy_.max_attempts; ++i) {
        if (i > 1) {
            LOG_WRN("[%s] %s %s: retry %d/%d in %lld ms",
                client_name(), op, target.c_str(), i, policy_.max_attempts,
                static_cast<long long>(policy_.wait.count()));
            std::this_thread::sleep_for(policy_.wait);
        }

        last = attempt();
        if (last.ok()) return last;

        LOG_WRN("[%s] %s %s: attempt %d failed: %s",
            client_name(), op, target.c_str(), i, last.error.c_str());
    }

    ErrorKind kind = last.kind == ErrorKind::CONNECTION ? ErrorKind::CONNECTION
                                                       : ErrorKind::TRANSFER;
    return Status::failure(kind,
        std::string(op) + " " + target + " failed after " +
        std::to_string(policy_.max_attempts) + " attempts: " + last.error);
}

Status TransferClient::upload(const std::string& local_path, const std::string& remote_path) {
    return with_retry("upload", remote_path,
        [&] { return try_upload(local_path, remote_path); });
}

Status TransferClient::download(const std::string& remote_path, const std::string& local_path) {
    return with_retry("download", remote_path,
        [&] { return try_download(remote_path, local_path); });
}

Status TransferClient::list(const std::string& remote_dir, std::vector<std::string>& names) {
    return with_retry("list", remote_dir, [&] {
        names.clear();
        return try_list(remote_dir, names);
    });
}

Status TransferClient::move(const std::string& remote_src, const std::string& remote_dst) {
    return with_retry("move", remote_src,
        [&] { return try_move(remote_src, remote_dst); });
}

Status TransferClient::ensure_dir(const std::string& remote_dir) {
    return with_retry("ensure_dir", remote_dir,
        [&] { return try_ensure_dir(remote_dir); });
}

} // namespace ifx
