#pragma once
// Remote transfer client: list / download / upload / move / ensure_dir.
//
// Every public operation retries the single-attempt primitive of the
// concrete client up to RetryPolicy::max_attempts with a fixed wait between
// attempts. Exhausted retries return the last underlying cause.
#include <functional>
#include <string>
#include <vector>
#include "../config.hpp"
#include "../utils/status.hpp"

namespace ifx {

class TransferClient {
public:
    explicit TransferClient(RetryPolicy policy) : policy_(policy) {}
    virtual ~TransferClient() = default;

    Status upload(const std::string& local_path, const std::string& remote_path);
    Status download(const std::string& remote_path, const std::string& local_path);
    Status list(const std::string& remote_dir, std::vector<std::string>& names);
    Status move(const std::string& remote_src, const std::string& remote_dst);
    Status ensure_dir(const std::string& remote_dir);

    [[nodiscard]] const RetryPolicy& retry_policy() const { return policy_; }
    [[nodiscard]] virtual const char* client_name() const = 0;

protected:
    // Single attempts, implemented per protocol
    virtual Status try_upload(const std::string& local_path, const std::string& remote_path) = 0;
    virtual Status try_download(const std::string& remote_path, const std::string& local_path) = 0;
    virtual Status try_list(const std::string& remote_dir, std::vector<std::string>& names) = 0;
    virtual Status try_move(const std::string& remote_src, const std::string& remote_dst) = 0;
    virtual Status try_ensure_dir(const std::string& remote_dir) = 0;

private:
    RetryPolicy policy_;

    Status with_retry(const char* op, const std::string& target,
                      const std::function<Status()>& attempt);
};

// Joins remote path segments with exactly one '/' between them
std::string join_remote_path(const std::string& dir, const std::string& name);

} // namespace ifx
