#pragma once
// FTP transfer client -- libcurl easy interface, one handle per attempt.
// Remote paths are relative to FtpConfig::remote_root (or the login
// directory when no root is configured).
#include "transfer_client.hpp"

namespace ifx {

class FtpTransferClient : public TransferClient {
public:
    FtpTransferClient(FtpConfig config, RetryPolicy policy);

    [[nodiscard]] const char* client_name() const override { return "ftp"; }

    // ftp://host:port/<root>/<path>, each segment percent-encoded
    [[nodiscard]] std::string build_url(const std::string& path, bool is_dir) const;

    // <root>/<path> as sent in raw FTP commands (RNFR/RNTO), relative to
    // the login directory like the URL path
    [[nodiscard]] std::string command_path(const std::string& path) const;

protected:
    Status try_upload(const std::string& local_path, const std::string& remote_path) override;
    Status try_download(const std::string& remote_path, const std::string& local_path) override;
    Status try_list(const std::string& remote_dir, std::vector<std::string>& names) override;
    Status try_move(const std::string& remote_src, const std::string& remote_dst) override;
    Status try_ensure_dir(const std::string& remote_dir) override;

private:
    FtpConfig config_;

    // ftp://host:port/ -- the login directory
    [[nodiscard]] std::string login_url() const;

    // Creates an easy handle with URL, credentials, timeouts and error buffer
    // set. Returns CURL* as void* to avoid #include <curl/curl.h> in header.
    void* setup_request(const std::string& url, char* errbuf) const;
};

} // namespace ifx
