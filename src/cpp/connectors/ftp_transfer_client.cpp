#include "ftp_transfer_client.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"
#include <curl/curl.h>
#include <cstdio>
#include <filesystem>
#include <sstream>

namespace ifx {
namespace fs = std::filesystem;

// ---- curl write callback ----
static size_t curl_write_cb(char* ptr, size_t size, size_t nmemb, std::string* data) {
    data->append(ptr, size * nmemb);
    return size * nmemb;
}

// Unreachable endpoint or refused login: nothing was touched remotely
static Status curl_failure(CURLcode code, const char* errbuf, const std::string& what) {
    std::string msg = what + ": " + curl_easy_strerror(code);
    if (errbuf && errbuf[0]) msg += std::string(" (") + errbuf + ")";

    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_LOGIN_DENIED:
        case CURLE_OPERATION_TIMEDOUT:
            return Status::failure(ErrorKind::CONNECTION, msg);
        default:
            return Status::failure(ErrorKind::TRANSFER, msg);
    }
}

FtpTransferClient::FtpTransferClient(FtpConfig config, RetryPolicy policy)
    : TransferClient(policy), config_(std::move(config)) {}

std::string FtpTransferClient::command_path(const std::string& path) const {
    std::string full = join_remote_path(config_.remote_root, path);
    size_t skip = 0;
    while (skip < full.size() && full[skip] == '/') ++skip;
    return full.substr(skip);
}

std::string FtpTransferClient::build_url(const std::string& path, bool is_dir) const {
    std::string url = "ftp://" + config_.host + ":" + std::to_string(config_.port);

    std::string full = join_remote_path(config_.remote_root, path);
    std::istringstream segments(full);
    std::string seg;
    while (std::getline(segments, seg, '/')) {
        if (seg.empty()) continue;
        char* escaped = curl_easy_escape(nullptr, seg.c_str(), static_cast<int>(seg.size()));
        if (escaped) {
            url += "/";
            url += escaped;
            curl_free(escaped);
        }
    }
    if (is_dir) url += "/";
    return url;
}

std::string FtpTransferClient::login_url() const {
    return "ftp://" + config_.host + ":" + std::to_string(config_.port) + "/";
}

void* FtpTransferClient::setup_request(const std::string& url, char* errbuf) const {
    CURL* curl = curl_easy_init();
    if (!curl) return nullptr;

    errbuf[0] = '\0';
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, config_.timeout_s);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Anonymous login is curl's default when no user is set
    if (!config_.user.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERNAME, config_.user.c_str());
        curl_easy_setopt(curl, CURLOPT_PASSWORD, config_.password.c_str());
    }
    if (!config_.passive) {
        curl_easy_setopt(curl, CURLOPT_FTPPORT, "-");
    }
    return curl;
}

Status FtpTransferClient::try_upload(const std::string& local_path, const std::string& remote_path) {
    std::error_code ec;
    auto size = fs::file_size(local_path, ec);
    if (ec) {
        return Status::failure(ErrorKind::TRANSFER,
            "cannot stat " + local_path + ": " + ec.message());
    }

    std::FILE* in = std::fopen(local_path.c_str(), "rb");
    if (!in) return Status::failure(ErrorKind::TRANSFER, "cannot open " + local_path);

    char errbuf[CURL_ERROR_SIZE];
    CURL* curl = static_cast<CURL*>(setup_request(build_url(remote_path, false), errbuf));
    if (!curl) {
        std::fclose(in);
        return Status::failure(ErrorKind::TRANSFER, "curl_easy_init failed");
    }

    curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl, CURLOPT_READDATA, in);
    curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));

    Timer timer;
    timer.start();
    CURLcode res = curl_easy_perform(curl);
    timer.stop();
    curl_easy_cleanup(curl);
    std::fclose(in);

    if (res != CURLE_OK) return curl_failure(res, errbuf, "upload " + remote_path);

    LOG_INF("[ftp] Uploaded %s -> %s (%llu bytes, %lld ms)",
        local_path.c_str(), remote_path.c_str(),
        static_cast<unsigned long long>(size), static_cast<long long>(timer.elapsed_ms()));
    return Status::success();
}

Status FtpTransferClient::try_download(const std::string& remote_path, const std::string& local_path) {
    std::FILE* out = std::fopen(local_path.c_str(), "wb");
    if (!out) return Status::failure(ErrorKind::TRANSFER, "cannot create " + local_path);

    char errbuf[CURL_ERROR_SIZE];
    CURL* curl = static_cast<CURL*>(setup_request(build_url(remote_path, false), errbuf));
    if (!curl) {
        std::fclose(out);
        std::remove(local_path.c_str());
        return Status::failure(ErrorKind::TRANSFER, "curl_easy_init failed");
    }

    // Default write function is fwrite into WRITEDATA
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, out);

    Timer timer;
    timer.start();
    CURLcode res = curl_easy_perform(curl);
    timer.stop();
    curl_easy_cleanup(curl);
    bool flushed = std::fclose(out) == 0;

    if (res != CURLE_OK || !flushed) {
        // Never leave a partial staging file behind
        std::remove(local_path.c_str());
        if (res == CURLE_OK) {
            return Status::failure(ErrorKind::TRANSFER, "write failed for " + local_path);
        }
        return curl_failure(res, errbuf, "download " + remote_path);
    }

    LOG_INF("[ftp] Downloaded %s -> %s (%lld ms)",
        remote_path.c_str(), local_path.c_str(), static_cast<long long>(timer.elapsed_ms()));
    return Status::success();
}

Status FtpTransferClient::try_list(const std::string& remote_dir, std::vector<std::string>& names) {
    char errbuf[CURL_ERROR_SIZE];
    CURL* curl = static_cast<CURL*>(setup_request(build_url(remote_dir, true), errbuf));
    if (!curl) return Status::failure(ErrorKind::TRANSFER, "curl_easy_init failed");

    std::string response;
    curl_easy_setopt(curl, CURLOPT_DIRLISTONLY, 1L);  // NLST
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_cleanup(curl);
    if (res != CURLE_OK) return curl_failure(res, errbuf, "list " + remote_dir);

    std::istringstream iss(response);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        // Some servers answer NLST with "dir/name"
        size_t slash = line.find_last_of('/');
        if (slash != std::string::npos) line = line.substr(slash + 1);
        if (line.empty() || line == "." || line == "..") continue;
        names.push_back(line);
    }

    LOG_DBG("[ftp] Listed %s: %zu entries", remote_dir.c_str(), names.size());
    return Status::success();
}

Status FtpTransferClient::try_move(const std::string& remote_src, const std::string& remote_dst) {
    char errbuf[CURL_ERROR_SIZE];
    // QUOTE commands are sent right after login, before any CWD, so both
    // paths are given relative to the login directory
    CURL* curl = static_cast<CURL*>(setup_request(login_url(), errbuf));
    if (!curl) return Status::failure(ErrorKind::TRANSFER, "curl_easy_init failed");

    struct curl_slist* cmds = nullptr;
    cmds = curl_slist_append(cmds, ("RNFR " + command_path(remote_src)).c_str());
    cmds = curl_slist_append(cmds, ("RNTO " + command_path(remote_dst)).c_str());
    curl_easy_setopt(curl, CURLOPT_QUOTE, cmds);
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(cmds);
    curl_easy_cleanup(curl);
    if (res != CURLE_OK) return curl_failure(res, errbuf, "move " + remote_src);

    LOG_INF("[ftp] Moved %s -> %s", remote_src.c_str(), remote_dst.c_str());
    return Status::success();
}

Status FtpTransferClient::try_ensure_dir(const std::string& remote_dir) {
    char errbuf[CURL_ERROR_SIZE];
    CURL* curl = static_cast<CURL*>(setup_request(build_url(remote_dir, true), errbuf));
    if (!curl) return Status::failure(ErrorKind::TRANSFER, "curl_easy_init failed");

    // CWD into each component, MKD where missing
    curl_easy_setopt(curl, CURLOPT_FTP_CREATE_MISSING_DIRS,
        static_cast<long>(CURLFTP_CREATE_DIR_RETRY));
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_cleanup(curl);
    if (res != CURLE_OK) return curl_failure(res, errbuf, "ensure_dir " + remote_dir);

    LOG_DBG("[ftp] Directory present: %s", remote_dir.c_str());
    return Status::success();
}

} // namespace ifx
