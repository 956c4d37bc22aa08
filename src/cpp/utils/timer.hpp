#pragma once
// Wall-clock helpers for transfer and pipeline step durations
#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace ifx {

class Timer {
public:
    void start() noexcept { start_ = std::chrono::steady_clock::now(); }

    void stop() noexcept { end_ = std::chrono::steady_clock::now(); }

    [[nodiscard]] int64_t elapsed_ms() const noexcept {
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_ - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_{};
    std::chrono::steady_clock::time_point end_{};
};

// Local time formatted with strftime, e.g. "%Y%m%d_%H%M%S"
inline std::string format_local_time(std::chrono::system_clock::time_point tp,
                                      const char* fmt) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    struct tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    char buf[64];
    std::strftime(buf, sizeof(buf), fmt, &tm_buf);
    return buf;
}

} // namespace ifx
