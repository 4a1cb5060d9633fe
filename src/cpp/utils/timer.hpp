#pragma once
// Wall-clock timing for per-file and per-import log lines
#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace credingest {

class Timer {
public:
    Timer() noexcept { start(); }

    void start() noexcept { start_ = std::chrono::steady_clock::now(); }

    [[nodiscard]] int64_t elapsed_ms() const noexcept {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_).count();
    }

    [[nodiscard]] double elapsed_sec() const noexcept {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_{};
};

// Current local date as YYYY-MM-DD (the "ingested on" stamp)
inline std::string local_date_string() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    struct tm tm_buf{};
    localtime_r(&t, &tm_buf);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm_buf);
    return buf;
}

// Current UTC time as ISO-8601
inline std::string utc_timestamp() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    struct tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

} // namespace credingest
