#include "utils.hpp"
#include <chrono>
#include <ctime>
#include <cstdio>

std::string program_basename(const std::string& program) {
    auto slash = program.find_last_of('/');
    if (slash == std::string::npos) return program;
    return program.substr(slash + 1);
}

std::string now_log_stamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    return std::string(ts);
}
