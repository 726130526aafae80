#pragma once

#include <chrono>
#include <ctime>
#include <string>

namespace rcs::util {

inline std::tm localNow() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&now_c, &tm);
    return tm;
}

// 20261019
inline std::string getDate() {
    const std::tm tm = localNow();
    char buffer[9];
    strftime(buffer, sizeof(buffer), "%Y%m%d", &tm);
    return {buffer};
}

// 143005
inline std::string getTimeOfDay() {
    const std::tm tm = localNow();
    char buffer[7];
    strftime(buffer, sizeof(buffer), "%H%M%S", &tm);
    return {buffer};
}

} // namespace rcs::util
