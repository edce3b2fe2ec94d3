#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace dl::util {

inline std::string timestampToString(const std::time_t ts) {
    std::tm tm{};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

inline std::string timestampToString(const std::chrono::system_clock::time_point tp) {
    return timestampToString(std::chrono::system_clock::to_time_t(tp));
}

inline std::time_t parseTimestampFromString(const std::string& iso) {
    std::tm tm = {};
    std::istringstream ss(iso);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) throw std::runtime_error("Failed to parse timestamp: " + iso);
    return timegm(&tm); // returns UTC-based time_t
}

inline std::chrono::system_clock::time_point parseTimePoint(const std::string& iso) {
    return std::chrono::system_clock::from_time_t(parseTimestampFromString(iso));
}

} // namespace dl::util
