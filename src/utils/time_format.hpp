#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline std::string formatTime(const TimePoint& tp, const char* format) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, format);
    return oss.str();
}

inline std::string toIsoString(const TimePoint& tp) {
    return formatTime(tp, "%Y-%m-%dT%H:%M:%S");
}

inline bool parseTime(const std::string& text, const char* format, TimePoint& out) {
    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, format);
    if (iss.fail()) {
        return false;
    }
    tm.tm_isdst = -1;
    std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return false;
    }
    out = Clock::from_time_t(t);
    return true;
}

inline double secondsBetween(const TimePoint& from, const TimePoint& to) {
    return std::chrono::duration<double>(to - from).count();
}
