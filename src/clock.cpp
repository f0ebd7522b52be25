#include "resguard/clock.hpp"

#include <cstdio>
#include <ctime>

namespace resguard {

namespace {

std::string format_with(TimePoint tp, const char* pattern) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);
    char buffer[64];
    std::size_t n = std::strftime(buffer, sizeof(buffer), pattern, &local);
    return std::string(buffer, n);
}

} // namespace

std::string format_datetime(TimePoint tp) {
    return format_with(tp, "%Y-%m-%d %H:%M:%S");
}

std::string format_time_of_day(TimePoint tp) {
    return format_with(tp, "%H:%M:%S");
}

std::string format_seconds(std::chrono::milliseconds elapsed) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f", static_cast<double>(elapsed.count()) / 1000.0);
    return buffer;
}

} // namespace resguard
