#ifndef RESGUARD_CLOCK_HPP
#define RESGUARD_CLOCK_HPP

#include <chrono>
#include <string>

// @safe
namespace resguard {

using TimePoint = std::chrono::system_clock::time_point;

// Source of timestamps for markers, line prefixes and connection durations
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

// Clock that only moves when told to
class ManualClock : public Clock {
private:
    TimePoint current_;

public:
    explicit ManualClock(TimePoint start = TimePoint()) : current_(start) {}

    TimePoint now() const override { return current_; }

    void advance(std::chrono::milliseconds step) { current_ += step; }
};

// Local time, "YYYY-MM-DD HH:MM:SS"
std::string format_datetime(TimePoint tp);

// Local time, "HH:MM:SS"
std::string format_time_of_day(TimePoint tp);

// Seconds with two decimals, e.g. "1.25"
std::string format_seconds(std::chrono::milliseconds elapsed);

} // namespace resguard

#endif // RESGUARD_CLOCK_HPP
