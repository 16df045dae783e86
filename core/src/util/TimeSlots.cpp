#include "courtops/core/util/TimeSlots.h"

#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace courtops::core::util {

namespace {

constexpr int kMinutesPerDay = 24 * 60;

int FloorDiv(int value, int divisor) {
    int quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --quotient;
    }
    return quotient;
}

}  // namespace

bool ParseClock(const std::string& text, int& minutes_of_day) {
    int hours = 0;
    int minutes = 0;
    char trailing = 0;
    if (std::sscanf(text.c_str(), "%d:%d%c", &hours, &minutes, &trailing) != 2) {
        return false;
    }
    if (hours < 0 || hours > 23 || minutes < 0 || minutes > 59) {
        return false;
    }
    minutes_of_day = hours * 60 + minutes;
    return true;
}

int TimeToSlot(const std::string& time, const model::TournamentConfig& config) {
    int start = 0;
    int end = 0;
    int value = 0;
    if (!ParseClock(config.day_start, start) || !ParseClock(time, value)) {
        return 0;
    }
    if (!ParseClock(config.day_end, end)) {
        end = kMinutesPerDay;
    }
    const bool overnight = end <= start;
    if (overnight && value < start) {
        value += kMinutesPerDay;
    }
    return FloorDiv(value - start, std::max(1, config.interval_minutes));
}

std::string SlotToTime(int slot, const model::TournamentConfig& config) {
    int start = 0;
    ParseClock(config.day_start, start);
    int minutes = (start + slot * config.interval_minutes) % kMinutesPerDay;
    if (minutes < 0) {
        minutes += kMinutesPerDay;
    }
    std::ostringstream out;
    out << std::setw(2) << std::setfill('0') << (minutes / 60) << ':'
        << std::setw(2) << std::setfill('0') << (minutes % 60);
    return out.str();
}

int CurrentSlot(const model::TournamentConfig& config, std::time_t now) {
    return std::max(0, TimeToSlot(FormatClock(now), config));
}

int RestSlots(int rest_minutes, const model::TournamentConfig& config) {
    if (rest_minutes <= 0) {
        return 0;
    }
    const int interval = std::max(1, config.interval_minutes);
    return (rest_minutes + interval - 1) / interval;
}

std::string FormatClock(std::time_t timestamp) {
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &timestamp);
#else
    localtime_r(&timestamp, &local);
#endif
    std::ostringstream out;
    out << std::put_time(&local, "%H:%M");
    return out.str();
}

std::string FormatUtcTimestamp(std::time_t timestamp) {
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &timestamp);
#else
    gmtime_r(&timestamp, &utc);
#endif
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

}  // namespace courtops::core::util
