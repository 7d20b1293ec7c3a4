// time_window.cpp

#include "time_window.hpp"

bool is_active(const std::tm& now, const ScheduleConfig& config, const std::optional<SunTimes>& sun) {
    if (config.active_days.count(now.tm_wday) == 0) {
        return false;
    }

    int current = now.tm_hour * 3600 + now.tm_min * 60 + now.tm_sec;
    if (current < config.active_start || current > config.active_end) {
        return false;
    }

    if (config.use_astral) {
        if (!sun) {
            return false;
        }
        return current >= sun->sunrise && current <= sun->sunset;
    }

    return true;
}
