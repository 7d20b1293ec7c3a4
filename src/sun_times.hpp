// sun_times.hpp

#pragma once

#include <ctime>
#include <mutex>
#include <optional>
#include <string>

#include "config.hpp"

// Sunrise and sunset of one date, in local seconds since midnight.
struct SunTimes {
    int sunrise;
    int sunset;
};

class SunResolver {
public:
    virtual ~SunResolver() = default;

    // Sunrise/sunset for the calendar date of `local_date` at the configured
    // coordinates, or nothing when the sun does not rise or set that day.
    virtual std::optional<SunTimes> sun_times(const std::tm& local_date, const ScheduleConfig& config) = 0;
};

// Almanac sunrise/sunset algorithm (official zenith, ~1-2 minute accuracy).
// Results are cached per date, location and time zone.
class AlmanacSunResolver : public SunResolver {
private:
    std::mutex cache_mutex;
    bool cache_valid = false;
    int cached_year = 0;
    int cached_yday = 0;
    double cached_lat = 0.0;
    double cached_lon = 0.0;
    std::string cached_tz;
    std::optional<SunTimes> cached;

public:
    std::optional<SunTimes> sun_times(const std::tm& local_date, const ScheduleConfig& config) override;

    // Sunrise or sunset in UTC hours for the given date, nothing for polar day/night.
    static std::optional<double> utc_event_hour(int year, int month, int day,
                                                double lat, double lon, bool sunrise);
};
