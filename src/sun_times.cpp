// sun_times.cpp

#include "sun_times.hpp"

#include <cmath>

#include "utils.hpp"

namespace {

const double PI = 3.14159265358979323846;
const double ZENITH = 90.833; // official: 90deg 50', includes refraction

double deg_sin(double deg) { return std::sin(deg * PI / 180.0); }
double deg_cos(double deg) { return std::cos(deg * PI / 180.0); }
double deg_tan(double deg) { return std::tan(deg * PI / 180.0); }
double deg_asin(double x) { return std::asin(x) * 180.0 / PI; }
double deg_acos(double x) { return std::acos(x) * 180.0 / PI; }
double deg_atan(double x) { return std::atan(x) * 180.0 / PI; }

double normalize(double value, double range) {
    value = std::fmod(value, range);
    return value < 0 ? value + range : value;
}

int to_local_day_seconds(int year, int month, int day, double utc_hour) {
    std::tm midnight{};
    midnight.tm_year = year - 1900;
    midnight.tm_mon = month - 1;
    midnight.tm_mday = day;
    std::time_t event = timegm(&midnight) + static_cast<std::time_t>(std::lround(utc_hour * 3600.0));
    std::tm local = local_tm(event);
    return local.tm_hour * 3600 + local.tm_min * 60 + local.tm_sec;
}

} // namespace

std::optional<double> AlmanacSunResolver::utc_event_hour(int year, int month, int day,
                                                         double lat, double lon, bool sunrise) {
    // 1. Day of the year
    int n1 = (275 * month) / 9;
    int n2 = (month + 9) / 12;
    int n3 = 1 + (year - 4 * (year / 4) + 2) / 3;
    int n = n1 - (n2 * n3) + day - 30;

    // 2. Approximate time of the event
    double lng_hour = lon / 15.0;
    double t = n + ((sunrise ? 6.0 : 18.0) - lng_hour) / 24.0;

    // 3. Sun's mean anomaly and true longitude
    double m = (0.9856 * t) - 3.289;
    double l = normalize(m + (1.916 * deg_sin(m)) + (0.020 * deg_sin(2 * m)) + 282.634, 360.0);

    // 4. Right ascension, in the same quadrant as L, in hours
    double ra = normalize(deg_atan(0.91764 * deg_tan(l)), 360.0);
    double l_quadrant = std::floor(l / 90.0) * 90.0;
    double ra_quadrant = std::floor(ra / 90.0) * 90.0;
    ra = (ra + (l_quadrant - ra_quadrant)) / 15.0;

    // 5. Declination and local hour angle
    double sin_dec = 0.39782 * deg_sin(l);
    double cos_dec = deg_cos(deg_asin(sin_dec));
    double cos_h = (deg_cos(ZENITH) - (sin_dec * deg_sin(lat))) / (cos_dec * deg_cos(lat));
    if (cos_h > 1.0 || cos_h < -1.0) {
        // Polar night (never rises) or midnight sun (never sets)
        return std::nullopt;
    }

    double h = (sunrise ? 360.0 - deg_acos(cos_h) : deg_acos(cos_h)) / 15.0;

    // 6. Local mean time, then UTC
    double local_mean = h + ra - (0.06571 * t) - 6.622;
    return normalize(local_mean - lng_hour, 24.0);
}

std::optional<SunTimes> AlmanacSunResolver::sun_times(const std::tm& local_date, const ScheduleConfig& config) {
    std::lock_guard<std::mutex> lock(cache_mutex);
    if (cache_valid && cached_year == local_date.tm_year && cached_yday == local_date.tm_yday &&
        cached_lat == config.city_lat && cached_lon == config.city_lon && cached_tz == config.city_tz) {
        return cached;
    }

    int year = local_date.tm_year + 1900;
    int month = local_date.tm_mon + 1;
    int day = local_date.tm_mday;

    auto rise = utc_event_hour(year, month, day, config.city_lat, config.city_lon, true);
    auto set = utc_event_hour(year, month, day, config.city_lat, config.city_lon, false);

    if (rise && set) {
        cached = SunTimes{to_local_day_seconds(year, month, day, *rise),
                          to_local_day_seconds(year, month, day, *set)};
    } else {
        cached = std::nullopt;
    }

    cache_valid = true;
    cached_year = local_date.tm_year;
    cached_yday = local_date.tm_yday;
    cached_lat = config.city_lat;
    cached_lon = config.city_lon;
    cached_tz = config.city_tz;
    return cached;
}
