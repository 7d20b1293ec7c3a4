// config.cpp

#include "config.hpp"

#include <fstream>
#include <sstream>

#include "logger.hpp"
#include "utils.hpp"

namespace {

const char* WEEKDAY_NAMES[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};

int to_int(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        int result = std::stoi(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return result;
    } catch (const std::exception&) {
        throw ConfigError("Invalid integer for '" + key + "': " + value);
    }
}

double to_double(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        double result = std::stod(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return result;
    } catch (const std::exception&) {
        throw ConfigError("Invalid number for '" + key + "': " + value);
    }
}

bool to_bool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        return false;
    }
    throw ConfigError("Invalid boolean for '" + key + "': " + value);
}

int to_time_of_day(const std::string& key, const std::string& value) {
    int seconds = parse_time_of_day(value);
    if (seconds < 0) {
        throw ConfigError("Invalid time for '" + key + "' (expected HH:MM): " + value);
    }
    return seconds;
}

std::set<int> to_weekdays(const std::string& value) {
    std::set<int> days;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (item.empty()) {
            continue;
        }
        int wday = parse_weekday(item);
        if (wday < 0) {
            throw ConfigError("Unknown weekday in 'active_days': " + item);
        }
        days.insert(wday);
    }
    return days;
}

} // namespace

AuthType parse_auth_type(const std::string& value) {
    if (value == "none" || value.empty()) {
        return AuthType::None;
    }
    if (value == "basic") {
        return AuthType::Basic;
    }
    if (value == "digest") {
        return AuthType::Digest;
    }
    throw ConfigError("Unknown auth_type (none/basic/digest): " + value);
}

const char* auth_type_name(AuthType type) {
    switch (type) {
    case AuthType::None:   return "none";
    case AuthType::Basic:  return "basic";
    case AuthType::Digest: return "digest";
    }
    return "none";
}

int parse_weekday(const std::string& value) {
    for (int i = 0; i < 7; i++) {
        if (value == WEEKDAY_NAMES[i]) {
            return i;
        }
    }
    return -1;
}

const char* weekday_name(int wday) {
    if (wday < 0 || wday > 6) {
        return "?";
    }
    return WEEKDAY_NAMES[wday];
}

ScheduleConfig parse_config(const std::string& text, const std::string& origin) {
    ScheduleConfig config;
    std::stringstream input(text);

    std::string line;
    int line_number = 0;
    while (std::getline(input, line)) {
        line_number++;
        std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#') {
            continue;
        }

        size_t equals_pos = stripped.find('=');
        if (equals_pos == std::string::npos) {
            throw ConfigError(origin + ":" + std::to_string(line_number) + ": expected 'key = value'");
        }
        std::string key = trim(stripped.substr(0, equals_pos));
        std::string value = trim(stripped.substr(equals_pos + 1));

        if (key == "instance_name") {
            config.instance_name = value;
        } else if (key == "cam_url") {
            config.cam_url = value;
        } else if (key == "username") {
            config.username = value;
        } else if (key == "password") {
            config.password = value;
        } else if (key == "auth_type") {
            config.auth_type = parse_auth_type(value);
        } else if (key == "fetch_timeout_seconds") {
            config.fetch_timeout_seconds = to_int(key, value);
        } else if (key == "interval_seconds") {
            config.interval_seconds = to_int(key, value);
        } else if (key == "active_start") {
            config.active_start = to_time_of_day(key, value);
        } else if (key == "active_end") {
            config.active_end = to_time_of_day(key, value);
        } else if (key == "active_days") {
            config.active_days = to_weekdays(value);
        } else if (key == "paused") {
            config.paused = to_bool(key, value);
        } else if (key == "use_astral") {
            config.use_astral = to_bool(key, value);
        } else if (key == "city_lat") {
            config.city_lat = to_double(key, value);
        } else if (key == "city_lon") {
            config.city_lon = to_double(key, value);
        } else if (key == "city_tz") {
            config.city_tz = value;
        } else if (key == "save_path") {
            config.save_path = value;
        } else if (key == "keep_archive") {
            config.keep_archive = to_bool(key, value);
        } else if (key == "max_archive_files") {
            config.max_archive_files = to_int(key, value);
        } else if (key == "failure_threshold") {
            config.failure_threshold = to_int(key, value);
        } else if (key == "status_heartbeat_seconds") {
            config.status_heartbeat_seconds = to_int(key, value);
        } else if (key == "healthcheck_seconds") {
            config.healthcheck_seconds = to_int(key, value);
        } else if (key == "subscriber_queue_limit") {
            config.subscriber_queue_limit = to_int(key, value);
        } else if (key == "http_address") {
            config.http_address = value;
        } else if (key == "http_port") {
            config.http_port = to_int(key, value);
        } else if (key == "log_enabled") {
            config.log_enabled = to_bool(key, value);
        } else if (key == "log_file") {
            config.log_file = value;
        } else {
            log_status("Warning: " + origin + ":" + std::to_string(line_number) + ": unknown key '" + key + "' ignored");
        }
    }

    validate_config(config);
    return config;
}

ScheduleConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Could not open config file: " + path);
    }

    std::stringstream contents;
    contents << file.rdbuf();
    return parse_config(contents.str(), path);
}

void validate_config(const ScheduleConfig& config) {
    if (config.cam_url.empty()) {
        throw ConfigError("'cam_url' is required");
    }
    if (config.cam_url.compare(0, 7, "http://") != 0) {
        throw ConfigError("'cam_url' must be an http:// URL: " + config.cam_url);
    }
    if (config.interval_seconds < 1) {
        throw ConfigError("'interval_seconds' must be at least 1");
    }
    if (config.fetch_timeout_seconds < 1 || config.fetch_timeout_seconds > MAX_FETCH_TIMEOUT_SECONDS) {
        throw ConfigError("'fetch_timeout_seconds' must be between 1 and " +
                          std::to_string(MAX_FETCH_TIMEOUT_SECONDS));
    }
    if (config.active_end < config.active_start) {
        throw ConfigError("'active_end' (" + format_day_seconds(config.active_end) +
                          ") is before 'active_start' (" + format_day_seconds(config.active_start) +
                          "); ranges across midnight are not supported");
    }
    if (config.active_days.empty()) {
        throw ConfigError("'active_days' must name at least one weekday");
    }
    if (config.auth_type != AuthType::None && config.username.empty()) {
        throw ConfigError(std::string("auth_type '") + auth_type_name(config.auth_type) + "' requires 'username'");
    }
    if (config.use_astral) {
        if (config.city_lat < -90.0 || config.city_lat > 90.0) {
            throw ConfigError("'city_lat' must be within [-90, 90]");
        }
        if (config.city_lon < -180.0 || config.city_lon > 180.0) {
            throw ConfigError("'city_lon' must be within [-180, 180]");
        }
    }
    if (config.save_path.empty()) {
        throw ConfigError("'save_path' must not be empty");
    }
    if (config.max_archive_files < 0) {
        throw ConfigError("'max_archive_files' must not be negative");
    }
    if (config.failure_threshold < 1) {
        throw ConfigError("'failure_threshold' must be at least 1");
    }
    if (config.status_heartbeat_seconds < 0) {
        throw ConfigError("'status_heartbeat_seconds' must not be negative");
    }
    if (config.healthcheck_seconds < 0) {
        throw ConfigError("'healthcheck_seconds' must not be negative");
    }
    if (config.subscriber_queue_limit < 1) {
        throw ConfigError("'subscriber_queue_limit' must be at least 1");
    }
    if (config.http_port < 1 || config.http_port > 65535) {
        throw ConfigError("'http_port' must be a valid TCP port");
    }

    if (config.interval_seconds <= config.fetch_timeout_seconds) {
        log_status("Warning: interval_seconds (" + std::to_string(config.interval_seconds) +
                   ") should be greater than fetch_timeout_seconds (" +
                   std::to_string(config.fetch_timeout_seconds) + "); a stuck fetch delays the next capture");
    }
}
