// config.hpp

#pragma once

#include <set>
#include <stdexcept>
#include <string>

#define DEFAULT_CONFIG_FILE "conf/chronocam.conf"
#define MAX_FETCH_TIMEOUT_SECONDS 15

enum class AuthType { None, Basic, Digest };

// Thrown for unreadable, malformed or inconsistent configuration.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// One generation of the schedule configuration. Never mutated once handed to
// the scheduler; a reload builds a new one.
struct ScheduleConfig {
    std::string instance_name;

    // Camera
    std::string cam_url;
    std::string username;
    std::string password;
    AuthType auth_type = AuthType::None;
    int fetch_timeout_seconds = 8;

    // Schedule
    int interval_seconds = 10;
    int active_start = 6 * 3600;   // seconds since midnight
    int active_end = 18 * 3600;
    std::set<int> active_days = {1, 2, 3, 4, 5}; // tm_wday values, 0 = Sunday
    bool paused = false;

    // Astral gating
    bool use_astral = false;
    double city_lat = 52.52;
    double city_lon = 13.405;
    std::string city_tz = "Europe/Berlin";

    // Storage
    std::string save_path = "./pictures";
    bool keep_archive = true;
    int max_archive_files = 0; // 0 = unlimited

    // Health and events
    int failure_threshold = 3;
    int status_heartbeat_seconds = 10;
    int healthcheck_seconds = 60; // reachability check outside captures, 0 = off
    int subscriber_queue_limit = 64;

    // Control server
    std::string http_address = "0.0.0.0";
    int http_port = 8080;

    // Logging
    bool log_enabled = true;
    std::string log_file = "logs/chronocam.log";
};

// Reads a "key = value" file. Throws ConfigError on any problem, including a
// failed validate_config().
ScheduleConfig load_config(const std::string& path);

// Same as load_config() but from already-read text; `origin` names the source
// in error messages.
ScheduleConfig parse_config(const std::string& text, const std::string& origin);

// Rejects inconsistent settings. Logs a warning (non-fatal) when the capture
// interval does not exceed the fetch timeout.
void validate_config(const ScheduleConfig& config);

AuthType parse_auth_type(const std::string& value);
const char* auth_type_name(AuthType type);

// "Mon".."Sun" -> tm_wday, -1 if unknown
int parse_weekday(const std::string& value);
const char* weekday_name(int wday);
