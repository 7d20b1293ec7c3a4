#pragma once

#include <ctime>
#include <string>

bool create_dir(const std::string& path);

// Formats a local time with strftime-style format (e.g. "%Y%m%d_%H%M%S")
std::string format_local_time(std::time_t t, const char* format);

// Changes seconds of the day into HH:MM format
std::string format_day_seconds(int seconds);

// Parses "HH:MM" (or "HH:MM:SS") into seconds since midnight, -1 if malformed
int parse_time_of_day(const std::string& text);

// Strips leading/trailing whitespace
std::string trim(const std::string& text);

// Escapes a string for embedding in a JSON document (without the quotes)
std::string json_escape(const std::string& text);

std::tm local_tm(std::time_t t);

// Points local-time conversion at `tz` (Olson name or POSIX TZ string); an
// empty value falls back to the system zone.
bool set_time_zone(const std::string& tz);
