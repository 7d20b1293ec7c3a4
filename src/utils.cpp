// utils.cpp

#include "utils.hpp"
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <cstdlib>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <sys/stat.h>

// Creates a directory. Returns true if successful or if it already exists.
bool create_dir(const std::string& path) {
    if (mkdir(path.c_str(), 0777) == -1) {
        if (errno == EEXIST) {
            struct stat st;
            return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
        } else {
            std::cerr << "Error creating directory " << path << ": " << strerror(errno) << std::endl;
            return false;
        }
    }
    return true;
}

bool set_time_zone(const std::string& tz) {
    int rc = tz.empty() ? unsetenv("TZ") : setenv("TZ", tz.c_str(), 1);
    if (rc != 0) {
        std::cerr << "Error setting time zone " << tz << ": " << strerror(errno) << std::endl;
        return false;
    }
    // localtime_r() only picks up a changed TZ after tzset()
    tzset();
    return true;
}

std::tm local_tm(std::time_t t) {
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

std::string format_local_time(std::time_t t, const char* format) {
    std::tm tm = local_tm(t);
    std::stringstream ss;
    ss << std::put_time(&tm, format);
    return ss.str();
}

std::string format_day_seconds(int seconds) {
    int h = seconds / 3600;
    int m = (seconds % 3600) / 60;

    std::stringstream ss;
    ss << std::setfill('0') << std::setw(2) << h << ":"
       << std::setfill('0') << std::setw(2) << m;
    return ss.str();
}

int parse_time_of_day(const std::string& text) {
    std::string value = trim(text);
    if (value.size() != 5 && value.size() != 8) {
        return -1;
    }
    for (size_t i = 0; i < value.size(); i++) {
        bool separator = (i == 2 || i == 5);
        if (separator ? value[i] != ':' : !std::isdigit(static_cast<unsigned char>(value[i]))) {
            return -1;
        }
    }

    int hour = std::stoi(value.substr(0, 2));
    int minute = std::stoi(value.substr(3, 2));
    int second = value.size() == 8 ? std::stoi(value.substr(6, 2)) : 0;
    if (hour > 23 || minute > 59 || second > 59) {
        return -1;
    }
    return hour * 3600 + minute * 60 + second;
}

std::string trim(const std::string& text) {
    const char* whitespace = " \t\n\r";
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

std::string json_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                out += buf;
            } else {
                out += c;
            }
        }
    }
    return out;
}
