// logger.cpp

#include "logger.hpp"

#include <algorithm>
#include <ctime>
#include <deque>
#include <fstream>
#include <iostream>
#include <mutex>

#include "utils.hpp"

namespace {

std::mutex log_mutex;
std::deque<std::string> log_buffer;
bool log_to_file = true;
std::string log_file_path = DEFAULT_LOG_FILE;

} // namespace

void configure_logging(bool file_enabled, const std::string& log_file) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_to_file = file_enabled && !log_file.empty();
    log_file_path = log_file;
}

void log_status(const std::string& message) {
    auto timestamp = format_local_time(std::time(nullptr), "%Y%m%d_%H%M%S");
    std::string line = "[" + timestamp + "] " + message;

    std::lock_guard<std::mutex> lock(log_mutex);

    // Log to STDOUT
    std::cout << line << std::endl;

    // Log to a backup file inside the logs/ directory
    if (log_to_file) {
        std::ofstream logfile(log_file_path, std::ios::app);
        if (logfile.is_open()) {
            logfile << line << std::endl;
        }
    }

    log_buffer.push_back(line);
    if (log_buffer.size() > LOG_BUFFER_LINES) {
        log_buffer.pop_front();
    }
}

std::vector<std::string> recent_logs(size_t n) {
    std::lock_guard<std::mutex> lock(log_mutex);
    size_t count = std::min(n, log_buffer.size());
    return std::vector<std::string>(log_buffer.end() - static_cast<long>(count), log_buffer.end());
}
