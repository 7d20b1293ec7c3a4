// logger.hpp

#pragma once

#include <string>
#include <vector>

// --- Constants ---
#define LOGS_PATH "logs/"
#define DEFAULT_LOG_FILE "logs/chronocam.log"
#define LOG_BUFFER_LINES 200

// Where log_status() writes besides stdout. An empty path disables the file.
void configure_logging(bool file_enabled, const std::string& log_file);

// Writes "[YYYYMMDD_HHMMSS] message" to stdout, the log file and the
// in-memory buffer. Safe to call from any thread.
void log_status(const std::string& message);

// Most recent buffered lines, oldest first.
std::vector<std::string> recent_logs(size_t n = LOG_BUFFER_LINES);
