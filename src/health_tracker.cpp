// health_tracker.cpp

#include "health_tracker.hpp"

const char* health_status_name(HealthStatus status) {
    switch (status) {
    case HealthStatus::Ok:       return "ok";
    case HealthStatus::Degraded: return "degraded";
    case HealthStatus::Error:    return "error";
    }
    return "ok";
}

HealthTracker::HealthTracker(int failure_threshold)
    : failure_threshold(failure_threshold < 1 ? 1 : failure_threshold),
      consecutive_failures(0), consecutive_successes(0) {}

void HealthTracker::record_success() {
    consecutive_failures = 0;
    consecutive_successes++;
}

void HealthTracker::record_failure(CaptureErrorKind kind) {
    consecutive_successes = 0;
    consecutive_failures++;
    last_failure = kind;
}

HealthSnapshot HealthTracker::status() const {
    HealthSnapshot snapshot;
    snapshot.consecutive_failures = consecutive_failures;
    snapshot.consecutive_successes = consecutive_successes;
    snapshot.last_failure = last_failure;

    if (consecutive_failures >= failure_threshold) {
        snapshot.status = HealthStatus::Error;
    } else if (consecutive_failures > 0) {
        snapshot.status = HealthStatus::Degraded;
    } else {
        snapshot.status = HealthStatus::Ok;
    }
    return snapshot;
}

void HealthTracker::set_failure_threshold(int threshold) {
    failure_threshold = threshold < 1 ? 1 : threshold;
}
