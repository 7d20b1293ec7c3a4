// health_tracker.hpp

#pragma once

#include <optional>

#include "capture_error.hpp"

enum class HealthStatus { Ok, Degraded, Error };

const char* health_status_name(HealthStatus status);

struct HealthSnapshot {
    HealthStatus status = HealthStatus::Ok;
    int consecutive_failures = 0;
    int consecutive_successes = 0;
    std::optional<CaptureErrorKind> last_failure;
};

// Camera health from consecutive capture outcomes. Degrades slowly (error
// only after `failure_threshold` failures in a row) and recovers on the first
// success. Not thread-safe; the scheduler guards it with its state lock.
class HealthTracker {
private:
    int failure_threshold;
    int consecutive_failures;
    int consecutive_successes;
    std::optional<CaptureErrorKind> last_failure;

public:
    explicit HealthTracker(int failure_threshold = 3);

    void record_success();
    void record_failure(CaptureErrorKind kind);

    HealthSnapshot status() const;

    void set_failure_threshold(int threshold);
};
