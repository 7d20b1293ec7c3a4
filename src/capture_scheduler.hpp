// capture_scheduler.hpp

#pragma once

#include <chrono>
#include <condition_variable>
#include <ctime>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "camera_client.hpp"
#include "capture_error.hpp"
#include "config.hpp"
#include "event_bus.hpp"
#include "health_tracker.hpp"
#include "snapshot_store.hpp"
#include "sun_times.hpp"

enum class SchedulerState { Running, Paused, WaitingWindow };

const char* scheduler_state_name(SchedulerState state);

struct CaptureOutcome {
    std::optional<StoredSnapshot> snapshot;
    std::optional<CaptureError> error;

    bool ok() const { return snapshot.has_value(); }
};

// Everything the dashboard's status endpoint shows.
struct SchedulerStatus {
    std::time_t now = 0;
    std::string instance_name;
    SchedulerState state = SchedulerState::WaitingWindow;
    long generation = 0;
    bool paused = false;
    bool active = false;
    bool use_astral = false;
    std::optional<SunTimes> sun;
    long image_count = 0;
    std::optional<StoredSnapshot> last_snapshot;
    std::optional<CaptureError> camera_error;
    HealthSnapshot health;
};

std::string status_to_json(const SchedulerStatus& status);

// --- Class Definition ---
// Decides when to capture, captures, stores, tracks camera health and
// publishes what happened. One background thread drives tick() on the
// configured interval; pause/resume/force_snapshot/reload_config may be
// called from any thread.
//
// Locking: state_mutex guards configuration, runtime and health state and is
// never held across network or disk I/O. capture_mutex serializes capture
// attempts so the regular tick and force_snapshot() never overlap.
class CaptureScheduler {
public:
    using Clock = std::function<std::time_t()>;

private:
    SnapshotSource& camera;
    EventBus& bus;
    SunResolver& sun_resolver;
    Clock clock;

    mutable std::mutex state_mutex;
    std::shared_ptr<const ScheduleConfig> config;
    std::shared_ptr<SnapshotStore> store;
    long generation;
    bool paused;
    SchedulerState state;
    HealthTracker health;
    std::optional<CaptureError> camera_error;

    std::mutex capture_mutex;

    // Background loop
    std::thread loop_thread;
    std::mutex loop_mutex;
    std::condition_variable loop_cv;
    bool stopping;
    bool wake;

    bool window_active(const ScheduleConfig& cfg, std::time_t now) const;
    SchedulerState evaluate(const ScheduleConfig& cfg, bool is_paused, std::time_t now) const;
    CaptureOutcome capture();
    void record_health(const std::optional<CaptureError>& failure, HealthSnapshot& before, HealthSnapshot& after);
    void publish_status(StatusKind kind);
    void loop();

public:
    // Validates the configuration (ConfigError) and opens the snapshot
    // directory (StorageError).
    CaptureScheduler(const ScheduleConfig& initial, SnapshotSource& camera, EventBus& bus,
                     SunResolver& sun_resolver, Clock clock = [] { return std::time(nullptr); });
    ~CaptureScheduler();

    CaptureScheduler(const CaptureScheduler&) = delete;
    CaptureScheduler& operator=(const CaptureScheduler&) = delete;

    // Starts/stops the background loop thread.
    void start();
    void stop();

    // One scheduling iteration: evaluate pause and window, capture if active.
    void tick();

    void pause();
    void resume();

    // Captures now regardless of pause and window; the interval phase is untouched.
    CaptureOutcome force_snapshot();

    // Reachability check without a capture. Feeds camera health and always
    // publishes the resulting CameraHealth; nothing on success. The loop runs
    // it every healthcheck_seconds while not capturing.
    std::optional<CaptureError> check_camera();

    // All-or-nothing: throws ConfigError and keeps the running generation
    // when `next` is invalid or its save_path is unusable. Also applies
    // city_tz, the logging keys and subscriber_queue_limit (new subscribers);
    // http_address/http_port only take effect after a restart.
    void reload_config(const ScheduleConfig& next);

    SchedulerStatus status() const;
    SchedulerState current_state() const;
    long current_generation() const;
    bool is_paused() const;
    std::shared_ptr<const ScheduleConfig> current_config() const;
    std::string latest_image_path() const;
};
