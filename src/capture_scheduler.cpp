// capture_scheduler.cpp

#include "capture_scheduler.hpp"

#include <algorithm>
#include <sstream>

#include "logger.hpp"
#include "time_window.hpp"
#include "utils.hpp"

namespace {

StoreOptions store_options_for(const ScheduleConfig& cfg) {
    StoreOptions options;
    options.directory = cfg.save_path;
    options.keep_archive = cfg.keep_archive;
    options.max_archive_files = cfg.max_archive_files;
    return options;
}

bool same_store_options(const StoreOptions& a, const StoreOptions& b) {
    return a.directory == b.directory && a.keep_archive == b.keep_archive &&
           a.max_archive_files == b.max_archive_files;
}

StatusKind status_kind_for(SchedulerState state) {
    switch (state) {
    case SchedulerState::Running:       return StatusKind::Running;
    case SchedulerState::Paused:        return StatusKind::Paused;
    case SchedulerState::WaitingWindow: return StatusKind::WaitingWindow;
    }
    return StatusKind::WaitingWindow;
}

} // namespace

const char* scheduler_state_name(SchedulerState state) {
    return status_kind_name(status_kind_for(state));
}

std::string status_to_json(const SchedulerStatus& status) {
    std::stringstream ss;
    ss << "{"
       << "\"time\":\"" << format_local_time(status.now, "%H:%M:%S") << "\""
       << ",\"instance_name\":\"" << json_escape(status.instance_name) << "\""
       << ",\"state\":\"" << scheduler_state_name(status.state) << "\""
       << ",\"generation\":" << status.generation
       << ",\"active\":" << (status.active ? "true" : "false")
       << ",\"paused\":" << (status.paused ? "true" : "false");

    if (status.use_astral && status.sun) {
        ss << ",\"sunrise\":\"" << format_day_seconds(status.sun->sunrise) << "\""
           << ",\"sunset\":\"" << format_day_seconds(status.sun->sunset) << "\"";
    } else {
        ss << ",\"sunrise\":\"--:--\",\"sunset\":\"--:--\"";
    }

    ss << ",\"count\":" << status.image_count;
    if (status.last_snapshot) {
        ss << ",\"last_snapshot\":\"" << format_local_time(status.last_snapshot->timestamp, "%H:%M:%S") << "\""
           << ",\"last_snapshot_tooltip\":\"" << format_local_time(status.last_snapshot->timestamp, "%d.%m.%y %H:%M") << "\""
           << ",\"last_snapshot_file\":\"" << json_escape(status.last_snapshot->filename) << "\"";
    } else {
        ss << ",\"last_snapshot\":null,\"last_snapshot_tooltip\":null,\"last_snapshot_file\":null";
    }

    if (status.camera_error) {
        ss << ",\"camera_error\":{\"code\":\"" << json_escape(status.camera_error->code()) << "\""
           << ",\"message\":\"" << json_escape(status.camera_error->message) << "\"}";
    } else {
        ss << ",\"camera_error\":null";
    }

    ss << ",\"camera_health\":{\"status\":\"" << health_status_name(status.health.status) << "\""
       << ",\"consecutive_failures\":" << status.health.consecutive_failures
       << ",\"consecutive_successes\":" << status.health.consecutive_successes;
    if (status.health.last_failure) {
        ss << ",\"last_failure\":\"" << capture_error_code(*status.health.last_failure) << "\"";
    } else {
        ss << ",\"last_failure\":null";
    }
    ss << "}}";
    return ss.str();
}

// constructor
CaptureScheduler::CaptureScheduler(const ScheduleConfig& initial, SnapshotSource& camera, EventBus& bus,
                                   SunResolver& sun_resolver, Clock clock)
    : camera(camera), bus(bus), sun_resolver(sun_resolver), clock(std::move(clock)),
      generation(1), paused(initial.paused), state(SchedulerState::WaitingWindow),
      health(initial.failure_threshold), stopping(false), wake(false) {
    // 1. Reject a bad configuration before anything touches disk
    validate_config(initial);
    config = std::make_shared<const ScheduleConfig>(initial);

    // 2. Open the snapshot directory
    store = std::make_shared<SnapshotStore>(store_options_for(initial));

    log_status("Scheduler initialized - Output: " + initial.save_path);
    log_status("  Camera: " + initial.cam_url + " (auth: " + auth_type_name(initial.auth_type) + ")");
    log_status("  Window: " + format_day_seconds(initial.active_start) + " to " + format_day_seconds(initial.active_end) +
               (initial.use_astral ? " (sunrise to sunset)" : ""));
    log_status("  Interval: " + std::to_string(initial.interval_seconds) + " seconds");
}

CaptureScheduler::~CaptureScheduler() {
    stop();
}

bool CaptureScheduler::window_active(const ScheduleConfig& cfg, std::time_t now) const {
    std::tm local = local_tm(now);
    std::optional<SunTimes> sun;
    if (cfg.use_astral) {
        sun = sun_resolver.sun_times(local, cfg);
    }
    return is_active(local, cfg, sun);
}

SchedulerState CaptureScheduler::evaluate(const ScheduleConfig& cfg, bool is_paused, std::time_t now) const {
    if (is_paused) {
        return SchedulerState::Paused;
    }
    return window_active(cfg, now) ? SchedulerState::Running : SchedulerState::WaitingWindow;
}

void CaptureScheduler::publish_status(StatusKind kind) {
    bus.publish(StatusEvent{kind});
}

CaptureOutcome CaptureScheduler::capture() {
    std::lock_guard<std::mutex> capture_guard(capture_mutex);

    std::shared_ptr<const ScheduleConfig> cfg;
    std::shared_ptr<SnapshotStore> target;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        cfg = config;
        target = store;
    }

    // 1. Fetch (no locks held; bounded by the fetch timeout)
    auto capture_start = std::chrono::steady_clock::now();
    FetchResult fetched = camera.fetch_snapshot(*cfg);

    // 2. Persist
    CaptureOutcome outcome;
    if (fetched.ok()) {
        try {
            outcome.snapshot = target->save(fetched.image, clock());
        } catch (const StorageError& e) {
            outcome.error = CaptureError{CaptureErrorKind::StorageFailed, e.what()};
        }
    } else {
        outcome.error = fetched.error;
    }
    auto capture_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - capture_start).count();

    // 3. Health bookkeeping
    HealthSnapshot before;
    HealthSnapshot after;
    record_health(outcome.error, before, after);

    // 4. Tell the observers, only after everything above is done
    if (outcome.ok()) {
        log_status("Snapshot saved: " + outcome.snapshot->filename + " (" + std::to_string(capture_ms) + " ms)");
        bus.publish(SnapshotEvent{outcome.snapshot->timestamp, outcome.snapshot->filename});
    } else {
        log_status("ERROR: Capture failed [" + outcome.error->code() + "]: " + outcome.error->message);
        bus.publish(CameraErrorEvent{outcome.error->code(), outcome.error->message});
    }

    if (before.status != after.status) {
        log_status(std::string("Camera health: ") + health_status_name(before.status) + " -> " +
                   health_status_name(after.status) + " (" + std::to_string(after.consecutive_failures) +
                   " consecutive failures)");
        bus.publish(CameraHealthEvent{after.status, after.consecutive_failures});
    }

    return outcome;
}

void CaptureScheduler::record_health(const std::optional<CaptureError>& failure,
                                     HealthSnapshot& before, HealthSnapshot& after) {
    std::lock_guard<std::mutex> lock(state_mutex);
    before = health.status();
    if (failure) {
        health.record_failure(failure->kind);
        camera_error = failure;
    } else {
        health.record_success();
        camera_error.reset();
    }
    after = health.status();
}

std::optional<CaptureError> CaptureScheduler::check_camera() {
    std::lock_guard<std::mutex> capture_guard(capture_mutex);
    std::shared_ptr<const ScheduleConfig> cfg = current_config();

    std::optional<CaptureError> failure = camera.check_reachable(*cfg);

    HealthSnapshot before;
    HealthSnapshot after;
    record_health(failure, before, after);

    if (failure) {
        log_status("ERROR: Camera check failed [" + failure->code() + "]: " + failure->message);
    } else if (before.status != HealthStatus::Ok) {
        log_status("Camera reachable again");
    }
    if (before.status != after.status) {
        log_status(std::string("Camera health: ") + health_status_name(before.status) + " -> " +
                   health_status_name(after.status) + " (" + std::to_string(after.consecutive_failures) +
                   " consecutive failures)");
    }
    bus.publish(CameraHealthEvent{after.status, after.consecutive_failures});
    return failure;
}

void CaptureScheduler::tick() {
    std::time_t now = clock();

    bool changed = false;
    SchedulerState next;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        next = evaluate(*config, paused, now);
        changed = next != state;
        state = next;
    }

    if (changed) {
        log_status(std::string("Scheduler state: ") + scheduler_state_name(next));
        publish_status(status_kind_for(next));
    }

    if (next == SchedulerState::Running) {
        capture();
    }
}

void CaptureScheduler::pause() {
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        paused = true;
        state = SchedulerState::Paused;
    }
    log_status("Scheduler paused");
    publish_status(StatusKind::Paused);
}

void CaptureScheduler::resume() {
    SchedulerState next;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        paused = false;
        next = evaluate(*config, false, clock());
        state = next;
    }
    log_status(std::string("Scheduler resumed (") + scheduler_state_name(next) + ")");
    publish_status(status_kind_for(next));
}

CaptureOutcome CaptureScheduler::force_snapshot() {
    log_status("Manual snapshot requested");
    return capture();
}

void CaptureScheduler::reload_config(const ScheduleConfig& next) {
    // 1. Validate everything before touching the running generation
    validate_config(next);

    StoreOptions next_options = store_options_for(next);
    std::shared_ptr<SnapshotStore> next_store;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        if (same_store_options(store->store_options(), next_options)) {
            next_store = store;
        }
    }
    if (!next_store) {
        try {
            next_store = std::make_shared<SnapshotStore>(next_options);
        } catch (const StorageError& e) {
            throw ConfigError(std::string("Unusable save_path: ") + e.what());
        }
    }

    // 2. Swap atomically
    std::shared_ptr<const ScheduleConfig> previous;
    long new_generation;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        previous = config;
        config = std::make_shared<const ScheduleConfig>(next);
        store = next_store;
        new_generation = ++generation;
        health.set_failure_threshold(next.failure_threshold);
        if (next.city_tz != previous->city_tz && !set_time_zone(next.city_tz)) {
            log_status("Warning: could not apply time zone " + next.city_tz);
        }
        state = evaluate(*config, paused, clock());
    }

    // Process-wide settings that live outside the scheduler
    if (next.log_enabled != previous->log_enabled || next.log_file != previous->log_file) {
        configure_logging(next.log_enabled, next.log_file);
    }
    bus.set_queue_limit(static_cast<size_t>(next.subscriber_queue_limit));
    if (next.http_address != previous->http_address || next.http_port != previous->http_port) {
        log_status("Warning: http_address/http_port changes take effect after a restart");
    }

    // 3. Let the loop pick up a changed interval
    {
        std::lock_guard<std::mutex> lock(loop_mutex);
        wake = true;
    }
    loop_cv.notify_all();

    log_status("Configuration reloaded (generation " + std::to_string(new_generation) + ")");
    publish_status(StatusKind::ConfigReloaded);
}

SchedulerStatus CaptureScheduler::status() const {
    SchedulerStatus result;
    std::shared_ptr<const ScheduleConfig> cfg;
    std::shared_ptr<SnapshotStore> target;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        cfg = config;
        target = store;
        result.state = state;
        result.generation = generation;
        result.paused = paused;
        result.camera_error = camera_error;
        result.health = health.status();
    }

    result.now = clock();
    result.instance_name = cfg->instance_name;
    result.use_astral = cfg->use_astral;

    std::tm local = local_tm(result.now);
    if (cfg->use_astral) {
        result.sun = sun_resolver.sun_times(local, *cfg);
    }
    result.active = is_active(local, *cfg, result.sun);

    try {
        result.image_count = target->current_count();
        result.last_snapshot = target->latest();
    } catch (const StorageError& e) {
        log_status("Warning: could not read snapshot store: " + std::string(e.what()));
    }
    return result;
}

SchedulerState CaptureScheduler::current_state() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return state;
}

long CaptureScheduler::current_generation() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return generation;
}

bool CaptureScheduler::is_paused() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return paused;
}

std::shared_ptr<const ScheduleConfig> CaptureScheduler::current_config() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return config;
}

std::string CaptureScheduler::latest_image_path() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return store->latest_path();
}

void CaptureScheduler::start() {
    if (loop_thread.joinable()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(loop_mutex);
        stopping = false;
    }
    loop_thread = std::thread(&CaptureScheduler::loop, this);
    log_status("Scheduler started");
}

void CaptureScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(loop_mutex);
        stopping = true;
    }
    loop_cv.notify_all();
    if (loop_thread.joinable()) {
        loop_thread.join();
        log_status("Scheduler stopped");
    }
}

void CaptureScheduler::loop() {
    using std::chrono::seconds;
    using std::chrono::steady_clock;

    auto last_tick = steady_clock::now();
    auto next_tick = last_tick;
    auto next_heartbeat = last_tick + seconds(current_config()->status_heartbeat_seconds);
    auto next_healthcheck = last_tick + seconds(current_config()->healthcheck_seconds);

    while (true) {
        auto now = steady_clock::now();

        if (now >= next_tick) {
            last_tick = next_tick;
            tick();

            // Keep the interval phase; skip ticks that a slow capture overran
            auto interval = seconds(current_config()->interval_seconds);
            next_tick += interval;
            auto finished = steady_clock::now();
            if (next_tick <= finished) {
                log_status("Warning: Capture took longer than interval!");
                while (next_tick <= finished) {
                    next_tick += interval;
                }
            }
        }

        int heartbeat_seconds = current_config()->status_heartbeat_seconds;
        if (heartbeat_seconds > 0 && now >= next_heartbeat) {
            publish_status(status_kind_for(current_state()));
            next_heartbeat = now + seconds(heartbeat_seconds);
        }

        // Captures already track health while running
        int healthcheck_seconds = current_config()->healthcheck_seconds;
        if (healthcheck_seconds > 0 && now >= next_healthcheck) {
            if (current_state() != SchedulerState::Running) {
                check_camera();
            }
            next_healthcheck = steady_clock::now() + seconds(healthcheck_seconds);
        }

        auto wake_at = next_tick;
        if (heartbeat_seconds > 0) {
            wake_at = std::min(wake_at, next_heartbeat);
        }
        if (healthcheck_seconds > 0) {
            wake_at = std::min(wake_at, next_healthcheck);
        }

        std::unique_lock<std::mutex> lock(loop_mutex);
        loop_cv.wait_until(lock, wake_at, [this] { return stopping || wake; });
        if (stopping) {
            break;
        }
        if (wake) {
            // Reloaded: re-anchor on the new interval and heartbeat
            wake = false;
            auto cfg = current_config();
            next_tick = last_tick + seconds(cfg->interval_seconds);
            next_heartbeat = steady_clock::now() + seconds(cfg->status_heartbeat_seconds);
            next_healthcheck = steady_clock::now() + seconds(cfg->healthcheck_seconds);
        }
    }
}
