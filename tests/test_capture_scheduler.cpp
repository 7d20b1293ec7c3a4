// test_capture_scheduler.cpp

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "capture_scheduler.hpp"
#include "test_support.hpp"
#include "utils.hpp"

namespace {

std::vector<std::string> drain(Subscription& subscription) {
    std::vector<std::string> out;
    while (auto event = subscription.wait_next(std::chrono::milliseconds(0))) {
        out.push_back(event_to_json(*event));
    }
    return out;
}

std::string type_of(const std::string& json) {
    size_t start = json.find("\"type\":\"") + 8;
    return json.substr(start, json.find('"', start) - start);
}

std::vector<std::string> types_of(const std::vector<std::string>& events) {
    std::vector<std::string> types;
    for (const auto& e : events) {
        types.push_back(type_of(e));
    }
    return types;
}

class CaptureSchedulerTest : public ::testing::Test {
protected:
    TempDir dir;
    FakeCamera camera;
    FixedSunResolver sun;
    EventBus bus{256};
    std::atomic<std::time_t> now{make_local_time(2024, 6, 3, 9, 0)}; // Monday
    ScheduleConfig config = make_config(dir.path());

    std::unique_ptr<CaptureScheduler> make_scheduler() {
        return std::make_unique<CaptureScheduler>(config, camera, bus, sun, [this] { return now.load(); });
    }
};

} // namespace

TEST_F(CaptureSchedulerTest, StartsWaitingForWindow) {
    auto scheduler = make_scheduler();
    EXPECT_EQ(scheduler->current_state(), SchedulerState::WaitingWindow);
    EXPECT_EQ(scheduler->current_generation(), 1);
    EXPECT_FALSE(scheduler->is_paused());
}

TEST_F(CaptureSchedulerTest, TickInsideWindowCapturesAndPublishes) {
    auto scheduler = make_scheduler();
    auto subscription = bus.subscribe();

    scheduler->tick();

    EXPECT_EQ(camera.call_count(), 1);
    EXPECT_EQ(scheduler->current_state(), SchedulerState::Running);
    auto events = drain(*subscription);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0], "{\"type\":\"status\",\"status\":\"running\"}");
    EXPECT_EQ(type_of(events[1]), "snapshot");
    EXPECT_NE(events[1].find("snapshot_20240603_090000.jpg"), std::string::npos);

    SchedulerStatus status = scheduler->status();
    EXPECT_EQ(status.image_count, 1);
    ASSERT_TRUE(status.last_snapshot.has_value());
    EXPECT_EQ(status.last_snapshot->timestamp, now.load());
}

TEST_F(CaptureSchedulerTest, TickOutsideWindowDoesNotCapture) {
    now = make_local_time(2024, 6, 2, 9, 0); // Sunday
    auto scheduler = make_scheduler();
    auto subscription = bus.subscribe();

    scheduler->tick();
    scheduler->tick();

    EXPECT_EQ(camera.call_count(), 0);
    EXPECT_EQ(scheduler->current_state(), SchedulerState::WaitingWindow);
    // Initial state already was waiting_window; nothing changed, nothing published
    EXPECT_TRUE(drain(*subscription).empty());
}

TEST_F(CaptureSchedulerTest, LeavingWindowPublishesWaitingOnce) {
    auto scheduler = make_scheduler();
    scheduler->tick();
    auto subscription = bus.subscribe();

    now = make_local_time(2024, 6, 3, 18, 0, 1);
    scheduler->tick();
    scheduler->tick();

    auto events = drain(*subscription);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0], "{\"type\":\"status\",\"status\":\"waiting_window\"}");
    EXPECT_EQ(camera.call_count(), 1);
}

TEST_F(CaptureSchedulerTest, PausedTickDoesNothing) {
    auto scheduler = make_scheduler();
    scheduler->pause();
    auto subscription = bus.subscribe();

    scheduler->tick();

    EXPECT_EQ(camera.call_count(), 0);
    EXPECT_TRUE(drain(*subscription).empty());
}

TEST_F(CaptureSchedulerTest, InitiallyPausedConfigReportsPausedOnFirstTick) {
    config.paused = true;
    auto scheduler = make_scheduler();
    auto subscription = bus.subscribe();

    scheduler->tick();

    EXPECT_EQ(camera.call_count(), 0);
    EXPECT_EQ(scheduler->current_state(), SchedulerState::Paused);
    auto events = drain(*subscription);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0], "{\"type\":\"status\",\"status\":\"paused\"}");
}

TEST_F(CaptureSchedulerTest, PauseAndResumeAreIdempotent) {
    auto scheduler = make_scheduler();

    scheduler->pause();
    SchedulerStatus once = scheduler->status();
    scheduler->pause();
    SchedulerStatus twice = scheduler->status();
    EXPECT_EQ(once.paused, twice.paused);
    EXPECT_EQ(once.state, twice.state);
    EXPECT_EQ(once.generation, twice.generation);
    EXPECT_EQ(twice.state, SchedulerState::Paused);

    scheduler->resume();
    once = scheduler->status();
    scheduler->resume();
    twice = scheduler->status();
    EXPECT_EQ(once.paused, twice.paused);
    EXPECT_EQ(once.state, twice.state);
    EXPECT_EQ(once.generation, twice.generation);
    EXPECT_FALSE(twice.paused);
    EXPECT_EQ(twice.state, SchedulerState::Running);
}

TEST_F(CaptureSchedulerTest, ResumeOutsideWindowWaits) {
    now = make_local_time(2024, 6, 3, 20, 0);
    auto scheduler = make_scheduler();
    scheduler->pause();
    auto subscription = bus.subscribe();

    scheduler->resume();

    EXPECT_EQ(scheduler->current_state(), SchedulerState::WaitingWindow);
    auto events = drain(*subscription);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0], "{\"type\":\"status\",\"status\":\"waiting_window\"}");
}

TEST_F(CaptureSchedulerTest, ForceSnapshotWhilePausedCapturesAndStaysPaused) {
    auto scheduler = make_scheduler();
    scheduler->pause();
    auto subscription = bus.subscribe();

    CaptureOutcome outcome = scheduler->force_snapshot();

    EXPECT_TRUE(outcome.ok());
    EXPECT_TRUE(scheduler->is_paused());
    EXPECT_EQ(scheduler->current_state(), SchedulerState::Paused);
    EXPECT_EQ(camera.call_count(), 1);
    auto events = drain(*subscription);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(type_of(events[0]), "snapshot");
}

TEST_F(CaptureSchedulerTest, ForceSnapshotOutsideWindowReturnsClassifiedError) {
    now = make_local_time(2024, 6, 2, 3, 0);
    camera.push_failure(CaptureErrorKind::AuthFailed, "HTTP 401");
    auto scheduler = make_scheduler();
    auto subscription = bus.subscribe();

    CaptureOutcome outcome = scheduler->force_snapshot();

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error->kind, CaptureErrorKind::AuthFailed);
    auto events = drain(*subscription);
    ASSERT_EQ(types_of(events), (std::vector<std::string>{"camera_error", "camera_health"}));
    EXPECT_NE(events[0].find("\"code\":\"auth_failed\""), std::string::npos);
}

TEST_F(CaptureSchedulerTest, HealthDegradesThenRecovers) {
    auto scheduler = make_scheduler();
    scheduler->tick(); // enter Running
    auto subscription = bus.subscribe();

    camera.push_failure(CaptureErrorKind::Timeout);
    camera.push_failure(CaptureErrorKind::Timeout);
    camera.push_failure(CaptureErrorKind::Timeout);

    scheduler->tick();
    EXPECT_EQ(types_of(drain(*subscription)), (std::vector<std::string>{"camera_error", "camera_health"}));
    EXPECT_EQ(scheduler->status().health.status, HealthStatus::Degraded);

    scheduler->tick();
    EXPECT_EQ(types_of(drain(*subscription)), (std::vector<std::string>{"camera_error"}));

    scheduler->tick();
    auto third = drain(*subscription);
    ASSERT_EQ(types_of(third), (std::vector<std::string>{"camera_error", "camera_health"}));
    EXPECT_NE(third[1].find("\"status\":\"error\""), std::string::npos);

    SchedulerStatus failing = scheduler->status();
    EXPECT_EQ(failing.health.status, HealthStatus::Error);
    EXPECT_EQ(failing.health.consecutive_failures, 3);
    ASSERT_TRUE(failing.camera_error.has_value());
    EXPECT_EQ(failing.camera_error->code(), "timeout");
    // Failures never pause the schedule
    EXPECT_FALSE(failing.paused);

    scheduler->tick();
    auto recovered = drain(*subscription);
    ASSERT_EQ(types_of(recovered), (std::vector<std::string>{"snapshot", "camera_health"}));
    EXPECT_NE(recovered[1].find("\"status\":\"ok\""), std::string::npos);

    SchedulerStatus healthy = scheduler->status();
    EXPECT_EQ(healthy.health.status, HealthStatus::Ok);
    EXPECT_EQ(healthy.health.consecutive_failures, 0);
    EXPECT_FALSE(healthy.camera_error.has_value());
}

TEST_F(CaptureSchedulerTest, StorageFailureCountsAsCaptureFailure) {
    config.save_path = dir.file("vanishing");
    auto scheduler = make_scheduler();
    scheduler->status(); // reconcile the empty directory
    ASSERT_EQ(rmdir(config.save_path.c_str()), 0);
    auto subscription = bus.subscribe();

    CaptureOutcome outcome = scheduler->force_snapshot();

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error->kind, CaptureErrorKind::StorageFailed);
    auto events = drain(*subscription);
    ASSERT_FALSE(events.empty());
    EXPECT_NE(events[0].find("\"code\":\"storage_failed\""), std::string::npos);
    EXPECT_EQ(scheduler->status().health.consecutive_failures, 1);
}

TEST_F(CaptureSchedulerTest, ReloadWithInvalidRangeKeepsGeneration) {
    auto scheduler = make_scheduler();
    auto subscription = bus.subscribe();

    ScheduleConfig bad = config;
    bad.active_start = 18 * 3600;
    bad.active_end = 8 * 3600;

    EXPECT_THROW(scheduler->reload_config(bad), ConfigError);
    EXPECT_EQ(scheduler->current_generation(), 1);
    EXPECT_EQ(scheduler->current_config()->active_start, 8 * 3600);
    EXPECT_TRUE(drain(*subscription).empty());
}

TEST_F(CaptureSchedulerTest, ReloadSwapsConfigAndBumpsGeneration) {
    auto scheduler = make_scheduler();
    scheduler->tick();
    auto subscription = bus.subscribe();

    TempDir other;
    ScheduleConfig next = config;
    next.save_path = other.path();
    next.active_days = {0}; // Sunday only

    scheduler->reload_config(next);

    EXPECT_EQ(scheduler->current_generation(), 2);
    EXPECT_EQ(scheduler->current_state(), SchedulerState::WaitingWindow);
    EXPECT_EQ(drain(*subscription), (std::vector<std::string>{"{\"type\":\"status\",\"status\":\"config_reloaded\"}"}));

    scheduler->force_snapshot();
    EXPECT_EQ(scheduler->latest_image_path(), other.path() + "/" + LATEST_FILENAME);
    EXPECT_EQ(scheduler->status().image_count, 1);
}

TEST_F(CaptureSchedulerTest, ReloadAppliesNewTimeZone) {
    ScopedTimeZone zone("UTC0");
    config.city_tz = "UTC0";
    now = make_local_time(2024, 6, 3, 17, 0);
    auto scheduler = make_scheduler();
    scheduler->tick();
    ASSERT_EQ(scheduler->current_state(), SchedulerState::Running);

    ScheduleConfig next = config;
    next.city_tz = "XST-2";
    scheduler->reload_config(next);

    // Same instant, now 19:00 local and past the 18:00 window end
    EXPECT_EQ(format_local_time(now.load(), "%H:%M"), "19:00");
    EXPECT_EQ(scheduler->current_state(), SchedulerState::WaitingWindow);
}

TEST_F(CaptureSchedulerTest, ReloadAppliesQueueLimitToNewSubscribers) {
    auto scheduler = make_scheduler();
    ScheduleConfig next = config;
    next.subscriber_queue_limit = 2;
    scheduler->reload_config(next);

    auto subscription = bus.subscribe();
    for (int i = 0; i < 3; i++) {
        bus.publish(StatusEvent{StatusKind::Running});
    }

    EXPECT_TRUE(subscription->is_dropped());
}

TEST_F(CaptureSchedulerTest, CameraCheckFeedsHealthOutsideWindow) {
    now = make_local_time(2024, 6, 3, 20, 0);
    auto scheduler = make_scheduler();
    scheduler->tick();
    auto subscription = bus.subscribe();
    camera.push_check_failure(CaptureErrorKind::Unreachable, "no route to host");

    auto failure = scheduler->check_camera();
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->code(), "unreachable");
    EXPECT_EQ(scheduler->status().health.status, HealthStatus::Degraded);
    ASSERT_TRUE(scheduler->status().camera_error.has_value());

    EXPECT_FALSE(scheduler->check_camera().has_value());
    EXPECT_EQ(scheduler->status().health.status, HealthStatus::Ok);
    EXPECT_FALSE(scheduler->status().camera_error.has_value());

    EXPECT_EQ(drain(*subscription), (std::vector<std::string>{
        "{\"type\":\"camera_health\",\"status\":\"degraded\",\"consecutive_failures\":1}",
        "{\"type\":\"camera_health\",\"status\":\"ok\",\"consecutive_failures\":0}"}));
    EXPECT_EQ(camera.call_count(), 0);
}

TEST_F(CaptureSchedulerTest, BackgroundLoopChecksCameraWhilePaused) {
    config.paused = true;
    config.healthcheck_seconds = 1;
    auto scheduler = make_scheduler();

    scheduler->start();
    for (int i = 0; i < 40 && camera.check_count() == 0; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    scheduler->stop();

    EXPECT_GE(camera.check_count(), 1);
    EXPECT_EQ(camera.call_count(), 0);
}

TEST_F(CaptureSchedulerTest, SubscriberSeesExactlyTheTicksWhileAttached) {
    auto scheduler = make_scheduler();
    auto early = bus.subscribe();

    scheduler->tick();
    now = now.load() + 30;
    scheduler->tick();

    auto late = bus.subscribe();
    now = now.load() + 30;
    scheduler->tick();

    EXPECT_EQ(types_of(drain(*early)), (std::vector<std::string>{"status", "snapshot", "snapshot", "snapshot"}));
    auto late_events = drain(*late);
    ASSERT_EQ(late_events.size(), 1u);
    EXPECT_NE(late_events[0].find("snapshot_20240603_090100.jpg"), std::string::npos);
}

TEST_F(CaptureSchedulerTest, StatusJsonReportsDashboardFields) {
    config.use_astral = true;
    config.active_start = 0;
    config.active_end = 23 * 3600 + 59 * 60;
    sun.times = SunTimes{5 * 3600 + 7 * 60, 21 * 3600 + 30 * 60};
    auto scheduler = make_scheduler();
    scheduler->tick();

    std::string json = status_to_json(scheduler->status());

    EXPECT_NE(json.find("\"active\":true"), std::string::npos);
    EXPECT_NE(json.find("\"paused\":false"), std::string::npos);
    EXPECT_NE(json.find("\"sunrise\":\"05:07\""), std::string::npos);
    EXPECT_NE(json.find("\"sunset\":\"21:30\""), std::string::npos);
    EXPECT_NE(json.find("\"count\":1"), std::string::npos);
    EXPECT_NE(json.find("\"last_snapshot\":\"09:00:00\""), std::string::npos);
    EXPECT_NE(json.find("\"camera_error\":null"), std::string::npos);
    EXPECT_NE(json.find("\"camera_health\":{\"status\":\"ok\""), std::string::npos);
}

TEST_F(CaptureSchedulerTest, BackgroundLoopCapturesOnInterval) {
    config.interval_seconds = 1;
    config.fetch_timeout_seconds = 1;
    auto scheduler = make_scheduler();

    scheduler->start();
    for (int i = 0; i < 40 && camera.call_count() < 2; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    scheduler->stop();

    EXPECT_GE(camera.call_count(), 2);
}
