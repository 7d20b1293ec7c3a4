// event_bus.hpp

#pragma once

#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "health_tracker.hpp"

// --- Event types ---
struct SnapshotEvent {
    std::time_t timestamp;
    std::string filename;
};

enum class StatusKind { Running, Paused, WaitingWindow, ConfigReloaded };

const char* status_kind_name(StatusKind kind);

struct StatusEvent {
    StatusKind kind;
};

struct CameraErrorEvent {
    std::string code;
    std::string message;
};

struct CameraHealthEvent {
    HealthStatus status;
    int consecutive_failures;
};

using Event = std::variant<SnapshotEvent, StatusEvent, CameraErrorEvent, CameraHealthEvent>;

// One-line JSON form sent to dashboards, e.g. {"type":"status","status":"paused"}
std::string event_to_json(const Event& event);

// --- Subscription ---
// Outbound queue of one observer. Bounded: an observer that falls behind by
// more than `limit` events is marked dropped and stops receiving.
class Subscription {
private:
    friend class EventBus;

    mutable std::mutex mutex;
    std::condition_variable ready;
    std::deque<Event> queue;
    size_t limit;
    size_t high_water;
    bool dropped;
    std::function<void()> drop_handler;

    // Called by the bus with its own lock held; never blocks.
    bool offer(const Event& event);
    void mark_dropped();

public:
    explicit Subscription(size_t limit);

    // Next event in publication order. Returns nothing on timeout or once the
    // subscription has been dropped and drained.
    std::optional<Event> wait_next(std::chrono::milliseconds timeout);

    // Runs once when the bus drops this subscription (immediately if it
    // already was). Called with the bus lock held, so it must not block.
    void on_dropped(std::function<void()> handler);

    bool is_dropped() const;
    size_t pending() const;
    size_t max_pending() const;
};

using SubscriptionHandle = std::shared_ptr<Subscription>;

// --- EventBus ---
// In-process fan-out. Events reach every subscriber attached at publish
// time, in publication order; nothing is replayed to late subscribers.
class EventBus {
private:
    mutable std::mutex mutex;
    std::vector<SubscriptionHandle> subscribers;
    size_t queue_limit;

public:
    explicit EventBus(size_t queue_limit = 64);

    SubscriptionHandle subscribe();
    void unsubscribe(const SubscriptionHandle& handle);
    void publish(const Event& event);

    // Applies to subscriptions created afterwards.
    void set_queue_limit(size_t limit);

    size_t subscriber_count() const;
};

// Keeps a subscription attached for the lifetime of a connection.
class ScopedSubscription {
private:
    EventBus& bus;
    SubscriptionHandle handle;

public:
    explicit ScopedSubscription(EventBus& bus) : bus(bus), handle(bus.subscribe()) {}
    ~ScopedSubscription() { bus.unsubscribe(handle); }

    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;

    Subscription& operator*() const { return *handle; }
    Subscription* operator->() const { return handle.get(); }
};
