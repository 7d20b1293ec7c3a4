// event_bus.cpp

#include "event_bus.hpp"

#include <algorithm>
#include <sstream>

#include "logger.hpp"
#include "utils.hpp"

const char* status_kind_name(StatusKind kind) {
    switch (kind) {
    case StatusKind::Running:        return "running";
    case StatusKind::Paused:         return "paused";
    case StatusKind::WaitingWindow:  return "waiting_window";
    case StatusKind::ConfigReloaded: return "config_reloaded";
    }
    return "running";
}

namespace {

struct EventJsonWriter {
    std::stringstream& out;

    void operator()(const SnapshotEvent& e) const {
        out << "{\"type\":\"snapshot\""
            << ",\"filename\":\"" << json_escape(e.filename) << "\""
            << ",\"timestamp\":\"" << format_local_time(e.timestamp, "%H:%M:%S") << "\""
            << ",\"timestamp_full\":\"" << format_local_time(e.timestamp, "%d.%m.%y %H:%M") << "\""
            << ",\"epoch\":" << static_cast<long long>(e.timestamp) << "}";
    }

    void operator()(const StatusEvent& e) const {
        out << "{\"type\":\"status\",\"status\":\"" << status_kind_name(e.kind) << "\"}";
    }

    void operator()(const CameraErrorEvent& e) const {
        out << "{\"type\":\"camera_error\""
            << ",\"code\":\"" << json_escape(e.code) << "\""
            << ",\"message\":\"" << json_escape(e.message) << "\"}";
    }

    void operator()(const CameraHealthEvent& e) const {
        out << "{\"type\":\"camera_health\""
            << ",\"status\":\"" << health_status_name(e.status) << "\""
            << ",\"consecutive_failures\":" << e.consecutive_failures << "}";
    }
};

} // namespace

std::string event_to_json(const Event& event) {
    std::stringstream ss;
    std::visit(EventJsonWriter{ss}, event);
    return ss.str();
}

// Subscription

Subscription::Subscription(size_t limit) : limit(limit), high_water(0), dropped(false) {}

bool Subscription::offer(const Event& event) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (dropped) {
            return false;
        }
        if (queue.size() >= limit) {
            return false;
        }
        queue.push_back(event);
        high_water = std::max(high_water, queue.size());
    }
    ready.notify_one();
    return true;
}

void Subscription::mark_dropped() {
    std::function<void()> handler;
    {
        std::lock_guard<std::mutex> lock(mutex);
        dropped = true;
        handler.swap(drop_handler);
    }
    ready.notify_all();
    if (handler) {
        handler();
    }
}

void Subscription::on_dropped(std::function<void()> handler) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!dropped) {
            drop_handler = std::move(handler);
            return;
        }
    }
    if (handler) {
        handler();
    }
}

std::optional<Event> Subscription::wait_next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex);
    ready.wait_for(lock, timeout, [this] { return !queue.empty() || dropped; });
    if (queue.empty()) {
        return std::nullopt;
    }
    Event event = std::move(queue.front());
    queue.pop_front();
    return event;
}

bool Subscription::is_dropped() const {
    std::lock_guard<std::mutex> lock(mutex);
    return dropped;
}

size_t Subscription::pending() const {
    std::lock_guard<std::mutex> lock(mutex);
    return queue.size();
}

size_t Subscription::max_pending() const {
    std::lock_guard<std::mutex> lock(mutex);
    return high_water;
}

// EventBus

EventBus::EventBus(size_t queue_limit) : queue_limit(queue_limit == 0 ? 1 : queue_limit) {}

SubscriptionHandle EventBus::subscribe() {
    std::lock_guard<std::mutex> lock(mutex);
    auto handle = std::make_shared<Subscription>(queue_limit);
    subscribers.push_back(handle);
    return handle;
}

void EventBus::set_queue_limit(size_t limit) {
    std::lock_guard<std::mutex> lock(mutex);
    queue_limit = limit == 0 ? 1 : limit;
}

void EventBus::unsubscribe(const SubscriptionHandle& handle) {
    std::lock_guard<std::mutex> lock(mutex);
    subscribers.erase(std::remove(subscribers.begin(), subscribers.end(), handle), subscribers.end());
}

void EventBus::publish(const Event& event) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = subscribers.begin();
    while (it != subscribers.end()) {
        if ((*it)->offer(event)) {
            ++it;
            continue;
        }
        // Overflowed: the observer is not keeping up, treat its connection as dead
        (*it)->mark_dropped();
        log_status("Warning: dropping event subscriber (queue full at " +
                   std::to_string((*it)->max_pending()) + " events)");
        it = subscribers.erase(it);
    }
}

size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex);
    return subscribers.size();
}
