#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace bluegate {

namespace events {
inline constexpr const char* INITIAL_DATA = "initial_data";
inline constexpr const char* DEVICES_UPDATE = "devices_update";
inline constexpr const char* ALL_DEVICES_UPDATE = "all_devices_update";
inline constexpr const char* SCANNING_STATUS = "scanning_status";
inline constexpr const char* CONNECTION_STATUS = "connection_status";
inline constexpr const char* DEVICE_CONNECTED = "device_connected";
inline constexpr const char* DEVICE_DISCONNECTED = "device_disconnected";
inline constexpr const char* WHITELIST_UPDATE = "whitelist_update";
inline constexpr const char* LOG_UPDATE = "log_update";
} // namespace events

struct Event {
    std::string type;
    nlohmann::json data = nlohmann::json::object();
    // Set for per-device events.
    std::optional<std::string> address;
};

/**
 * @brief Bounded per-observer queue.
 *
 * Producers never block: when the queue is full the oldest undelivered
 * event is dropped. A transport adapter drains it with next().
 */
class Subscription {
public:
    Subscription(uint64_t id, size_t capacity);

    uint64_t id() const { return id_; }

    void push(Event ev);
    // Places ev ahead of everything queued so far (initial snapshot).
    void push_front(Event ev);

    // Waits up to timeout; std::nullopt on timeout or once closed and drained.
    std::optional<Event> next(std::chrono::milliseconds timeout);

    void close();
    bool closed() const;
    size_t pending() const;
    uint64_t dropped() const { return dropped_.load(); }

private:
    const uint64_t id_;
    const size_t capacity_;
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::deque<Event> queue_;
    bool closed_ = false;
    std::atomic<uint64_t> dropped_{0};
};

class EventBroadcaster {
public:
    explicit EventBroadcaster(size_t queue_capacity = 256);

    std::shared_ptr<Subscription> subscribe();
    void unsubscribe(const std::shared_ptr<Subscription>& sub);

    // Fire-and-forget fan-out to every open subscription.
    void publish(const Event& ev);

    size_t subscriber_count() const;
    uint64_t total_dropped() const;

private:
    size_t queue_capacity_;
    mutable std::mutex subs_m_;
    std::vector<std::shared_ptr<Subscription>> subs_;
    uint64_t next_id_ = 1;
    // Drops from subscriptions that have since gone away.
    uint64_t retired_dropped_ = 0;
};

} // namespace bluegate
