#include "core/EventBroadcaster.hpp"
#include <algorithm>

namespace bluegate {

Subscription::Subscription(uint64_t id, size_t capacity)
: id_(id), capacity_(std::max<size_t>(1, capacity)) {}

void Subscription::push(Event ev) {
    {
        std::lock_guard<std::mutex> lk(m_);
        if (closed_) return;
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            dropped_.fetch_add(1);
        }
        queue_.push_back(std::move(ev));
    }
    cv_.notify_one();
}

void Subscription::push_front(Event ev) {
    {
        std::lock_guard<std::mutex> lk(m_);
        if (closed_) return;
        if (queue_.size() >= capacity_) {
            // The snapshot supersedes the oldest delta.
            queue_.pop_front();
            dropped_.fetch_add(1);
        }
        queue_.push_front(std::move(ev));
    }
    cv_.notify_one();
}

std::optional<Event> Subscription::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(m_);
    cv_.wait_for(lk, timeout, [this]() { return !queue_.empty() || closed_; });
    if (queue_.empty()) return std::nullopt;
    Event ev = std::move(queue_.front());
    queue_.pop_front();
    return ev;
}

void Subscription::close() {
    {
        std::lock_guard<std::mutex> lk(m_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool Subscription::closed() const {
    std::lock_guard<std::mutex> lk(m_);
    return closed_;
}

size_t Subscription::pending() const {
    std::lock_guard<std::mutex> lk(m_);
    return queue_.size();
}

EventBroadcaster::EventBroadcaster(size_t queue_capacity)
: queue_capacity_(queue_capacity) {}

std::shared_ptr<Subscription> EventBroadcaster::subscribe() {
    std::lock_guard<std::mutex> lk(subs_m_);
    auto sub = std::make_shared<Subscription>(next_id_++, queue_capacity_);
    subs_.push_back(sub);
    return sub;
}

void EventBroadcaster::unsubscribe(const std::shared_ptr<Subscription>& sub) {
    if (!sub) return;
    sub->close();
    std::lock_guard<std::mutex> lk(subs_m_);
    auto it = std::find(subs_.begin(), subs_.end(), sub);
    if (it != subs_.end()) {
        retired_dropped_ += sub->dropped();
        subs_.erase(it);
    }
}

void EventBroadcaster::publish(const Event& ev) {
    std::lock_guard<std::mutex> lk(subs_m_);
    for (auto& s : subs_) s->push(ev);
}

size_t EventBroadcaster::subscriber_count() const {
    std::lock_guard<std::mutex> lk(subs_m_);
    return subs_.size();
}

uint64_t EventBroadcaster::total_dropped() const {
    std::lock_guard<std::mutex> lk(subs_m_);
    uint64_t total = retired_dropped_;
    for (const auto& s : subs_) total += s->dropped();
    return total;
}

} // namespace bluegate
