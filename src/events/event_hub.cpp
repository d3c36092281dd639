#include "honeybee/events/event_hub.hpp"

#include <algorithm>

#include "honeybee/logging.hpp"

namespace honeybee::events {

EventHub::EventHub(size_t max_queue_size)
    : max_queue_size_(std::max<size_t>(1, max_queue_size)) {}

void EventHub::publish(const std::string& name, const nlohmann::json& payload) {
    logging::debug("Event published", {kv("event", name), kv("payload", payload.dump())});
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        const bool progress = name == kRecordingStatus;
        for (auto& entry : subscribers_) {
            auto& subscriber = entry.second;
            if (subscriber.queue.size() >= max_queue_size_) {
                auto stale = std::find_if(subscriber.queue.begin(), subscriber.queue.end(),
                                          [](const Event& event) {
                                              return event.name == kRecordingStatus;
                                          });
                if (stale != subscriber.queue.end()) {
                    subscriber.queue.erase(stale);
                    ++subscriber.dropped;
                } else if (progress) {
                    ++subscriber.dropped;
                    continue;
                }
            }
            subscriber.queue.push_back({name, payload});
        }
    }
    cv_.notify_all();
}

uint64_t EventHub::subscribe() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = next_id_++;
    subscribers_.emplace(id, Subscriber{});
    return id;
}

void EventHub::unsubscribe(uint64_t subscriber_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(subscriber_id);
        if (it == subscribers_.end()) {
            return;
        }
        if (it->second.dropped > 0) {
            logging::warn("Event subscriber dropped events",
                          {kv("subscriber", subscriber_id), kv("dropped", it->second.dropped)});
        }
        subscribers_.erase(it);
    }
    cv_.notify_all();
}

std::optional<Event> EventHub::next(uint64_t subscriber_id, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto ready = [this, subscriber_id]() {
        if (closed_) {
            return true;
        }
        auto it = subscribers_.find(subscriber_id);
        return it == subscribers_.end() || !it->second.queue.empty();
    };
    if (!cv_.wait_for(lock, timeout, ready)) {
        return std::nullopt;
    }
    auto it = subscribers_.find(subscriber_id);
    if (closed_ || it == subscribers_.end() || it->second.queue.empty()) {
        return std::nullopt;
    }
    Event event = std::move(it->second.queue.front());
    it->second.queue.pop_front();
    return event;
}

void EventHub::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

size_t EventHub::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

}
