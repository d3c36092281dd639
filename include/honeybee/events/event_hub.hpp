#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "honeybee/events/event_sink.hpp"

namespace honeybee {
namespace events {

struct Event {
    std::string name;
    nlohmann::json payload;
};

// Fans published events out to subscriber queues. Once a slow subscriber's
// queue is full it loses its oldest progress events; error and saved events
// are always queued.
class EventHub : public EventSink {
public:
    explicit EventHub(size_t max_queue_size = 64);

    void publish(const std::string& name, const nlohmann::json& payload) override;

    uint64_t subscribe();
    void unsubscribe(uint64_t subscriber_id);
    std::optional<Event> next(uint64_t subscriber_id, std::chrono::milliseconds timeout);
    void close();
    size_t subscriber_count() const;

private:
    struct Subscriber {
        std::deque<Event> queue;
        uint64_t dropped = 0;
    };

    const size_t max_queue_size_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<uint64_t, Subscriber> subscribers_;
    uint64_t next_id_ = 1;
    bool closed_ = false;
};

}
}
