#include <catch2/catch_test_macros.hpp>

#include "honeybee/events/event_hub.hpp"

#include <chrono>
#include <thread>

using honeybee::events::EventHub;
using namespace std::chrono_literals;

TEST_CASE("published events reach every subscriber in order") {
    EventHub hub(8);
    const auto first = hub.subscribe();
    const auto second = hub.subscribe();

    hub.publish("recording-status", {{"recording", true}, {"duration_ms", 200}});
    hub.publish("recording-saved", {{"success", true}});

    for (const auto id : {first, second}) {
        const auto status = hub.next(id, 10ms);
        REQUIRE(status);
        REQUIRE(status->name == "recording-status");
        REQUIRE(status->payload.at("duration_ms") == 200);
        const auto saved = hub.next(id, 10ms);
        REQUIRE(saved);
        REQUIRE(saved->name == "recording-saved");
    }
}

TEST_CASE("events published before subscribing are not replayed") {
    EventHub hub;
    hub.publish("recording-error", "No input device found");
    const auto id = hub.subscribe();
    REQUIRE_FALSE(hub.next(id, 5ms));
}

TEST_CASE("a full queue drops its oldest progress events first") {
    EventHub hub(2);
    const auto id = hub.subscribe();
    hub.publish("recording-status", {{"duration_ms", 200}});
    hub.publish("recording-status", {{"duration_ms", 400}});
    hub.publish("recording-status", {{"duration_ms", 600}});

    REQUIRE(hub.next(id, 5ms)->payload.at("duration_ms") == 400);
    REQUIRE(hub.next(id, 5ms)->payload.at("duration_ms") == 600);
    REQUIRE_FALSE(hub.next(id, 5ms));
}

TEST_CASE("saved and error events survive a stalled subscriber") {
    EventHub hub(2);
    const auto id = hub.subscribe();
    hub.publish("recording-status", {{"duration_ms", 200}});
    hub.publish("recording-error", "Failed to start stream: device busy");
    hub.publish("recording-saved", {{"success", true}});
    hub.publish("recording-status", {{"duration_ms", 400}});
    hub.publish("recording-saved", {{"success", false}});

    const auto error = hub.next(id, 5ms);
    REQUIRE(error->name == "recording-error");
    const auto first = hub.next(id, 5ms);
    REQUIRE(first->name == "recording-saved");
    REQUIRE(first->payload.at("success") == true);
    const auto second = hub.next(id, 5ms);
    REQUIRE(second->name == "recording-saved");
    REQUIRE(second->payload.at("success") == false);
    REQUIRE_FALSE(hub.next(id, 5ms));
}

TEST_CASE("next wakes up when an event arrives") {
    EventHub hub;
    const auto id = hub.subscribe();
    std::thread publisher([&hub]() {
        std::this_thread::sleep_for(20ms);
        hub.publish("recording-saved", {{"success", false}});
    });
    const auto event = hub.next(id, 2000ms);
    publisher.join();
    REQUIRE(event);
    REQUIRE(event->name == "recording-saved");
}

TEST_CASE("unsubscribe and close release waiting readers") {
    EventHub hub;
    const auto id = hub.subscribe();
    REQUIRE(hub.subscriber_count() == 1);
    hub.unsubscribe(id);
    REQUIRE(hub.subscriber_count() == 0);
    REQUIRE_FALSE(hub.next(id, 5ms));

    const auto other = hub.subscribe();
    hub.close();
    const auto start = std::chrono::steady_clock::now();
    REQUIRE_FALSE(hub.next(other, 2000ms));
    REQUIRE(std::chrono::steady_clock::now() - start < 1000ms);
}
