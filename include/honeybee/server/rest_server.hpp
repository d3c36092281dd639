#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "honeybee/config.hpp"
#include "honeybee/events/event_hub.hpp"
#include "honeybee/recorder/controller.hpp"
#include "honeybee/recorder/recording_store.hpp"

namespace honeybee {

// Local HTTP command surface for the webview, with recorder events streamed
// as server-sent events on /events.
class RestServer {
public:
    RestServer(const Config& config,
               recorder::RecordingController& controller,
               recorder::RecordingStore& store,
               events::EventHub& events);

    void start();
    void stop();

private:
    void register_recording_routes();
    void register_library_routes();
    void register_event_stream();
    bool authorize_request(const httplib::Request& request, httplib::Response& response) const;
    void write_json(httplib::Response& response, int status, const nlohmann::json& body) const;
    void timed(const std::string& command, const std::function<void()>& handler) const;

    const Config& config_;
    recorder::RecordingController& controller_;
    recorder::RecordingStore& store_;
    events::EventHub& events_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> stopping_{false};
};

}
