#pragma once

#include <atomic>
#include <memory>

#include "honeybee/audio/engine.hpp"
#include "honeybee/audio/pj_input_device.hpp"
#include "honeybee/config.hpp"
#include "honeybee/events/event_hub.hpp"
#include "honeybee/recorder/controller.hpp"
#include "honeybee/recorder/recording_store.hpp"
#include "honeybee/server/rest_server.hpp"

namespace honeybee {

class App {
public:
    explicit App(Config config);
    ~App();

    void init();
    void run(const std::atomic<bool>& shutdown_requested);
    void stop();

private:
    Config config_;
    audio::AudioEngine engine_;
    audio::PjInputHost input_host_;
    events::EventHub events_;
    recorder::RecordingStore store_;
    std::unique_ptr<recorder::RecordingController> controller_;
    std::unique_ptr<RestServer> rest_server_;
    std::atomic<bool> stopped_{false};
};

}
