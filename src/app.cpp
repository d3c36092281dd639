#include "honeybee/app.hpp"

#include <chrono>
#include <thread>

#include "honeybee/logging.hpp"

namespace honeybee {

App::App(Config config)
    : config_(std::move(config)),
      engine_(config_),
      input_host_(engine_),
      events_(static_cast<size_t>(config_.event_queue_size)),
      store_(config_.recordings_dir) {}

App::~App() {
    stop();
}

void App::init() {
    engine_.init();

    recorder::ControllerOptions options;
    options.stop_timeout = std::chrono::milliseconds(config_.stop_timeout_ms);
    options.progress_interval = std::chrono::milliseconds(config_.progress_interval_ms);
    controller_ = std::make_unique<recorder::RecordingController>(
        input_host_, events_, store_, options);

    rest_server_ = std::make_unique<RestServer>(config_, *controller_, store_, events_);
    rest_server_->start();

    logging::info("Recordings directory", {kv("path", store_.directory().string())});
}

void App::run(const std::atomic<bool>& shutdown_requested) {
    while (!shutdown_requested.load() && !stopped_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    logging::info("Shutdown requested");
}

void App::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    if (rest_server_) {
        rest_server_->stop();
    }
    if (controller_ && controller_->status()) {
        try {
            const auto result = controller_->stop();
            logging::info("Active recording saved on shutdown",
                          {kv("success", result.success), kv("path", result.path)});
        } catch (const recorder::NotRecordingError&) {
            logging::debug("Recording ended before shutdown stop");
        }
    }
    controller_.reset();
    events_.close();
    rest_server_.reset();
    engine_.shutdown();
}

}
