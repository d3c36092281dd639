#include "honeybee/app.hpp"
#include "honeybee/config.hpp"
#include "honeybee/logging.hpp"

#include <atomic>
#include <csignal>

namespace {

std::atomic<bool> shutdown_requested{false};

void handle_signal(int) {
    shutdown_requested.store(true);
}

}

int main() {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    try {
        const auto config = honeybee::Config::load();
        config.validate();
        honeybee::logging::init(config);
        honeybee::info(
            "Starting honeybee backend",
            {honeybee::kv("recordings_dir", config.recordings_dir.string()),
             honeybee::kv("rest_port", config.rest_api_port),
             honeybee::kv("clock_rate", config.audio_clock_rate),
             honeybee::kv("null_device", config.audio_null_device)});
        honeybee::App app(config);
        app.init();
        app.run(shutdown_requested);
        app.stop();
    } catch (const std::exception& ex) {
        honeybee::error(
            "Startup failed",
            {honeybee::kv("error", ex.what())});
        return 1;
    }
    return 0;
}
