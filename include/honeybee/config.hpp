#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace honeybee {

struct Config {
    std::filesystem::path recordings_dir;
    int audio_clock_rate = 44100;
    int audio_channel_count = 1;
    int frame_time_usec = 20000;
    bool audio_null_device = false;
    int stop_timeout_ms = 5000;
    int progress_interval_ms = 200;
    int event_queue_size = 64;
    std::string rest_api_host = "127.0.0.1";
    int rest_api_port = 8000;
    std::optional<std::string> authorization_token;
    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;
    int log_max_size_mb = 10;
    int log_max_files = 3;
    std::string log_name = "honeybee";
    int pjsip_log_level = 1;

    static Config load();
    void validate() const;
};

// Platform music directory joined with the recordings folder name.
std::filesystem::path default_recordings_dir();

}
