#include "honeybee/config.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace honeybee {

namespace {

constexpr const char* kRecordingsFolder = "honeybee-recordings";

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::string get_env_str(const char* name, const std::string& fallback) {
    return get_env_optional(name).value_or(fallback);
}

bool get_env_bool(const char* name, bool fallback) {
    const auto value = get_env_optional(name);
    if (!value) {
        return fallback;
    }
    std::string normalized(*value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return normalized == "true" || normalized == "1" || normalized == "yes";
}

int get_env_int(const char* name, int fallback) {
    const auto value = get_env_optional(name);
    if (!value) {
        return fallback;
    }
    try {
        return std::stoi(*value);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " must be an integer");
    }
}

std::string trim(std::string value) {
    auto not_space = [](unsigned char ch) { return std::isspace(ch) == 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    return value;
}

std::string strip_quotes(std::string value) {
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

void set_env_value(const std::string& key, const std::string& value) {
#if defined(_WIN32)
    _putenv_s(key.c_str(), value.c_str());
#else
    setenv(key.c_str(), value.c_str(), 0);
#endif
}

// Variables already present in the environment win over .env entries.
void load_dotenv(const std::filesystem::path& path) {
    std::ifstream stream(path);
    if (!stream.is_open()) {
        return;
    }
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }
        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        const auto key = trim(line.substr(0, eq_pos));
        if (key.empty()) {
            continue;
        }
        set_env_value(key, strip_quotes(trim(line.substr(eq_pos + 1))));
    }
}

std::string timestamp_suffix() {
    const auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_value{};
#if defined(_WIN32)
    localtime_s(&tm_value, &time_t);
#else
    localtime_r(&time_t, &tm_value);
#endif
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

}

std::filesystem::path default_recordings_dir() {
    if (const auto music = get_env_optional("XDG_MUSIC_DIR")) {
        return std::filesystem::path(*music) / kRecordingsFolder;
    }
#if defined(_WIN32)
    const auto home = get_env_optional("USERPROFILE");
#else
    const auto home = get_env_optional("HOME");
#endif
    if (home) {
        return std::filesystem::path(*home) / "Music" / kRecordingsFolder;
    }
    return std::filesystem::current_path() / kRecordingsFolder;
}

Config Config::load() {
    load_dotenv(std::filesystem::current_path() / ".env");

    Config config;
    if (const auto dir = get_env_optional("RECORDINGS_DIR")) {
        config.recordings_dir = *dir;
    } else {
        config.recordings_dir = default_recordings_dir();
    }

    config.audio_clock_rate = get_env_int("AUDIO_CLOCK_RATE", config.audio_clock_rate);
    config.audio_channel_count = get_env_int("AUDIO_CHANNEL_COUNT", config.audio_channel_count);
    config.frame_time_usec = get_env_int("FRAME_TIME_USEC", config.frame_time_usec);
    config.audio_null_device = get_env_bool("AUDIO_NULL_DEVICE", config.audio_null_device);
    config.stop_timeout_ms = get_env_int("STOP_TIMEOUT_MS", config.stop_timeout_ms);
    config.progress_interval_ms = get_env_int("PROGRESS_INTERVAL_MS", config.progress_interval_ms);
    config.event_queue_size = get_env_int("EVENT_QUEUE_SIZE", config.event_queue_size);

    config.rest_api_host = get_env_str("REST_API_HOST", config.rest_api_host);
    config.rest_api_port = get_env_int("REST_API_PORT", config.rest_api_port);
    config.authorization_token = get_env_optional("AUTHORIZATION_TOKEN");

    config.log_level = get_env_str("LOG_LEVEL", config.log_level);
    if (const auto log_filename = get_env_optional("LOG_FILENAME")) {
        const std::filesystem::path log_path(*log_filename);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.logs_dir = std::filesystem::path(*log_dir);
            config.log_filename = (*config.logs_dir / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }
    config.log_max_size_mb = get_env_int("LOG_MAX_SIZE_MB", config.log_max_size_mb);
    config.log_max_files = get_env_int("LOG_MAX_FILES", config.log_max_files);
    config.log_name = get_env_str("LOG_NAME", config.log_name);
    config.pjsip_log_level = get_env_int("PJSIP_LOG_LEVEL", config.pjsip_log_level);

    return config;
}

void Config::validate() const {
    if (recordings_dir.empty()) {
        throw std::runtime_error("RECORDINGS_DIR must not be empty");
    }
    if (audio_clock_rate <= 0) {
        throw std::runtime_error("AUDIO_CLOCK_RATE must be positive");
    }
    if (audio_channel_count <= 0) {
        throw std::runtime_error("AUDIO_CHANNEL_COUNT must be positive");
    }
    if (frame_time_usec <= 0) {
        throw std::runtime_error("FRAME_TIME_USEC must be positive");
    }
    if (stop_timeout_ms <= 0) {
        throw std::runtime_error("STOP_TIMEOUT_MS must be positive");
    }
    if (progress_interval_ms <= 0) {
        throw std::runtime_error("PROGRESS_INTERVAL_MS must be positive");
    }
    if (event_queue_size <= 0) {
        throw std::runtime_error("EVENT_QUEUE_SIZE must be positive");
    }
    if (rest_api_port <= 0 || rest_api_port > 65535) {
        throw std::runtime_error("REST_API_PORT must be a valid port");
    }
    if (log_max_size_mb <= 0) {
        throw std::runtime_error("LOG_MAX_SIZE_MB must be positive");
    }
    if (log_max_files <= 0) {
        throw std::runtime_error("LOG_MAX_FILES must be positive");
    }
}

}
