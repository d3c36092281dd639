#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace honeybee {
namespace recorder {

enum class SessionState {
    Idle,
    Recording,
    Stopping
};

const char* to_string(SessionState state);

// stop() was called without an active session.
class NotRecordingError : public std::runtime_error {
public:
    NotRecordingError() : std::runtime_error("Not recording") {}
};

struct RecordingResult {
    std::string path;
    std::string filename;
    uint64_t duration_ms = 0;
    bool success = false;
    std::optional<std::string> error;
};

struct RecordingProgress {
    bool is_recording = false;
    uint64_t duration_ms = 0;
};

struct RecordingInfo {
    std::string filename;
    std::string path;
    uint64_t size = 0;
    uint64_t modified = 0;  // Seconds since the Unix epoch.
};

void to_json(nlohmann::json& json, const RecordingResult& result);
void to_json(nlohmann::json& json, const RecordingProgress& progress);
void to_json(nlohmann::json& json, const RecordingInfo& info);

}
}
