#include "honeybee/recorder/types.hpp"

namespace honeybee::recorder {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle:
            return "idle";
        case SessionState::Recording:
            return "recording";
        case SessionState::Stopping:
            return "stopping";
    }
    return "unknown";
}

void to_json(nlohmann::json& json, const RecordingResult& result) {
    json = nlohmann::json{
        {"path", result.path},
        {"filename", result.filename},
        {"duration_ms", result.duration_ms},
        {"success", result.success},
    };
    if (result.error) {
        json["error"] = *result.error;
    } else {
        json["error"] = nullptr;
    }
}

void to_json(nlohmann::json& json, const RecordingProgress& progress) {
    json = nlohmann::json{
        {"recording", progress.is_recording},
        {"duration_ms", progress.duration_ms},
    };
}

void to_json(nlohmann::json& json, const RecordingInfo& info) {
    json = nlohmann::json{
        {"filename", info.filename},
        {"path", info.path},
        {"size", info.size},
        {"modified", info.modified},
    };
}

}
