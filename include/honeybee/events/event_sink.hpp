#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace honeybee {
namespace events {

constexpr const char* kRecordingStatus = "recording-status";
constexpr const char* kRecordingError = "recording-error";
constexpr const char* kRecordingSaved = "recording-saved";

class EventSink {
public:
    virtual ~EventSink() = default;

    // Fire and forget; implementations must not throw.
    virtual void publish(const std::string& name, const nlohmann::json& payload) = 0;
};

}
}
