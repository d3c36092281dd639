#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "honeybee/audio/input_device.hpp"
#include "honeybee/audio/sample_buffer.hpp"
#include "honeybee/events/event_sink.hpp"

namespace honeybee {
namespace recorder {

// Stop handshake between the controller and the capture thread.
class StopSignal {
public:
    void reset();
    void request();
    bool requested() const;
    // Waits up to `timeout`; returns true as soon as a stop was requested.
    bool wait(std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::atomic<bool> requested_{false};
};

// One capture attempt, from device open to device release. run() executes on
// the session thread, which is the only thread that touches the device stream.
class CaptureSession {
public:
    enum class Outcome {
        Completed,
        DeviceUnavailable,
        StreamFailure
    };

    CaptureSession(uint64_t id,
                   audio::InputHost& host,
                   events::EventSink& events,
                   std::shared_ptr<audio::SampleBuffer> buffer,
                   const StopSignal& stop,
                   std::chrono::milliseconds progress_interval);

    Outcome run();

private:
    void report_error(const std::string& message);
    void publish_progress(std::chrono::steady_clock::time_point started_at);

    uint64_t id_;
    audio::InputHost& host_;
    events::EventSink& events_;
    std::shared_ptr<audio::SampleBuffer> buffer_;
    const StopSignal& stop_;
    std::chrono::milliseconds progress_interval_;
};

}
}
