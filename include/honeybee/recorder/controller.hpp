#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>

#include "honeybee/audio/input_device.hpp"
#include "honeybee/audio/sample_buffer.hpp"
#include "honeybee/events/event_sink.hpp"
#include "honeybee/recorder/capture_session.hpp"
#include "honeybee/recorder/recording_store.hpp"
#include "honeybee/recorder/types.hpp"

namespace honeybee {
namespace recorder {

struct ControllerOptions {
    std::chrono::milliseconds stop_timeout{5000};
    std::chrono::milliseconds progress_interval{200};
};

// Owns the single recording session of the process. Command handlers on any
// thread share one instance; at most one capture thread exists at a time.
class RecordingController {
public:
    static constexpr const char* kStartedMessage = "Recording started";
    static constexpr const char* kAlreadyRecordingMessage = "Already recording";
    static constexpr const char* kNoAudioMessage = "no audio data recorded";

    RecordingController(audio::InputHost& host,
                        events::EventSink& events,
                        RecordingStore& store,
                        ControllerOptions options = {});
    ~RecordingController();

    RecordingController(const RecordingController&) = delete;
    RecordingController& operator=(const RecordingController&) = delete;

    // Never waits for the session; starting twice is a no-op.
    std::string start();

    // Signals the capture thread, waits up to stop_timeout for it to release
    // the device, then persists whatever the buffer holds. When the wait
    // expires the snapshot is taken anyway and samples delivered afterwards
    // are not part of the file. Throws NotRecordingError when idle.
    RecordingResult stop();

    bool status() const;
    SessionState state() const;

private:
    void run_session(uint64_t session_id, std::shared_ptr<audio::SampleBuffer> buffer);
    void finish_session(uint64_t session_id);
    RecordingResult persist(const audio::SampleBuffer::Snapshot& snapshot);
    void publish_saved(const RecordingResult& result);

    audio::InputHost& host_;
    events::EventSink& events_;
    RecordingStore& store_;
    ControllerOptions options_;

    std::atomic<SessionState> state_{SessionState::Idle};
    StopSignal stop_signal_;

    // Serializes session setup in start() with the stop request in stop().
    std::mutex lifecycle_mutex_;
    std::thread capture_thread_;
    std::shared_ptr<audio::SampleBuffer> buffer_;
    uint64_t session_counter_ = 0;

    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;
};

}
}
