#include "honeybee/recorder/capture_session.hpp"

#include <string>

#include "honeybee/logging.hpp"
#include "honeybee/recorder/types.hpp"

namespace honeybee::recorder {

void StopSignal::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    requested_.store(false);
}

void StopSignal::request() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requested_.store(true);
    }
    cv_.notify_all();
}

bool StopSignal::requested() const {
    return requested_.load();
}

bool StopSignal::wait(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return requested_.load(); });
}

CaptureSession::CaptureSession(uint64_t id,
                               audio::InputHost& host,
                               events::EventSink& events,
                               std::shared_ptr<audio::SampleBuffer> buffer,
                               const StopSignal& stop,
                               std::chrono::milliseconds progress_interval)
    : id_(id),
      host_(host),
      events_(events),
      buffer_(std::move(buffer)),
      stop_(stop),
      progress_interval_(progress_interval) {}

CaptureSession::Outcome CaptureSession::run() {
    std::unique_ptr<audio::InputDevice> device;
    try {
        device = host_.default_input_device();
    } catch (const std::exception& ex) {
        logging::error("Input device lookup failed",
                       {kv("session", id_), kv("error", ex.what())});
    }
    if (!device) {
        report_error("No input device found");
        return Outcome::DeviceUnavailable;
    }

    audio::AudioFormat format;
    try {
        format = device->native_format();
    } catch (const std::exception& ex) {
        report_error(std::string("Failed to get input config: ") + ex.what());
        return Outcome::DeviceUnavailable;
    }
    buffer_->set_format(format);

    std::unique_ptr<audio::InputStream> stream;
    try {
        auto buffer = buffer_;
        stream = device->open_stream(
            format,
            [buffer](const float* samples, size_t count) { buffer->append(samples, count); },
            [session = id_](const std::string& message) {
                logging::warn("Recording stream error",
                              {kv("session", session), kv("error", message)});
            });
    } catch (const std::exception& ex) {
        report_error(std::string("Failed to build stream: ") + ex.what());
        return Outcome::StreamFailure;
    }

    try {
        stream->start();
    } catch (const std::exception& ex) {
        stream.reset();
        report_error(std::string("Failed to start stream: ") + ex.what());
        return Outcome::StreamFailure;
    }

    logging::info("Capture started",
                  {kv("session", id_),
                   kv("device", device->name()),
                   kv("sample_rate", format.sample_rate),
                   kv("channels", format.channel_count)});

    const auto started_at = std::chrono::steady_clock::now();
    while (!stop_.requested()) {
        publish_progress(started_at);
        if (stop_.wait(progress_interval_)) {
            break;
        }
    }

    stream.reset();
    logging::info("Capture released",
                  {kv("session", id_), kv("samples", buffer_->size())});
    return Outcome::Completed;
}

void CaptureSession::report_error(const std::string& message) {
    logging::error("Capture session aborted", {kv("session", id_), kv("error", message)});
    events_.publish(events::kRecordingError, message);
}

void CaptureSession::publish_progress(std::chrono::steady_clock::time_point started_at) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at);
    RecordingProgress progress;
    progress.is_recording = true;
    progress.duration_ms = static_cast<uint64_t>(elapsed.count());
    events_.publish(events::kRecordingStatus, progress);
}

}
