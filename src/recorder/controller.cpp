#include "honeybee/recorder/controller.hpp"

#include "honeybee/audio/wav_encoder.hpp"
#include "honeybee/logging.hpp"
#include "honeybee/metrics.hpp"

namespace honeybee::recorder {

RecordingController::RecordingController(audio::InputHost& host,
                                         events::EventSink& events,
                                         RecordingStore& store,
                                         ControllerOptions options)
    : host_(host),
      events_(events),
      store_(store),
      options_(options) {}

RecordingController::~RecordingController() {
    stop_signal_.request();
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (capture_thread_.joinable()) {
        capture_thread_.join();
    }
}

std::string RecordingController::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    SessionState expected = SessionState::Idle;
    if (!state_.compare_exchange_strong(expected, SessionState::Recording)) {
        logging::debug("Start ignored", {kv("state", to_string(expected))});
        return kAlreadyRecordingMessage;
    }

    // The previous capture thread has already gone idle and is only exiting.
    if (capture_thread_.joinable()) {
        capture_thread_.join();
    }

    stop_signal_.reset();
    buffer_ = std::make_shared<audio::SampleBuffer>();
    const auto session_id = ++session_counter_;
    try {
        capture_thread_ = std::thread(
            [this, session_id, buffer = buffer_]() { run_session(session_id, buffer); });
    } catch (const std::system_error& ex) {
        state_.store(SessionState::Idle);
        logging::error("Failed to spawn capture thread", {kv("error", ex.what())});
        throw;
    }

    Metrics::instance().increment_sessions_started();
    logging::info("Recording session started", {kv("session", session_id)});
    return kStartedMessage;
}

RecordingResult RecordingController::stop() {
    std::shared_ptr<audio::SampleBuffer> buffer;
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        SessionState expected = SessionState::Recording;
        if (!state_.compare_exchange_strong(expected, SessionState::Stopping)) {
            throw NotRecordingError();
        }
        stop_signal_.request();
        buffer = buffer_;
    }

    bool finished = false;
    {
        std::unique_lock<std::mutex> lock(idle_mutex_);
        finished = idle_cv_.wait_for(lock, options_.stop_timeout, [this]() {
            return state_.load() == SessionState::Idle;
        });
    }
    if (!finished) {
        Metrics::instance().increment_stop_timeouts();
        logging::warn("Capture thread did not stop in time, saving current buffer",
                      {kv("timeout_ms", options_.stop_timeout.count())});
    }

    const auto snapshot = buffer->snapshot();
    RecordingResult result;
    if (snapshot.samples.empty()) {
        result.success = false;
        result.error = kNoAudioMessage;
    } else {
        result = persist(snapshot);
    }

    Metrics::instance().observe_recording(result.success, result.duration_ms);
    publish_saved(result);
    return result;
}

bool RecordingController::status() const {
    return state_.load() != SessionState::Idle;
}

SessionState RecordingController::state() const {
    return state_.load();
}

void RecordingController::run_session(uint64_t session_id,
                                      std::shared_ptr<audio::SampleBuffer> buffer) {
    CaptureSession session(session_id, host_, events_, std::move(buffer), stop_signal_,
                           options_.progress_interval);
    CaptureSession::Outcome outcome = CaptureSession::Outcome::Completed;
    try {
        outcome = session.run();
    } catch (const std::exception& ex) {
        logging::error("Capture session failed",
                       {kv("session", session_id), kv("error", ex.what())});
        events_.publish(events::kRecordingError, std::string(ex.what()));
        outcome = CaptureSession::Outcome::StreamFailure;
    }
    if (outcome != CaptureSession::Outcome::Completed) {
        Metrics::instance().increment_session_errors();
    }
    finish_session(session_id);
}

void RecordingController::finish_session(uint64_t session_id) {
    SessionState previous;
    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        previous = state_.exchange(SessionState::Idle);
    }
    idle_cv_.notify_all();
    logging::debug("Recording session idle",
                   {kv("session", session_id), kv("previous_state", to_string(previous))});
}

RecordingResult RecordingController::persist(const audio::SampleBuffer::Snapshot& snapshot) {
    RecordingResult result;
    result.duration_ms = audio::duration_ms(snapshot.samples.size(), snapshot.format);
    try {
        const auto bytes = audio::encode_wav(snapshot.samples, snapshot.format);
        const auto saved = store_.save(bytes);
        result.path = saved.path;
        result.filename = saved.filename;
        result.success = true;
    } catch (const std::exception& ex) {
        logging::error("Failed to save recording",
                       {kv("error", ex.what()), kv("duration_ms", result.duration_ms)});
        result.success = false;
        result.error = ex.what();
    }
    return result;
}

void RecordingController::publish_saved(const RecordingResult& result) {
    logging::info("Recording session completed",
                  {kv("success", result.success),
                   kv("duration_ms", result.duration_ms),
                   kv("filename", result.filename),
                   kv("error", result.error.value_or(""))});
    events_.publish(events::kRecordingSaved, result);
}

}
