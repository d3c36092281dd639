#include "honeybee/audio/pj_input_device.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>

#include "honeybee/logging.hpp"
#include "honeybee/utils/pj_thread.hpp"

namespace honeybee::audio {

namespace {

constexpr float kPcm16Scale = 1.0f / 32768.0f;

}

CapturePort::CapturePort(ChunkHandler on_chunk, StreamErrorHandler on_error)
    : on_chunk_(std::move(on_chunk)),
      on_error_(std::move(on_error)) {}

void CapturePort::onFrameReceived(pj::MediaFrame& frame) {
    if (frame.type != PJMEDIA_FRAME_TYPE_AUDIO || frame.buf.empty() || frame.size == 0) {
        return;
    }
    const auto available_bytes = std::min(static_cast<size_t>(frame.size), frame.buf.size());
    const auto samples = available_bytes / sizeof(int16_t);
    scratch_.resize(samples);
    for (size_t i = 0; i < samples; ++i) {
        int16_t value = 0;
        std::memcpy(&value, frame.buf.data() + i * sizeof(int16_t), sizeof(int16_t));
        scratch_[i] = static_cast<float>(value) * kPcm16Scale;
    }
    try {
        on_chunk_(scratch_.data(), scratch_.size());
    } catch (const std::exception& ex) {
        if (on_error_) {
            on_error_(ex.what());
        }
    }
}

void CapturePort::onFrameRequested(pj::MediaFrame& frame) {
    frame.type = PJMEDIA_FRAME_TYPE_NONE;
    frame.size = 0;
    frame.buf.clear();
}

PjInputStream::PjInputStream(const AudioFormat& format,
                             int frame_time_usec,
                             ChunkHandler on_chunk,
                             StreamErrorHandler on_error)
    : port_(std::move(on_chunk), std::move(on_error)) {
    pj::MediaFormatAudio media_format;
    media_format.type = PJMEDIA_TYPE_AUDIO;
    media_format.id = PJMEDIA_FORMAT_PCM;
    media_format.clockRate = format.sample_rate;
    media_format.channelCount = format.channel_count;
    media_format.bitsPerSample = 16;
    media_format.frameTimeUsec = static_cast<unsigned>(frame_time_usec);
    try {
        port_.createPort("honeybee/capture", media_format);
    } catch (const pj::Error& err) {
        throw StreamError(err.info());
    }
}

PjInputStream::~PjInputStream() {
    if (!transmitting_ || !utils::ensure_pj_thread_registered("hb_capture")) {
        return;
    }
    try {
        pj::Endpoint::instance().audDevManager().getCaptureDevMedia().stopTransmit(port_);
    } catch (const pj::Error& err) {
        logging::warn("Failed to detach capture port",
                      {kv("reason", err.reason), kv("status", err.status)});
    }
}

void PjInputStream::start() {
    if (!utils::ensure_pj_thread_registered("hb_capture")) {
        throw StreamError("capture thread is not registered with pjlib");
    }
    try {
        pj::Endpoint::instance().audDevManager().getCaptureDevMedia().startTransmit(port_);
        transmitting_ = true;
    } catch (const pj::Error& err) {
        throw StreamError(err.info());
    }
}

PjInputDevice::PjInputDevice(pj::AudioDevInfo info, AudioFormat bridge_format, int frame_time_usec)
    : info_(std::move(info)),
      bridge_format_(bridge_format),
      frame_time_usec_(frame_time_usec) {}

std::string PjInputDevice::name() const {
    return info_.name;
}

// The bridge adapts the device to its own clock and channel layout, and
// only accepts ports in that layout.
AudioFormat PjInputDevice::native_format() const {
    if (info_.defaultSamplesPerSec == 0 || info_.inputCount == 0) {
        throw DeviceError("device " + info_.name + " reports no capture format");
    }
    return bridge_format_;
}

std::unique_ptr<InputStream> PjInputDevice::open_stream(const AudioFormat& format,
                                                        ChunkHandler on_chunk,
                                                        StreamErrorHandler on_error) {
    if (!utils::ensure_pj_thread_registered("hb_capture")) {
        throw StreamError("capture thread is not registered with pjlib");
    }
    return std::make_unique<PjInputStream>(format, frame_time_usec_, std::move(on_chunk),
                                           std::move(on_error));
}

PjInputHost::PjInputHost(const AudioEngine& engine)
    : engine_(engine) {}

std::unique_ptr<InputDevice> PjInputHost::default_input_device() {
    if (!utils::ensure_pj_thread_registered("hb_capture")) {
        return nullptr;
    }
    pj::AudioDevInfo info;
    try {
        info = pj::Endpoint::instance().audDevManager().getDevInfo(
            PJMEDIA_AUD_DEFAULT_CAPTURE_DEV);
    } catch (const pj::Error& err) {
        logging::warn("Default capture device lookup failed",
                      {kv("reason", err.reason), kv("status", err.status)});
        return nullptr;
    }
    if (info.inputCount == 0) {
        return nullptr;
    }
    logging::debug("Default capture device",
                   {kv("name", info.name),
                    kv("driver", info.driver),
                    kv("inputs", info.inputCount),
                    kv("default_rate", info.defaultSamplesPerSec)});
    return std::make_unique<PjInputDevice>(std::move(info), engine_.bridge_format(),
                                           engine_.frame_time_usec());
}

}
