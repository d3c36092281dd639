#pragma once

#include <memory>
#include <string>
#include <vector>

#include <pjsua2.hpp>

#include "honeybee/audio/engine.hpp"
#include "honeybee/audio/input_device.hpp"

namespace honeybee {
namespace audio {

// Conference-bridge port that converts captured PCM16 frames to floats.
class CapturePort : public pj::AudioMediaPort {
public:
    CapturePort(ChunkHandler on_chunk, StreamErrorHandler on_error);

    void onFrameReceived(pj::MediaFrame& frame) override;
    void onFrameRequested(pj::MediaFrame& frame) override;

private:
    ChunkHandler on_chunk_;
    StreamErrorHandler on_error_;
    std::vector<float> scratch_;
};

class PjInputStream : public InputStream {
public:
    PjInputStream(const AudioFormat& format,
                  int frame_time_usec,
                  ChunkHandler on_chunk,
                  StreamErrorHandler on_error);
    ~PjInputStream() override;

    void start() override;

private:
    CapturePort port_;
    bool transmitting_ = false;
};

class PjInputDevice : public InputDevice {
public:
    PjInputDevice(pj::AudioDevInfo info, AudioFormat bridge_format, int frame_time_usec);

    std::string name() const override;
    AudioFormat native_format() const override;
    std::unique_ptr<InputStream> open_stream(const AudioFormat& format,
                                             ChunkHandler on_chunk,
                                             StreamErrorHandler on_error) override;

private:
    pj::AudioDevInfo info_;
    AudioFormat bridge_format_;
    int frame_time_usec_;
};

class PjInputHost : public InputHost {
public:
    explicit PjInputHost(const AudioEngine& engine);

    std::unique_ptr<InputDevice> default_input_device() override;

private:
    const AudioEngine& engine_;
};

}
}
