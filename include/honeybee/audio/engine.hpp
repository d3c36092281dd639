#pragma once

#include <memory>

#include <pjsua2.hpp>

#include "honeybee/audio/format.hpp"
#include "honeybee/config.hpp"

namespace honeybee {
namespace audio {

// Media-only pjsua2 endpoint. The conference bridge runs at the configured
// clock rate and channel count; capture ports receive frames in that format.
class AudioEngine {
public:
    explicit AudioEngine(const Config& config);
    ~AudioEngine();

    AudioEngine(const AudioEngine&) = delete;
    AudioEngine& operator=(const AudioEngine&) = delete;

    void init();
    void shutdown();

    AudioFormat bridge_format() const;
    int frame_time_usec() const;

private:
    const Config& config_;
    std::unique_ptr<pj::Endpoint> endpoint_;
};

}
}
