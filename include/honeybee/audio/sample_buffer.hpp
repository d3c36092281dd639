#pragma once

#include <cstddef>
#include <mutex>
#include <vector>

#include "honeybee/audio/format.hpp"

namespace honeybee {
namespace audio {

// Interleaved float samples of one capture session. The device callback
// appends, the stopping thread copies; the lock is held only for the copy.
class SampleBuffer {
public:
    struct Snapshot {
        AudioFormat format;
        std::vector<float> samples;
    };

    SampleBuffer() = default;
    SampleBuffer(const SampleBuffer&) = delete;
    SampleBuffer& operator=(const SampleBuffer&) = delete;

    void set_format(const AudioFormat& format);
    void append(const float* data, size_t count);
    Snapshot snapshot() const;
    size_t size() const;
    bool empty() const;

private:
    mutable std::mutex mutex_;
    AudioFormat format_;
    std::vector<float> samples_;
};

}
}
