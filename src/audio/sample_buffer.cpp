#include "honeybee/audio/sample_buffer.hpp"

namespace honeybee::audio {

void SampleBuffer::set_format(const AudioFormat& format) {
    std::lock_guard<std::mutex> lock(mutex_);
    format_ = format;
}

void SampleBuffer::append(const float* data, size_t count) {
    if (!data || count == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.insert(samples_.end(), data, data + count);
}

SampleBuffer::Snapshot SampleBuffer::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {format_, samples_};
}

size_t SampleBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.size();
}

bool SampleBuffer::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.empty();
}

}
