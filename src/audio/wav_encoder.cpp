#include "honeybee/audio/wav_encoder.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace honeybee::audio {

int16_t to_pcm16(float sample) {
    const double clamped = std::max(-1.0, std::min(1.0, static_cast<double>(sample)));
    return static_cast<int16_t>(std::lround(clamped * 32767.0));
}

uint32_t wav_data_size(size_t sample_count) {
    if (sample_count > kWavMaxSamples) {
        throw std::length_error("recording exceeds the 4 GiB WAV size limit");
    }
    return static_cast<uint32_t>(sample_count * (kWavBitsPerSample / 8));
}

std::string encode_wav(const std::vector<float>& samples, const AudioFormat& format) {
    if (format.sample_rate == 0 || format.channel_count == 0) {
        throw std::invalid_argument("WAV format needs a positive sample rate and channel count");
    }
    const uint16_t bytes_per_sample = kWavBitsPerSample / 8;
    const uint16_t channels = format.channel_count;
    const uint32_t sample_rate = format.sample_rate;
    const uint16_t block_align = static_cast<uint16_t>(channels * bytes_per_sample);
    const uint32_t byte_rate = sample_rate * block_align;
    const uint32_t data_size = wav_data_size(samples.size());
    const uint32_t chunk_size = 36 + data_size;

    std::string result;
    result.reserve(kWavHeaderSize + data_size);
    auto append = [&result](const char* data, size_t size) {
        result.append(data, size);
    };
    auto append_u16 = [&result](uint16_t value) {
        result.push_back(static_cast<char>(value & 0xFF));
        result.push_back(static_cast<char>((value >> 8) & 0xFF));
    };
    auto append_u32 = [&result](uint32_t value) {
        result.push_back(static_cast<char>(value & 0xFF));
        result.push_back(static_cast<char>((value >> 8) & 0xFF));
        result.push_back(static_cast<char>((value >> 16) & 0xFF));
        result.push_back(static_cast<char>((value >> 24) & 0xFF));
    };

    append("RIFF", 4);
    append_u32(chunk_size);
    append("WAVE", 4);
    append("fmt ", 4);
    append_u32(16);
    append_u16(1);
    append_u16(channels);
    append_u32(sample_rate);
    append_u32(byte_rate);
    append_u16(block_align);
    append_u16(kWavBitsPerSample);
    append("data", 4);
    append_u32(data_size);

    for (float sample : samples) {
        append_u16(static_cast<uint16_t>(to_pcm16(sample)));
    }

    return result;
}

}
