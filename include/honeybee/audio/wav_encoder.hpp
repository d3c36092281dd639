#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "honeybee/audio/format.hpp"

namespace honeybee {
namespace audio {

constexpr uint16_t kWavBitsPerSample = 16;
constexpr size_t kWavHeaderSize = 44;
// RIFF sizes are 32-bit; the riff chunk also counts 36 header bytes.
constexpr size_t kWavMaxSamples = (UINT32_MAX - 36) / (kWavBitsPerSample / 8);

// Byte length of the data chunk; throws std::length_error past kWavMaxSamples.
uint32_t wav_data_size(size_t sample_count);

// 16-bit PCM value written for one float sample.
int16_t to_pcm16(float sample);

// Complete RIFF/WAVE file: 44-byte header followed by little-endian PCM16.
std::string encode_wav(const std::vector<float>& samples, const AudioFormat& format);

}
}
