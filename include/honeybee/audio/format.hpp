#pragma once

#include <cstdint>

namespace honeybee {
namespace audio {

struct AudioFormat {
    uint32_t sample_rate = 44100;
    uint16_t channel_count = 1;
};

inline bool operator==(const AudioFormat& lhs, const AudioFormat& rhs) {
    return lhs.sample_rate == rhs.sample_rate && lhs.channel_count == rhs.channel_count;
}

inline bool operator!=(const AudioFormat& lhs, const AudioFormat& rhs) {
    return !(lhs == rhs);
}

// Whole milliseconds of audio held by `sample_count` interleaved samples.
inline uint64_t duration_ms(uint64_t sample_count, const AudioFormat& format) {
    const uint64_t samples_per_second =
        static_cast<uint64_t>(format.sample_rate) * format.channel_count;
    if (samples_per_second == 0) {
        return 0;
    }
    return sample_count * 1000 / samples_per_second;
}

}
}
