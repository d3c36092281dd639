#include <catch2/catch_test_macros.hpp>

#include "honeybee/audio/sample_buffer.hpp"

#include <thread>
#include <vector>

using honeybee::audio::AudioFormat;
using honeybee::audio::SampleBuffer;
using honeybee::audio::duration_ms;

TEST_CASE("snapshot copies format and samples together") {
    SampleBuffer buffer;
    const AudioFormat stereo{48000, 2};
    buffer.set_format(stereo);
    const std::vector<float> chunk = {0.1f, -0.1f, 0.2f, -0.2f};
    buffer.append(chunk.data(), chunk.size());

    const auto snapshot = buffer.snapshot();
    REQUIRE(snapshot.format == stereo);
    REQUIRE(snapshot.samples == chunk);
}

TEST_CASE("snapshot does not drain the buffer") {
    SampleBuffer buffer;
    const std::vector<float> chunk(32, 0.5f);
    buffer.append(chunk.data(), chunk.size());
    REQUIRE(buffer.snapshot().samples.size() == 32);
    REQUIRE(buffer.size() == 32);
    REQUIRE_FALSE(buffer.empty());
}

TEST_CASE("appending nothing leaves the buffer empty") {
    SampleBuffer buffer;
    buffer.append(nullptr, 10);
    const float value = 0.3f;
    buffer.append(&value, 0);
    REQUIRE(buffer.empty());
    REQUIRE(buffer.snapshot().format == AudioFormat());
}

TEST_CASE("concurrent appends are never torn") {
    SampleBuffer buffer;
    constexpr int kWriters = 4;
    constexpr int kChunks = 500;
    constexpr size_t kChunkSize = 64;

    std::vector<std::thread> writers;
    for (int w = 0; w < kWriters; ++w) {
        writers.emplace_back([&buffer, w]() {
            const std::vector<float> chunk(kChunkSize, static_cast<float>(w) / 10.0f);
            for (int i = 0; i < kChunks; ++i) {
                buffer.append(chunk.data(), chunk.size());
            }
        });
    }
    size_t last_size = 0;
    for (int i = 0; i < 200; ++i) {
        const auto snapshot = buffer.snapshot();
        REQUIRE(snapshot.samples.size() % kChunkSize == 0);
        REQUIRE(snapshot.samples.size() >= last_size);
        last_size = snapshot.samples.size();
    }
    for (auto& writer : writers) {
        writer.join();
    }
    REQUIRE(buffer.size() == kWriters * kChunks * kChunkSize);
}

TEST_CASE("duration counts whole milliseconds of interleaved frames") {
    const AudioFormat mono{44100, 1};
    const AudioFormat stereo{48000, 2};
    const AudioFormat broken{0, 1};
    REQUIRE(duration_ms(44100, mono) == 1000);
    REQUIRE(duration_ms(96000, stereo) == 1000);
    REQUIRE(duration_ms(44099, mono) == 999);
    REQUIRE(duration_ms(0, mono) == 0);
    REQUIRE(duration_ms(100, broken) == 0);
}
