#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "honeybee/audio/input_device.hpp"
#include "honeybee/events/event_sink.hpp"

namespace honeybee::test {

inline bool wait_until(const std::function<bool()>& predicate,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return predicate();
}

class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("honeybee_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

struct PublishedEvent {
    std::string name;
    nlohmann::json payload;
};

class CollectingSink : public events::EventSink {
public:
    void publish(const std::string& name, const nlohmann::json& payload) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back({name, payload});
    }

    size_t count(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t total = 0;
        for (const auto& event : events_) {
            if (event.name == name) {
                ++total;
            }
        }
        return total;
    }

    std::vector<PublishedEvent> named(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<PublishedEvent> result;
        for (const auto& event : events_) {
            if (event.name == name) {
                result.push_back(event);
            }
        }
        return result;
    }

private:
    mutable std::mutex mutex_;
    std::vector<PublishedEvent> events_;
};

// Scripted stand-in for the platform input device.
struct DeviceScript {
    bool has_device = true;
    bool fail_format = false;
    bool fail_open = false;
    bool fail_start = false;
    audio::AudioFormat format{44100, 1};
    std::vector<std::vector<float>> chunks;
    std::chrono::milliseconds release_delay{0};
};

class FakeInputHost : public audio::InputHost {
public:
    explicit FakeInputHost(DeviceScript script = {})
        : state_(std::make_shared<State>()) {
        state_->script = std::move(script);
    }

    void set_script(DeviceScript script) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->script = std::move(script);
    }

    std::unique_ptr<audio::InputDevice> default_input_device() override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        ++state_->devices_opened;
        if (!state_->script.has_device) {
            return nullptr;
        }
        return std::make_unique<Device>(state_, state_->script);
    }

    int devices_opened() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->devices_opened;
    }

    int streams_started() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->streams_started;
    }

    int streams_released() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->streams_released;
    }

    // True once `count` streams have started and delivered their chunks.
    bool wait_for_started(int count = 1,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->cv.wait_for(lock, timeout,
                                   [&]() { return state_->streams_started >= count; });
    }

private:
    struct State {
        mutable std::mutex mutex;
        std::condition_variable cv;
        DeviceScript script;
        int devices_opened = 0;
        int streams_started = 0;
        int streams_released = 0;
    };

    class Stream : public audio::InputStream {
    public:
        Stream(std::shared_ptr<State> state, DeviceScript script, audio::ChunkHandler on_chunk)
            : state_(std::move(state)),
              script_(std::move(script)),
              on_chunk_(std::move(on_chunk)) {}

        ~Stream() override {
            std::this_thread::sleep_for(script_.release_delay);
            std::lock_guard<std::mutex> lock(state_->mutex);
            ++state_->streams_released;
        }

        void start() override {
            if (script_.fail_start) {
                throw audio::StreamError("device busy");
            }
            // Chunks arrive on a thread the session does not own.
            std::thread device_thread([this]() {
                for (const auto& chunk : script_.chunks) {
                    on_chunk_(chunk.data(), chunk.size());
                }
            });
            device_thread.join();
            {
                std::lock_guard<std::mutex> lock(state_->mutex);
                ++state_->streams_started;
            }
            state_->cv.notify_all();
        }

    private:
        std::shared_ptr<State> state_;
        DeviceScript script_;
        audio::ChunkHandler on_chunk_;
    };

    class Device : public audio::InputDevice {
    public:
        Device(std::shared_ptr<State> state, DeviceScript script)
            : state_(std::move(state)),
              script_(std::move(script)) {}

        std::string name() const override { return "fake microphone"; }

        audio::AudioFormat native_format() const override {
            if (script_.fail_format) {
                throw audio::DeviceError("format query refused");
            }
            return script_.format;
        }

        std::unique_ptr<audio::InputStream> open_stream(const audio::AudioFormat&,
                                                        audio::ChunkHandler on_chunk,
                                                        audio::StreamErrorHandler) override {
            if (script_.fail_open) {
                throw audio::StreamError("unsupported sample format");
            }
            return std::make_unique<Stream>(state_, script_, std::move(on_chunk));
        }

    private:
        std::shared_ptr<State> state_;
        DeviceScript script_;
    };

    std::shared_ptr<State> state_;
};

inline uint32_t read_u32_le(const std::string& bytes, size_t offset) {
    return static_cast<uint32_t>(static_cast<unsigned char>(bytes.at(offset))) |
           static_cast<uint32_t>(static_cast<unsigned char>(bytes.at(offset + 1))) << 8 |
           static_cast<uint32_t>(static_cast<unsigned char>(bytes.at(offset + 2))) << 16 |
           static_cast<uint32_t>(static_cast<unsigned char>(bytes.at(offset + 3))) << 24;
}

inline uint16_t read_u16_le(const std::string& bytes, size_t offset) {
    return static_cast<uint16_t>(static_cast<unsigned char>(bytes.at(offset)) |
                                 static_cast<unsigned char>(bytes.at(offset + 1)) << 8);
}

inline int16_t read_i16_le(const std::string& bytes, size_t offset) {
    return static_cast<int16_t>(read_u16_le(bytes, offset));
}

}
