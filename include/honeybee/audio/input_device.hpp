#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include "honeybee/audio/format.hpp"

namespace honeybee {
namespace audio {

// No input device, or its native format could not be read.
class DeviceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The capture stream could not be built or started.
class StreamError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Invoked on the device's own thread with interleaved samples in [-1, 1].
using ChunkHandler = std::function<void(const float* samples, size_t count)>;
using StreamErrorHandler = std::function<void(const std::string& message)>;

class InputStream {
public:
    virtual ~InputStream() = default;

    virtual void start() = 0;
};

class InputDevice {
public:
    virtual ~InputDevice() = default;

    virtual std::string name() const = 0;
    virtual AudioFormat native_format() const = 0;
    virtual std::unique_ptr<InputStream> open_stream(const AudioFormat& format,
                                                     ChunkHandler on_chunk,
                                                     StreamErrorHandler on_error) = 0;
};

class InputHost {
public:
    virtual ~InputHost() = default;

    // nullptr when the platform has no default input device.
    virtual std::unique_ptr<InputDevice> default_input_device() = 0;
};

}
}
