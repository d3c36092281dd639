#include "honeybee/audio/engine.hpp"

#include <stdexcept>
#include <string>

#include "honeybee/logging.hpp"

namespace honeybee::audio {

AudioEngine::AudioEngine(const Config& config)
    : config_(config) {}

AudioEngine::~AudioEngine() {
    shutdown();
}

void AudioEngine::init() {
    if (endpoint_) {
        return;
    }
    endpoint_ = std::make_unique<pj::Endpoint>();
    try {
        endpoint_->libCreate();

        pj::EpConfig ep_cfg;
        ep_cfg.uaConfig.threadCnt = 0;
        ep_cfg.uaConfig.mainThreadOnly = false;
        ep_cfg.medConfig.threadCnt = 1;
        ep_cfg.medConfig.hasIoqueue = true;
        ep_cfg.medConfig.clockRate = static_cast<unsigned>(config_.audio_clock_rate);
        ep_cfg.medConfig.sndClockRate = 0;
        ep_cfg.medConfig.channelCount = static_cast<unsigned>(config_.audio_channel_count);
        ep_cfg.medConfig.audioFramePtime = static_cast<unsigned>(config_.frame_time_usec / 1000);
        ep_cfg.medConfig.noVad = true;
        ep_cfg.medConfig.ecTailLen = 0;
        ep_cfg.medConfig.sndAutoCloseTime = 1;
        ep_cfg.logConfig.level = static_cast<unsigned>(config_.pjsip_log_level);
        ep_cfg.logConfig.consoleLevel = static_cast<unsigned>(config_.pjsip_log_level);
        if (config_.log_filename) {
            ep_cfg.logConfig.filename = *config_.log_filename + ".pjsip";
        }
        endpoint_->libInit(ep_cfg);

        if (config_.audio_null_device) {
            endpoint_->audDevManager().setNullDev();
        }
        endpoint_->libStart();
    } catch (const pj::Error& err) {
        endpoint_.reset();
        throw std::runtime_error("Failed to initialize audio engine: " + err.info());
    }

    logging::info("Audio engine ready",
                  {kv("clock_rate", config_.audio_clock_rate),
                   kv("channels", config_.audio_channel_count),
                   kv("null_device", config_.audio_null_device)});
}

void AudioEngine::shutdown() {
    if (!endpoint_) {
        return;
    }
    try {
        endpoint_->libDestroy();
    } catch (const pj::Error& err) {
        logging::error("Audio engine shutdown failed",
                       {kv("reason", err.reason), kv("status", err.status)});
    }
    endpoint_.reset();
}

AudioFormat AudioEngine::bridge_format() const {
    AudioFormat format;
    format.sample_rate = static_cast<uint32_t>(config_.audio_clock_rate);
    format.channel_count = static_cast<uint16_t>(config_.audio_channel_count);
    return format;
}

int AudioEngine::frame_time_usec() const {
    return config_.frame_time_usec;
}

}
