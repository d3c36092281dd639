#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace honeybee {

class Metrics {
public:
    static Metrics& instance();

    void increment_sessions_started();
    void increment_session_errors();
    void increment_stop_timeouts();
    void observe_recording(bool success, uint64_t duration_ms);
    void observe_command_time(const std::string& command, double seconds);
    std::string render_prometheus() const;

private:
    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    mutable std::mutex mutex_;
    uint64_t sessions_started_ = 0;
    uint64_t session_errors_ = 0;
    uint64_t stop_timeouts_ = 0;
    uint64_t recordings_succeeded_ = 0;
    uint64_t recordings_failed_ = 0;
    double recorded_seconds_ = 0.0;
    std::unordered_map<std::string, HistogramSeries> command_histograms_;
    std::vector<double> histogram_bounds_;
};

}
