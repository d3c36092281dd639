#include "honeybee/metrics.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace honeybee {

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.001, 0.005, 0.01, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0};
}

void Metrics::increment_sessions_started() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++sessions_started_;
}

void Metrics::increment_session_errors() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++session_errors_;
}

void Metrics::increment_stop_timeouts() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stop_timeouts_;
}

void Metrics::observe_recording(bool success, uint64_t duration_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (success) {
        ++recordings_succeeded_;
        recorded_seconds_ += static_cast<double>(duration_ms) / 1000.0;
    } else {
        ++recordings_failed_;
    }
}

void Metrics::observe_command_time(const std::string& command, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& series = command_histograms_[command];
    if (series.buckets.empty()) {
        series.buckets.assign(histogram_bounds_.size() + 1, 0);
    }
    series.count += 1;
    series.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            series.buckets[i] += 1;
        }
    }
    series.buckets.back() += 1;
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    out << "# HELP recorder_sessions_started_total Capture sessions started\n";
    out << "# TYPE recorder_sessions_started_total counter\n";
    out << "recorder_sessions_started_total " << sessions_started_ << "\n";

    out << "# HELP recorder_session_errors_total Capture sessions aborted by device errors\n";
    out << "# TYPE recorder_session_errors_total counter\n";
    out << "recorder_session_errors_total " << session_errors_ << "\n";

    out << "# HELP recorder_stop_timeouts_total Stops that outlived the capture shutdown wait\n";
    out << "# TYPE recorder_stop_timeouts_total counter\n";
    out << "recorder_stop_timeouts_total " << stop_timeouts_ << "\n";

    out << "# HELP recorder_recordings_total Completed stops by outcome\n";
    out << "# TYPE recorder_recordings_total counter\n";
    out << "recorder_recordings_total{result=\"success\"} " << recordings_succeeded_ << "\n";
    out << "recorder_recordings_total{result=\"failure\"} " << recordings_failed_ << "\n";

    out << "# HELP recorder_recorded_seconds_total Audio seconds persisted\n";
    out << "# TYPE recorder_recorded_seconds_total counter\n";
    out << "recorder_recorded_seconds_total " << recorded_seconds_ << "\n";

    out << "# HELP command_duration_seconds Command handling time\n";
    out << "# TYPE command_duration_seconds histogram\n";
    std::vector<std::string> commands;
    commands.reserve(command_histograms_.size());
    for (const auto& item : command_histograms_) {
        commands.push_back(item.first);
    }
    std::sort(commands.begin(), commands.end());
    for (const auto& command : commands) {
        const auto& series = command_histograms_.at(command);
        for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
            out << "command_duration_seconds_bucket{command=\"" << command
                << "\",le=\"" << histogram_bounds_[i] << "\"} "
                << series.buckets[i] << "\n";
        }
        out << "command_duration_seconds_bucket{command=\"" << command
            << "\",le=\"+Inf\"} " << series.buckets.back() << "\n";
        out << "command_duration_seconds_count{command=\"" << command << "\"} "
            << series.count << "\n";
        out << "command_duration_seconds_sum{command=\"" << command << "\"} "
            << series.sum << "\n";
    }

    return out.str();
}

}
