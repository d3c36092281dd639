#include "honeybee/logging.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

namespace honeybee::logging {

namespace {

std::mutex logger_name_mutex;
std::string logger_name = "honeybee";

bool needs_quotes(const std::string& value) {
    return value.empty() || value.find_first_of(" ,=\"") != std::string::npos;
}

}

std::string format_kv(std::initializer_list<KeyValue> items) {
    std::string result;
    for (const auto& item : items) {
        if (!result.empty()) {
            result += ", ";
        }
        result += item.key;
        result += '=';
        if (!needs_quotes(item.value)) {
            result += item.value;
            continue;
        }
        result += '"';
        for (char ch : item.value) {
            if (ch == '"') {
                result += '\\';
            }
            result += ch;
        }
        result += '"';
    }
    return result;
}

spdlog::level::level_enum parse_level(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    if (value == "TRACE") return spdlog::level::trace;
    if (value == "DEBUG") return spdlog::level::debug;
    if (value == "WARN" || value == "WARNING") return spdlog::level::warn;
    if (value == "ERROR") return spdlog::level::err;
    if (value == "CRITICAL") return spdlog::level::critical;
    if (value == "OFF") return spdlog::level::off;
    return spdlog::level::info;
}

void init(const Config& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (config.log_filename) {
        const std::filesystem::path log_path(*config.log_filename);
        if (!log_path.parent_path().empty()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
        const auto max_size = static_cast<size_t>(config.log_max_size_mb) * 1024 * 1024;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path.string(), max_size, static_cast<size_t>(config.log_max_files)));
    }

    auto logger = std::make_shared<spdlog::logger>(config.log_name, sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%t] %v");
    spdlog::drop(config.log_name);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
    spdlog::set_level(parse_level(config.log_level));
    {
        std::lock_guard<std::mutex> lock(logger_name_mutex);
        logger_name = config.log_name;
    }
}

std::shared_ptr<spdlog::logger> get_logger() {
    std::string name;
    {
        std::lock_guard<std::mutex> lock(logger_name_mutex);
        name = logger_name;
    }
    if (auto logger = spdlog::get(name)) {
        return logger;
    }
    return spdlog::default_logger();
}

}
