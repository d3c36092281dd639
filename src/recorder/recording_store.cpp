#include "honeybee/recorder/recording_store.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <system_error>

#include "honeybee/logging.hpp"

namespace honeybee::recorder {

namespace {

bool has_wav_extension(const std::filesystem::path& path) {
    auto extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return extension == RecordingStore::kFileExtension;
}

uint64_t to_unix_seconds(std::filesystem::file_time_type time) {
    const auto system_time = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        time - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        system_time.time_since_epoch()).count();
    return seconds > 0 ? static_cast<uint64_t>(seconds) : 0;
}

std::tm local_now() {
    const auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_value{};
#if defined(_WIN32)
    localtime_s(&tm_value, &time_t);
#else
    localtime_r(&time_t, &tm_value);
#endif
    return tm_value;
}

bool is_within(const std::filesystem::path& base, const std::filesystem::path& target) {
    const auto relative = target.lexically_relative(base);
    if (relative.empty()) {
        return false;
    }
    const auto first = *relative.begin();
    return first != ".." && first != ".";
}

}

RecordingStore::RecordingStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

const std::filesystem::path& RecordingStore::directory() const {
    return directory_;
}

std::string RecordingStore::make_filename(const std::tm& local_time) {
    std::ostringstream stream;
    stream << kFilePrefix << std::put_time(&local_time, "%Y%m%d_%H%M%S") << kFileExtension;
    return stream.str();
}

void RecordingStore::ensure_directory() const {
    std::error_code ec;
    if (std::filesystem::is_directory(directory_, ec)) {
        return;
    }
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw std::runtime_error("Failed to create recordings directory: " + ec.message());
    }
}

RecordingStore::SavedFile RecordingStore::save(const std::string& bytes) const {
    return save(bytes, local_now());
}

RecordingStore::SavedFile RecordingStore::save(const std::string& bytes,
                                               const std::tm& local_time) const {
    ensure_directory();
    const auto filename = make_filename(local_time);
    const auto path = directory_ / filename;

    std::ofstream stream(path, std::ios::binary | std::ios::trunc);
    if (!stream.is_open()) {
        throw std::runtime_error("Failed to write WAV file: cannot open " + path.string());
    }
    stream.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    stream.close();
    if (!stream) {
        throw std::runtime_error("Failed to write WAV file: write error on " + path.string());
    }
    logging::info("Recording written",
                  {kv("path", path.string()), kv("bytes", bytes.size())});
    return {path.string(), filename};
}

std::vector<RecordingInfo> RecordingStore::list() const {
    std::vector<RecordingInfo> recordings;
    std::error_code ec;
    if (!std::filesystem::is_directory(directory_, ec)) {
        return recordings;
    }
    std::filesystem::directory_iterator it(directory_, ec);
    if (ec) {
        throw std::runtime_error("Failed to read directory: " + ec.message());
    }
    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || !has_wav_extension(entry.path())) {
            continue;
        }
        const auto size = entry.file_size(entry_ec);
        if (entry_ec) {
            continue;
        }
        const auto write_time = entry.last_write_time(entry_ec);
        RecordingInfo info;
        info.filename = entry.path().filename().string();
        info.path = entry.path().string();
        info.size = static_cast<uint64_t>(size);
        info.modified = entry_ec ? 0 : to_unix_seconds(write_time);
        recordings.push_back(std::move(info));
    }
    std::sort(recordings.begin(), recordings.end(),
              [](const RecordingInfo& lhs, const RecordingInfo& rhs) {
                  if (lhs.modified != rhs.modified) {
                      return lhs.modified > rhs.modified;
                  }
                  return lhs.filename > rhs.filename;
              });
    return recordings;
}

std::filesystem::path RecordingStore::resolve(const std::string& name) const {
    if (name.empty()) {
        throw RecordingAccessError("Recording name is empty");
    }
    std::filesystem::path target(name);
    if (target.is_relative()) {
        target = directory_ / target;
    }
    const auto base = std::filesystem::weakly_canonical(directory_);
    target = std::filesystem::weakly_canonical(target);
    if (!is_within(base, target)) {
        throw RecordingAccessError("Cannot access files outside recordings directory");
    }
    return target;
}

std::string RecordingStore::read(const std::string& name) const {
    const auto path = resolve(name);
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        throw RecordingNotFoundError("Failed to read audio: " + path.string());
    }
    return std::string(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
}

void RecordingStore::remove(const std::string& name) const {
    const auto path = resolve(name);
    std::error_code ec;
    if (!std::filesystem::remove(path, ec)) {
        if (ec) {
            throw std::runtime_error("Failed to delete recording: " + ec.message());
        }
        throw RecordingNotFoundError("Failed to delete recording: " + path.string() +
                                     " does not exist");
    }
    logging::info("Recording deleted", {kv("path", path.string())});
}

}
