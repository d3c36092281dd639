#pragma once

#include <ctime>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "honeybee/recorder/types.hpp"

namespace honeybee {
namespace recorder {

// A name that resolves outside the recordings directory.
class RecordingAccessError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class RecordingNotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Owns the recordings directory: naming and writing new WAV files, and the
// list/read/delete operations of the recordings library.
class RecordingStore {
public:
    struct SavedFile {
        std::string path;
        std::string filename;
    };

    static constexpr const char* kFilePrefix = "REC_";
    static constexpr const char* kFileExtension = ".wav";

    explicit RecordingStore(std::filesystem::path directory);

    const std::filesystem::path& directory() const;

    // REC_YYYYMMDD_HHMMSS.wav; two saves within one second share a name.
    static std::string make_filename(const std::tm& local_time);

    SavedFile save(const std::string& bytes) const;
    SavedFile save(const std::string& bytes, const std::tm& local_time) const;

    std::vector<RecordingInfo> list() const;
    std::string read(const std::string& name) const;
    void remove(const std::string& name) const;

private:
    std::filesystem::path resolve(const std::string& name) const;
    void ensure_directory() const;

    std::filesystem::path directory_;
};

}
}
