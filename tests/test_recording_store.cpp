#include <catch2/catch_test_macros.hpp>

#include "honeybee/recorder/recording_store.hpp"
#include "test_support.hpp"

#include <ctime>
#include <fstream>
#include <string>

using honeybee::recorder::RecordingAccessError;
using honeybee::recorder::RecordingNotFoundError;
using honeybee::recorder::RecordingStore;
using honeybee::test::TempDir;

namespace {

std::tm make_tm(int year, int month, int day, int hour, int minute, int second) {
    std::tm value{};
    value.tm_year = year - 1900;
    value.tm_mon = month - 1;
    value.tm_mday = day;
    value.tm_hour = hour;
    value.tm_min = minute;
    value.tm_sec = second;
    return value;
}

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream stream(path, std::ios::binary);
    stream << content;
}

}

TEST_CASE("filenames carry the prefix, a second-granularity timestamp and .wav") {
    const auto name = RecordingStore::make_filename(make_tm(2024, 3, 7, 9, 5, 2));
    REQUIRE(name == "REC_20240307_090502.wav");
}

TEST_CASE("save creates the directory and writes the bytes") {
    TempDir temp;
    const auto dir = temp.path() / "nested" / "recordings";
    RecordingStore store(dir);

    const auto saved = store.save("RIFFdata", make_tm(2023, 12, 31, 23, 59, 59));
    REQUIRE(saved.filename == "REC_20231231_235959.wav");
    REQUIRE(saved.path == (dir / saved.filename).string());
    REQUIRE(std::filesystem::is_directory(dir));
    REQUIRE(store.read(saved.filename) == "RIFFdata");
}

TEST_CASE("saves within the same second overwrite each other") {
    TempDir temp;
    RecordingStore store(temp.path());
    const auto when = make_tm(2024, 1, 1, 0, 0, 0);
    const auto first = store.save("first", when);
    const auto second = store.save("second", when);
    REQUIRE(first.path == second.path);
    REQUIRE(store.read(first.filename) == "second");
}

TEST_CASE("save reports a directory that cannot be created") {
    TempDir temp;
    write_file(temp.path() / "blocker", "not a directory");
    RecordingStore store(temp.path() / "blocker" / "recordings");
    try {
        store.save("bytes");
        FAIL("save should have thrown");
    } catch (const std::runtime_error& ex) {
        REQUIRE(std::string(ex.what()).rfind("Failed to create recordings directory", 0) == 0);
    }
}

TEST_CASE("list returns wav files only, newest first") {
    TempDir temp;
    RecordingStore store(temp.path());
    write_file(temp.path() / "REC_old.wav", "aa");
    write_file(temp.path() / "REC_new.WAV", "bbbb");
    write_file(temp.path() / "notes.txt", "ignored");
    std::filesystem::create_directories(temp.path() / "folder.wav");

    const auto now = std::filesystem::file_time_type::clock::now();
    std::filesystem::last_write_time(temp.path() / "REC_old.wav", now - std::chrono::hours(2));
    std::filesystem::last_write_time(temp.path() / "REC_new.WAV", now - std::chrono::hours(1));

    const auto recordings = store.list();
    REQUIRE(recordings.size() == 2);
    REQUIRE(recordings[0].filename == "REC_new.WAV");
    REQUIRE(recordings[0].size == 4);
    REQUIRE(recordings[1].filename == "REC_old.wav");
    REQUIRE(recordings[1].size == 2);
    REQUIRE(recordings[0].modified > recordings[1].modified);
}

TEST_CASE("list of a missing directory is empty") {
    TempDir temp;
    RecordingStore store(temp.path() / "absent");
    REQUIRE(store.list().empty());
}

TEST_CASE("remove deletes a recording inside the directory") {
    TempDir temp;
    RecordingStore store(temp.path());
    const auto saved = store.save("bytes");
    store.remove(saved.path);
    REQUIRE_FALSE(std::filesystem::exists(saved.path));
    REQUIRE_THROWS_AS(store.remove(saved.filename), RecordingNotFoundError);
}

TEST_CASE("paths outside the recordings directory are rejected") {
    TempDir temp;
    const auto dir = temp.path() / "recordings";
    std::filesystem::create_directories(dir);
    write_file(temp.path() / "secret.wav", "keep");
    RecordingStore store(dir);

    REQUIRE_THROWS_AS(store.remove("../secret.wav"), RecordingAccessError);
    REQUIRE_THROWS_AS(store.remove((temp.path() / "secret.wav").string()), RecordingAccessError);
    REQUIRE_THROWS_AS(store.read("../secret.wav"), RecordingAccessError);
    REQUIRE_THROWS_AS(store.read(""), RecordingAccessError);
    REQUIRE(std::filesystem::exists(temp.path() / "secret.wav"));
}

TEST_CASE("reading a missing recording reports not found") {
    TempDir temp;
    RecordingStore store(temp.path());
    REQUIRE_THROWS_AS(store.read("REC_missing.wav"), RecordingNotFoundError);
}
