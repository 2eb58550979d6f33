/**
 * @file test_helpers.h
 * @brief Shared helpers for yaml_repair unit tests
 *
 * Scratch directories, raw byte fixtures and a capturing spdlog logger.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>
#include "RepairTypes.hpp"

namespace test_helpers {

namespace fs = std::filesystem;

/// Unique temp directory, removed on destruction
class ScratchDir {
public:
    ScratchDir() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() /
                ("yaml_repair_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        fs::create_directories(path_);
    }

    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const fs::path& path() const { return path_; }

    fs::path operator/(const std::string& rel) const { return path_ / rel; }

private:
    fs::path path_;
};

inline void write_bytes(const fs::path& path, const yaml_repair::ByteContent& bytes) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

inline void write_text(const fs::path& path, const std::string& text) {
    write_bytes(path, yaml_repair::ByteContent(text.begin(), text.end()));
}

inline yaml_repair::ByteContent read_bytes(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return yaml_repair::ByteContent((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

/// Logger whose output lands in a string stream, message text only
struct CapturedLog {
    std::shared_ptr<std::ostringstream> stream = std::make_shared<std::ostringstream>();
    std::shared_ptr<spdlog::logger> logger;

    CapturedLog() {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(*stream);
        logger = std::make_shared<spdlog::logger>("capture", sink);
        logger->set_pattern("%v");
        logger->set_level(spdlog::level::trace);
    }

    std::string text() const { return stream->str(); }

    bool contains(const std::string& needle) const {
        return text().find(needle) != std::string::npos;
    }
};

} // namespace test_helpers
