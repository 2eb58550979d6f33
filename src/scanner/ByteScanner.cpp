#include "scanner/ByteScanner.hpp"
#include <cstdint>
#include <fstream>
#include <string>
#include <stdexcept>
#include <system_error>
#include <spdlog/spdlog.h>

namespace yaml_repair {

namespace fs = std::filesystem;

bool ByteScanner::exists(const fs::path& path) {
    std::error_code ec;
    bool found = fs::exists(path, ec);
    if (ec) {
        spdlog::debug("exists({}) failed: {}", path.string(), ec.message());
        return false;
    }
    return found;
}

ByteContent ByteScanner::read_file(const fs::path& path) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        throw std::runtime_error(path.string() + " is a directory");
    }

    const uintmax_t expected = fs::file_size(path, ec);
    if (ec) {
        throw std::runtime_error("cannot stat " + path.string() + ": " + ec.message());
    }

    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open " + path.string() + " for reading");
    }

    ByteContent content(static_cast<size_t>(expected));
    if (expected == 0) return content;
    in.read(reinterpret_cast<char*>(content.data()), static_cast<std::streamsize>(expected));

    // A short read must never reach the overwrite step
    if (static_cast<uintmax_t>(in.gcount()) != expected) {
        throw std::runtime_error("short read for " + path.string() + ": got " +
                                 std::to_string(in.gcount()) + " of " + std::to_string(expected) + " bytes");
    }
    return content;
}

OffenseIndex ByteScanner::index_offenses(const ByteContent& bytes) {
    OffenseIndex index;
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (bytes[i] > 127) {
            index.add(bytes[i], i);
        }
    }
    return index;
}

size_t ByteScanner::count_offenses(const OffenseIndex& index) {
    size_t total = 0;
    for (const auto& entry : index) total += entry.second.size();
    return total;
}

}
