#pragma once
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>
#include "RepairTypes.hpp"

namespace yaml_repair {

class ByteRepairer {
public:
    // Drops every byte > 127. Nothing is replaced or re-encoded; order is kept.
    static ByteContent strip_non_ascii(const ByteContent& bytes) {
        ByteContent out;
        out.reserve(bytes.size());
        for (uint8_t b : bytes) {
            if (b <= 127) out.push_back(b);
        }
        return out;
    }

    // Truncates and rewrites the file in place. The previous content is gone after this.
    static void overwrite_file(const std::filesystem::path& path, const ByteContent& bytes) {
        std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("cannot open " + path.string() + " for writing");
        }

        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            throw std::runtime_error("write failed for " + path.string());
        }
        spdlog::debug("💾 Wrote {} bytes to {}", bytes.size(), path.string());
    }
};

}
