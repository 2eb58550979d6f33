#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include "RepairTypes.hpp"

namespace yaml_repair {

struct VerifyResult {
    bool ok = true;
    size_t offset = 0;    // Position of the first undecodable byte
    uint8_t byte = 0;
    std::string message;
};

// Windows-1252 decode oracle. A passing check is a heuristic that the repair
// was enough for yamllint, not a proof for every consumer.
class Cp1252Verifier {
public:
    static constexpr size_t DEFAULT_PREFIX = 1000;

    // 0x81, 0x8D, 0x8F, 0x90 and 0x9D have no cp1252 mapping
    static bool is_decodable(uint8_t b);

    static VerifyResult verify_bytes(const ByteContent& bytes, size_t limit = DEFAULT_PREFIX);

    // Reads at most `limit` bytes. Throws std::runtime_error if the file cannot be opened.
    static VerifyResult verify_file(const std::filesystem::path& path, size_t limit = DEFAULT_PREFIX);
};

}
