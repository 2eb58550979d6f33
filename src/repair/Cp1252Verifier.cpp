#include "repair/Cp1252Verifier.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace yaml_repair {

bool Cp1252Verifier::is_decodable(uint8_t b) {
    switch (b) {
        case 0x81:
        case 0x8D:
        case 0x8F:
        case 0x90:
        case 0x9D:
            return false;
        default:
            return true;
    }
}

VerifyResult Cp1252Verifier::verify_bytes(const ByteContent& bytes, size_t limit) {
    VerifyResult result;
    size_t end = std::min(bytes.size(), limit);
    for (size_t i = 0; i < end; ++i) {
        if (!is_decodable(bytes[i])) {
            result.ok = false;
            result.offset = i;
            result.byte = bytes[i];
            result.message = fmt::format(
                "cp1252 cannot decode byte 0x{:02x} in position {}: character maps to <undefined>",
                static_cast<unsigned>(bytes[i]), i);
            return result;
        }
    }
    return result;
}

VerifyResult Cp1252Verifier::verify_file(const std::filesystem::path& path, size_t limit) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open " + path.string() + " for verification");
    }

    ByteContent prefix(limit);
    in.read(reinterpret_cast<char*>(prefix.data()), static_cast<std::streamsize>(limit));
    if (in.bad()) {
        throw std::runtime_error("read failed for " + path.string() + " during verification");
    }
    prefix.resize(static_cast<size_t>(in.gcount()));
    return verify_bytes(prefix, limit);
}

}
