#pragma once
#include <filesystem>
#include <string>
#include "RepairTypes.hpp"

namespace yaml_repair {

class ByteScanner {
public:
    // Non-throwing; checked before any read is attempted
    static bool exists(const std::filesystem::path& path);

    // Whole file as raw bytes. Throws std::runtime_error if it cannot be opened or read.
    static ByteContent read_file(const std::filesystem::path& path);

    // Offsets of every byte > 127, grouped by value. Empty means the content is clean.
    static OffenseIndex index_offenses(const ByteContent& bytes);

    static size_t count_offenses(const OffenseIndex& index);
};

}
