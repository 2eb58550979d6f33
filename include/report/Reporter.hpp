#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "RepairTypes.hpp"
#include "repair/Cp1252Verifier.hpp"

namespace yaml_repair {

// Console side of a run. Writes through one spdlog logger and never
// influences outcomes.
class Reporter {
public:
    static constexpr size_t POSITION_PREVIEW = 5;

    explicit Reporter(std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    // The character itself for 32..126, otherwise "non-printable"
    static std::string describe_byte(uint8_t value);

    // "[a, b, c, d, e]" plus "..." when there are more than five
    static std::string format_positions(const std::vector<size_t>& positions);

    static std::string format_offense_line(uint8_t value, const std::vector<size_t>& positions);

    void start(size_t file_count);
    void checking(const std::string& path);
    void not_found(const std::string& path);
    void file_size(size_t bytes);
    void clean(const std::string& path);
    void offenses(const OffenseIndex& index);
    void repaired(const std::string& path, size_t original_size, size_t repaired_size);
    void verification(const VerifyResult& result);
    void processing_error(const std::string& path, const std::string& cause);
    void summary(const RunSummary& summary);

private:
    std::shared_ptr<spdlog::logger> logger_;
};

}
