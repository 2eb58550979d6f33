#include "report/Reporter.hpp"
#include <algorithm>
#include <utility>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

namespace yaml_repair {

Reporter::Reporter(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}

std::string Reporter::describe_byte(uint8_t value) {
    if (value >= 32 && value <= 126) return std::string(1, static_cast<char>(value));
    return "non-printable";
}

std::string Reporter::format_positions(const std::vector<size_t>& positions) {
    size_t shown = std::min(positions.size(), POSITION_PREVIEW);
    std::vector<size_t> preview(positions.begin(), positions.begin() + shown);
    std::string out = fmt::format("[{}]", fmt::join(preview, ", "));
    if (positions.size() > POSITION_PREVIEW) out += "...";
    return out;
}

std::string Reporter::format_offense_line(uint8_t value, const std::vector<size_t>& positions) {
    return fmt::format("  0x{:02x} ({}): {} instances at positions {}",
                       static_cast<unsigned>(value), describe_byte(value),
                       positions.size(), format_positions(positions));
}

void Reporter::start(size_t file_count) {
    logger_->info("Found {} YAML files to check", file_count);
}

void Reporter::checking(const std::string& path) {
    logger_->info("Checking file: {}", path);
}

void Reporter::not_found(const std::string& path) {
    logger_->warn("File not found: {}", path);
}

void Reporter::file_size(size_t bytes) {
    logger_->info("File size: {} bytes", bytes);
}

void Reporter::clean(const std::string& path) {
    logger_->info("No non-ASCII bytes found in {}", path);
}

void Reporter::offenses(const OffenseIndex& index) {
    logger_->info("Found problematic bytes:");
    for (const auto& [value, positions] : index) {
        logger_->info(format_offense_line(value, positions));
    }
}

void Reporter::repaired(const std::string& path, size_t original_size, size_t repaired_size) {
    logger_->info("New size: {} bytes", repaired_size);
    logger_->info("Removed {} bytes", original_size - repaired_size);
    logger_->info("Fixed {}", path);
}

void Reporter::verification(const VerifyResult& result) {
    if (result.ok) {
        logger_->info("✓ File can now be read with cp1252 encoding");
    } else {
        logger_->warn("✗ Still has cp1252 issues: {}", result.message);
    }
}

void Reporter::processing_error(const std::string& path, const std::string& cause) {
    logger_->error("Error processing {}: {}", path, cause);
}

void Reporter::summary(const RunSummary& summary) {
    logger_->info("");
    logger_->info("Results:");
    logger_->info("✓ Successfully processed: {} files", summary.processed());
    logger_->info("✗ Errors: {} files", summary.errors());

    if (summary.errors() == 0) {
        logger_->info("🎉 All YAML files should now be readable by yamllint!");
    } else {
        logger_->warn("⚠️  {} files still have issues.", summary.errors());
    }
}

}
