#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace yaml_repair {

// Exact on-disk bytes of a file
using ByteContent = std::vector<uint8_t>;

// Non-ASCII byte value -> ascending offsets where it occurs.
// Values iterate in the order they were first seen in the file.
class OffenseIndex {
public:
    using Entry = std::pair<uint8_t, std::vector<size_t>>;

    void add(uint8_t value, size_t offset) {
        int& slot = slots_[value];
        if (slot < 0) {
            slot = static_cast<int>(entries_.size());
            entries_.push_back({value, {}});
        }
        entries_[static_cast<size_t>(slot)].second.push_back(offset);
    }

    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }
    size_t count(uint8_t value) const { return slots_[value] < 0 ? 0 : 1; }

    // Throws std::out_of_range for a value that never occurred
    const std::vector<size_t>& at(uint8_t value) const {
        if (slots_[value] < 0) throw std::out_of_range("byte value not in offense index");
        return entries_[static_cast<size_t>(slots_[value])].second;
    }

    std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
    std::vector<Entry>::const_iterator end() const { return entries_.end(); }

private:
    std::vector<Entry> entries_;
    std::array<int, 256> slots_ = make_empty_slots();

    static std::array<int, 256> make_empty_slots() {
        std::array<int, 256> s{};
        s.fill(-1);
        return s;
    }
};

enum class Outcome {
    CLEAN,               // No byte > 127, file untouched
    REPAIRED,            // Bytes stripped, written, cp1252 check passed
    REPAIRED_UNVERIFIED, // Written, but cp1252 check failed
    NOT_FOUND,           // Path missing at scan time
    PROCESSING_ERROR,    // I/O failure while reading or writing
};

constexpr size_t OUTCOME_COUNT = 5;

inline std::string outcome_name(Outcome o) {
    switch(o) {
        case Outcome::CLEAN: return "CLEAN";
        case Outcome::REPAIRED: return "REPAIRED";
        case Outcome::REPAIRED_UNVERIFIED: return "REPAIRED_UNVERIFIED";
        case Outcome::NOT_FOUND: return "NOT_FOUND";
        case Outcome::PROCESSING_ERROR: return "PROCESSING_ERROR";
    }
    return "UNKNOWN";
}

// Unverified repairs still count as processed; only a missing file or an I/O failure is an error.
inline bool counts_as_error(Outcome o) {
    return o == Outcome::NOT_FOUND || o == Outcome::PROCESSING_ERROR;
}

struct FileReport {
    std::string path;
    Outcome outcome = Outcome::PROCESSING_ERROR;
    size_t original_size = 0;
    size_t repaired_size = 0;
    OffenseIndex offenses;
    std::string detail; // Exception text or decode error

    size_t bytes_removed() const { return original_size - repaired_size; }

    nlohmann::json to_json() const {
        nlohmann::json offense_json = nlohmann::json::object();
        for (const auto& [value, positions] : offenses) {
            offense_json[std::to_string(value)] = positions;
        }
        return {
            {"path", path},
            {"outcome", outcome_name(outcome)},
            {"original_size", original_size},
            {"repaired_size", repaired_size},
            {"offenses", offense_json},
            {"detail", detail}
        };
    }
};

// Accumulator threaded through one batch run
class RunSummary {
public:
    void record(FileReport report) {
        counts_[static_cast<size_t>(report.outcome)]++;
        reports_.push_back(std::move(report));
    }

    size_t count(Outcome o) const { return counts_[static_cast<size_t>(o)]; }

    size_t processed() const {
        return count(Outcome::CLEAN) + count(Outcome::REPAIRED) + count(Outcome::REPAIRED_UNVERIFIED);
    }

    size_t errors() const {
        return count(Outcome::NOT_FOUND) + count(Outcome::PROCESSING_ERROR);
    }

    size_t total() const { return reports_.size(); }

    const std::vector<FileReport>& reports() const { return reports_; }

    nlohmann::json to_json() const {
        nlohmann::json files = nlohmann::json::array();
        for (const auto& r : reports_) files.push_back(r.to_json());
        return {
            {"processed", processed()},
            {"errors", errors()},
            {"files", files}
        };
    }

private:
    std::array<size_t, OUTCOME_COUNT> counts_{};
    std::vector<FileReport> reports_;
};

}
