#pragma once
#include <filesystem>
#include <functional>
#include <vector>
#include "RepairTypes.hpp"
#include "RunConfig.hpp"
#include "repair/Cp1252Verifier.hpp"
#include "report/Reporter.hpp"

namespace yaml_repair {

class RepairPipeline {
public:
    // Write and verify steps; throwing from either ends the file as PROCESSING_ERROR
    using WriteStep = std::function<void(const std::filesystem::path&, const ByteContent&)>;
    using VerifyStep = std::function<VerifyResult(const std::filesystem::path&)>;

    explicit RepairPipeline(Reporter& reporter);
    RepairPipeline(Reporter& reporter, WriteStep write, VerifyStep verify);

    // Start -> NOT_FOUND | scan -> CLEAN | strip + write + verify -> REPAIRED / REPAIRED_UNVERIFIED.
    // Any exception after the existence check becomes PROCESSING_ERROR.
    FileReport process_file(const std::filesystem::path& path);

    // Sequential; one report per path, returned through the summary
    RunSummary run_batch(const std::vector<std::filesystem::path>& paths);

private:
    Reporter& reporter_;
    WriteStep write_;
    VerifyStep verify_;
};

// 0 unless fail_on_errors is set and something errored
int exit_status(const RunSummary& summary, const RunConfig& config);

}
