#include "RepairPipeline.hpp"
#include <exception>
#include <utility>
#include <spdlog/spdlog.h>
#include "repair/ByteRepairer.hpp"
#include "repair/Cp1252Verifier.hpp"
#include "scanner/ByteScanner.hpp"

namespace yaml_repair {

RepairPipeline::RepairPipeline(Reporter& reporter)
    : RepairPipeline(reporter,
                     ByteRepairer::overwrite_file,
                     [](const std::filesystem::path& path) { return Cp1252Verifier::verify_file(path); }) {}

RepairPipeline::RepairPipeline(Reporter& reporter, WriteStep write, VerifyStep verify)
    : reporter_(reporter), write_(std::move(write)), verify_(std::move(verify)) {}

FileReport RepairPipeline::process_file(const std::filesystem::path& path) {
    FileReport report;
    report.path = path.string();

    reporter_.checking(report.path);

    if (!ByteScanner::exists(path)) {
        report.outcome = Outcome::NOT_FOUND;
        reporter_.not_found(report.path);
        return report;
    }

    try {
        const ByteContent content = ByteScanner::read_file(path);
        report.original_size = content.size();
        report.repaired_size = content.size();
        reporter_.file_size(content.size());

        report.offenses = ByteScanner::index_offenses(content);
        if (report.offenses.empty()) {
            report.outcome = Outcome::CLEAN;
            reporter_.clean(report.path);
            return report;
        }
        reporter_.offenses(report.offenses);

        const ByteContent repaired = ByteRepairer::strip_non_ascii(content);
        write_(path, repaired);
        report.repaired_size = repaired.size();
        reporter_.repaired(report.path, report.original_size, report.repaired_size);

        VerifyResult verdict = verify_(path);
        reporter_.verification(verdict);
        if (verdict.ok) {
            report.outcome = Outcome::REPAIRED;
        } else {
            report.outcome = Outcome::REPAIRED_UNVERIFIED;
            report.detail = verdict.message;
        }
    } catch (const std::exception& e) {
        report.outcome = Outcome::PROCESSING_ERROR;
        report.detail = e.what();
        reporter_.processing_error(report.path, report.detail);
    }
    return report;
}

RunSummary RepairPipeline::run_batch(const std::vector<std::filesystem::path>& paths) {
    RunSummary summary;
    reporter_.start(paths.size());

    for (const auto& path : paths) {
        FileReport report = process_file(path);
        spdlog::debug("{} -> {}", report.path, outcome_name(report.outcome));
        summary.record(std::move(report));
    }

    reporter_.summary(summary);
    return summary;
}

int exit_status(const RunSummary& summary, const RunConfig& config) {
    if (config.fail_on_errors && summary.errors() > 0) return 1;
    return 0;
}

}
