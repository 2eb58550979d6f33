#include <spdlog/spdlog.h>
#include <filesystem>
#include <vector>

#include "RunConfig.hpp"
#include "RepairPipeline.hpp"
#include "report/Reporter.hpp"
#include "tools/FileLocator.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    if (argc > 1) {
        spdlog::warn("⚠️ {} takes no arguments; ignoring {} given.", argv[0], argc - 1);
    }

    yaml_repair::RunConfig config = yaml_repair::ConfigLoader::load();
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    std::vector<fs::path> files = yaml_repair::FileLocator::locate(fs::path());

    yaml_repair::Reporter reporter;
    yaml_repair::RepairPipeline pipeline(reporter);
    yaml_repair::RunSummary summary = pipeline.run_batch(files);

    spdlog::debug("📦 Run summary: {}", summary.to_json().dump());
    return yaml_repair::exit_status(summary, config);
}
