#include "RunConfig.hpp"
#include <fstream>
#include <spdlog/spdlog.h>

namespace yaml_repair {

const std::vector<std::string>& ConfigLoader::default_search_paths() {
    static const std::vector<std::string> paths = {
        "yaml_repair.json", "config/yaml_repair.json", ".github/yaml_repair.json"
    };
    return paths;
}

bool ConfigLoader::is_known_log_level(const std::string& name) {
    if (name == "off") return true;
    return spdlog::level::from_str(name) != spdlog::level::off;
}

RunConfig ConfigLoader::load(const std::vector<std::string>& search_paths) {
    std::ifstream f;
    std::string used_path;
    for (const auto& path : search_paths) {
        f.open(path);
        if (f.is_open()) {
            used_path = path;
            break;
        }
        f.clear();
    }

    if (!f.is_open()) {
        spdlog::debug("No yaml_repair.json found, using defaults.");
        return RunConfig{};
    }

    try {
        auto j = nlohmann::json::parse(f);
        RunConfig config = RunConfig::from_json(j);
        if (!is_known_log_level(config.log_level)) {
            spdlog::warn("⚠️ Unknown log_level '{}' in {}, using info.", config.log_level, used_path);
            config.log_level = "info";
        }
        spdlog::debug("⚙️ Loaded config from {}: {}", used_path, config.to_json().dump());
        return config;
    } catch (const std::exception& e) {
        spdlog::error("💥 Failed to parse {}: {}", used_path, e.what());
        return RunConfig{};
    }
}

}
