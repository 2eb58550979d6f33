#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace yaml_repair {

struct RunConfig {
    std::string log_level = "info";
    bool fail_on_errors = false;     // Exit 1 when any file errored

    static RunConfig from_json(const nlohmann::json& j) {
        RunConfig c;
        c.log_level = j.value("log_level", "info");
        c.fail_on_errors = j.value("fail_on_errors", false);
        return c;
    }

    nlohmann::json to_json() const {
        return {
            {"log_level", log_level},
            {"fail_on_errors", fail_on_errors}
        };
    }
};

class ConfigLoader {
public:
    static const std::vector<std::string>& default_search_paths();

    // True only for names spdlog maps to a level ("off" itself included)
    static bool is_known_log_level(const std::string& name);

    // First readable file wins. Missing file -> defaults; malformed file -> logged, defaults.
    // An unknown log_level is logged and replaced by "info".
    static RunConfig load(const std::vector<std::string>& search_paths = default_search_paths());
};

}
