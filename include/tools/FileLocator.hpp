#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace yaml_repair {

class FileLocator {
public:
    // Workflow files, dependabot, pre-commit and yamllint configs
    static const std::vector<std::string>& default_patterns();

    static bool has_wildcard(const std::string& component);

    // Glob one pattern under `root` (empty root = working directory).
    // Wildcards never match a leading '.', matches come back sorted per directory.
    static std::vector<std::filesystem::path> expand(const std::filesystem::path& root, const std::string& pattern);

    // All patterns in order. Overlapping matches are not deduplicated.
    static std::vector<std::filesystem::path> locate(const std::filesystem::path& root,
                                                     const std::vector<std::string>& patterns = default_patterns());
};

}
