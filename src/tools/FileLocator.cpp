#include "tools/FileLocator.hpp"
#include <algorithm>
#include <fnmatch.h>
#include <system_error>
#include <utility>
#include <spdlog/spdlog.h>

namespace yaml_repair {

namespace fs = std::filesystem;

const std::vector<std::string>& FileLocator::default_patterns() {
    static const std::vector<std::string> patterns = {
        ".github/workflows/*.yml",
        ".github/dependabot.yml",
        ".pre-commit-config.yaml",
        ".yamllint",
    };
    return patterns;
}

bool FileLocator::has_wildcard(const std::string& component) {
    return component.find_first_of("*?[") != std::string::npos;
}

// Splits on '/' and drops empty and "." components
static std::vector<std::string> split_pattern(const std::string& pattern) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : pattern) {
        if (c == '/') {
            if (!current.empty() && current != ".") parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty() && current != ".") parts.push_back(current);
    return parts;
}

std::vector<fs::path> FileLocator::expand(const fs::path& root, const std::string& pattern) {
    const fs::path base = root.empty() ? fs::path(".") : root;

    // Candidates are kept relative so the caller sees `root/rel` or bare `rel`
    std::vector<fs::path> frontier = {fs::path()};
    for (const auto& component : split_pattern(pattern)) {
        std::vector<fs::path> next;
        for (const auto& rel : frontier) {
            if (!has_wildcard(component)) {
                next.push_back(rel / component);
                continue;
            }

            std::error_code ec;
            fs::directory_iterator it(base / rel, ec);
            if (ec) {
                spdlog::debug("Skipping {}: {}", (base / rel).string(), ec.message());
                continue;
            }

            std::vector<std::string> names;
            for (; it != fs::directory_iterator(); it.increment(ec)) {
                if (ec) break;
                names.push_back(it->path().filename().string());
            }
            std::sort(names.begin(), names.end());

            for (const auto& name : names) {
                if (fnmatch(component.c_str(), name.c_str(), FNM_PERIOD) == 0) {
                    next.push_back(rel / name);
                }
            }
        }
        frontier = std::move(next);
        if (frontier.empty()) break;
    }

    std::vector<fs::path> matches;
    for (const auto& rel : frontier) {
        if (rel.empty()) continue;
        std::error_code ec;
        // symlink_status so a dangling link still counts as present
        if (!fs::exists(fs::symlink_status(base / rel, ec))) continue;
        matches.push_back(root.empty() ? rel : root / rel);
    }
    return matches;
}

std::vector<fs::path> FileLocator::locate(const fs::path& root, const std::vector<std::string>& patterns) {
    std::vector<fs::path> all;
    for (const auto& pattern : patterns) {
        auto found = FileLocator::expand(root, pattern);
        spdlog::debug("Pattern '{}' matched {} file(s)", pattern, found.size());
        all.insert(all.end(), found.begin(), found.end());
    }
    return all;
}

}
