// =================================================================
// src/CodePack/ExclusionMatcher.cpp
// =================================================================
// Implementation for path-segment exclusion rules.

#include "CodePack/ExclusionMatcher.hpp"
#include "CodePack/Logger.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>

namespace CodePack {

static std::string toLower(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

static std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

ExclusionMatcher::ExclusionMatcher() {
    for (const auto& name : getBuiltinNames()) {
        addNormalizedRule(name, true);
    }
}

const std::vector<std::string>& ExclusionMatcher::getBuiltinNames() {
    static const std::vector<std::string> names = {
        "node_modules", "build", "dist", ".gradle", ".idea", ".vscode",
        "__pycache__", ".git", "target", ".next", "venv",
        ".svn", ".hg", ".nuxt", ".output", ".venv", ".dart_tool",
        ".pub-cache", "Pods", "DerivedData", ".cache", "coverage",
        ".turbo", ".tox", ".swiftpm"
    };
    return names;
}

bool ExclusionMatcher::addRule(const std::string& rule) {
    std::string working = trim(rule);
    if (working.empty() || working[0] == '#') {
        return false;
    }

    bool directory_only = false;
    if (working.back() == '/') {
        directory_only = true;
        working.pop_back();
    }

    // Rules name a single segment; a leading slash carries no meaning here
    while (!working.empty() && working.front() == '/') {
        working.erase(working.begin());
    }

    // Negations and multi-segment paths are common in .gitignore files
    if (working.empty() || working[0] == '!' || working.find('/') != std::string::npos) {
        LOG_DEBUG("ExclusionMatcher", "Ignoring rule that is not a single path segment", rule);
        return false;
    }

    addNormalizedRule(working, directory_only);
    return true;
}

void ExclusionMatcher::addDirectoryRules(const std::vector<std::string>& dir_names) {
    for (const auto& name : dir_names) {
        std::string working = trim(name);
        while (!working.empty() && working.back() == '/') {
            working.pop_back();
        }
        if (!working.empty()) {
            addNormalizedRule(working, true);
        }
    }
}

size_t ExclusionMatcher::loadFromFile(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return 0;
    }

    size_t loaded = 0;
    std::string line;
    while (std::getline(file, line)) {
        if (addRule(line)) {
            ++loaded;
        }
    }
    return loaded;
}

bool ExclusionMatcher::isExcluded(const std::string& name, bool is_directory) const {
    if (name.empty()) {
        return false;
    }

    std::string lower = toLower(name);
    for (const auto& rule : m_rules) {
        if (rule.directory_only && !is_directory) {
            continue;
        }
        if (rule.is_glob) {
            if (globMatch(rule.pattern, lower)) {
                return true;
            }
        } else if (rule.pattern == lower) {
            return true;
        }
    }
    return false;
}

bool ExclusionMatcher::globMatch(const std::string& pattern, const std::string& name) {
    std::string p = toLower(pattern);
    std::string n = toLower(name);

    size_t pi = 0;
    size_t ni = 0;
    size_t star_pi = std::string::npos;
    size_t star_ni = 0;

    while (ni < n.size()) {
        if (pi < p.size() && (p[pi] == '?' || p[pi] == n[ni])) {
            ++pi;
            ++ni;
        } else if (pi < p.size() && p[pi] == '*') {
            star_pi = pi++;
            star_ni = ni;
        } else if (star_pi != std::string::npos) {
            // Let the last star absorb one more character
            pi = star_pi + 1;
            ni = ++star_ni;
        } else {
            return false;
        }
    }

    while (pi < p.size() && p[pi] == '*') {
        ++pi;
    }
    return pi == p.size();
}

void ExclusionMatcher::addNormalizedRule(std::string pattern, bool directory_only) {
    pattern = toLower(pattern);
    bool is_glob = pattern.find_first_of("*?") != std::string::npos;

    for (const auto& existing : m_rules) {
        if (existing.pattern == pattern && existing.directory_only == directory_only) {
            return;
        }
    }
    m_rules.push_back(Rule{pattern, directory_only, is_glob});
}

} // namespace CodePack
