// =================================================================
// src/CodePack/ProjectClassifier.cpp
// =================================================================
// Implementation for project type detection.

#include "CodePack/ProjectClassifier.hpp"
#include "CodePack/Logger.hpp"
#include <algorithm>

namespace CodePack {

namespace fs = std::filesystem;

const std::string ProjectClassifier::GENERIC_TYPE = "generic";

static bool hasFile(const fs::path& root, const char* name) {
    std::error_code ec;
    return fs::exists(root / name, ec);
}

static bool hasDirectory(const fs::path& root, const std::string& name) {
    std::error_code ec;
    return fs::is_directory(root / name, ec);
}

static bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

static bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

ProjectClassifier::ProjectClassifier(const std::vector<PluginDef>& plugins)
    : m_plugins(plugins) {}

Classification ProjectClassifier::classify(const std::string& root_path) const {
    Classification result;
    fs::path root(root_path);

    for (const auto& plugin : m_plugins) {
        if (pluginMatches(plugin, root)) {
            result.project_type = plugin.name;
            result.plugin_matched = true;
            result.plugin = plugin;
            LOG_DEBUG("ProjectClassifier", "Plugin matched: " + plugin.name);
            return result;
        }
    }

    result.project_type = detectBuiltinType(root);
    return result;
}

bool ProjectClassifier::pluginMatches(const PluginDef& plugin, const fs::path& root) {
    if (plugin.detect_files.empty() && plugin.detect_dirs.empty()) {
        return false;
    }

    std::error_code ec;
    for (const auto& file : plugin.detect_files) {
        if (!fs::exists(root / file, ec)) {
            return false;
        }
    }
    for (const auto& dir : plugin.detect_dirs) {
        if (!hasDirectory(root, dir)) {
            return false;
        }
    }
    return true;
}

std::string ProjectClassifier::detectBuiltinType(const fs::path& root) {
    if (hasFile(root, "build.gradle") || hasFile(root, "build.gradle.kts")) {
        return "Android / Gradle";
    }
    if (hasFile(root, "pubspec.yaml")) {
        return "Flutter / Dart";
    }
    if (hasFile(root, "Cargo.toml")) {
        return "Rust";
    }
    if (hasFile(root, "go.mod")) {
        return "Go";
    }
    if (hasFile(root, "pom.xml")) {
        return "Java / Maven";
    }
    if (hasFile(root, "Package.swift")) {
        return "Swift";
    }
    if (hasFile(root, "CMakeLists.txt")) {
        return "C++ / CMake";
    }

    // The immediate listing is needed for prefix markers and the C check
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(root, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    std::sort(names.begin(), names.end());

    auto anyPrefixed = [&names](const std::string& prefix) {
        return std::any_of(names.begin(), names.end(),
                           [&prefix](const std::string& name) { return startsWith(name, prefix); });
    };

    if (anyPrefixed("next.config")) {
        return "Next.js";
    }
    if (anyPrefixed("nuxt.config")) {
        return "Nuxt.js";
    }
    if (anyPrefixed("vite.config")) {
        return "Vite";
    }
    if (hasFile(root, "pyproject.toml") || hasFile(root, "requirements.txt") || hasFile(root, "setup.py")) {
        return "Python";
    }
    if (hasFile(root, "package.json")) {
        return "Node.js";
    }

    // Secondary markers only decide roots that no table entry above claims
    if (hasFile(root, "Makefile") || hasFile(root, "makefile")) {
        bool has_c_sources = std::any_of(names.begin(), names.end(), [](const std::string& name) {
            return endsWith(name, ".c") || endsWith(name, ".h");
        });
        if (has_c_sources) {
            return "C";
        }
    }
    if (hasFile(root, "Gemfile")) {
        return "Ruby";
    }
    if (hasFile(root, "docker-compose.yml") || hasFile(root, "docker-compose.yaml")) {
        return "Docker";
    }

    return GENERIC_TYPE;
}

} // namespace CodePack
