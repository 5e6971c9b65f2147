// =================================================================
// src/CodePack/ConfigStore.cpp
// =================================================================
// Implementation for the app-wide JSON store.

#include "CodePack/ConfigStore.hpp"
#include "CodePack/SysInteraction.hpp"
#include "CodePack/Logger.hpp"
#include "nlohmann/json.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace CodePack {

using json = nlohmann::json;

static std::vector<std::string> stringList(const json& value) {
    std::vector<std::string> out;
    if (!value.is_array()) {
        return out;
    }
    for (const auto& item : value) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

static long long timestampValue(const std::string& timestamp) {
    try {
        return std::stoll(timestamp);
    } catch (const std::exception&) {
        return 0;
    }
}

ConfigStore::ConfigStore(const std::string& config_path)
    : m_config_path(config_path) {}

bool ConfigStore::load() {
    m_projects.clear();

    SysInteraction sys;
    if (!sys.fileExists(m_config_path)) {
        LOG_DEBUG("ConfigStore", "No config file yet at " + m_config_path);
        return true;
    }

    std::string text;
    try {
        text = sys.readFile(m_config_path);
    } catch (const std::exception& e) {
        LOG_WARNING("ConfigStore", "Cannot read config file", e.what());
        return false;
    }

    std::string error;
    if (!deserialize(text, error)) {
        LOG_WARNING("ConfigStore", "Ignoring malformed config file " + m_config_path, error);
        m_projects.clear();
        return false;
    }
    return true;
}

bool ConfigStore::save() {
    SysInteraction sys;
    if (!sys.writeFileAtomic(m_config_path, serialize())) {
        LOG_ERROR("ConfigStore", "Failed to save config", m_config_path);
        return false;
    }
    return true;
}

bool ConfigStore::loadProject(const std::string& project_path, ProjectConfig& config) const {
    auto it = m_projects.find(project_path);
    if (it == m_projects.end()) {
        return false;
    }
    config = it->second;
    return true;
}

bool ConfigStore::saveSelection(const std::string& project_path, const std::vector<std::string>& checked_paths) {
    ProjectConfig& config = entryFor(project_path);
    config.checked_paths = checked_paths;
    config.last_opened = currentTimestamp();
    return save();
}

bool ConfigStore::savePreset(const std::string& project_path, const std::string& name,
                             const std::vector<std::string>& paths) {
    if (name.empty()) {
        throw std::invalid_argument("Preset name must not be empty");
    }
    entryFor(project_path).presets[name] = paths;
    LOG_INFO("ConfigStore", "Saved preset '" + name + "' with " + std::to_string(paths.size()) + " files");
    return save();
}

bool ConfigStore::deletePreset(const std::string& project_path, const std::string& name) {
    auto it = m_projects.find(project_path);
    if (it == m_projects.end() || it->second.presets.erase(name) == 0) {
        return false;
    }
    return save();
}

std::vector<std::string> ConfigStore::listPresets(const std::string& project_path) const {
    std::vector<std::string> names;
    auto it = m_projects.find(project_path);
    if (it != m_projects.end()) {
        for (const auto& preset : it->second.presets) {
            names.push_back(preset.first);
        }
    }
    return names;
}

bool ConfigStore::getPreset(const std::string& project_path, const std::string& name,
                            std::vector<std::string>& paths) const {
    auto it = m_projects.find(project_path);
    if (it == m_projects.end()) {
        return false;
    }
    auto preset = it->second.presets.find(name);
    if (preset == it->second.presets.end()) {
        return false;
    }
    paths = preset->second;
    return true;
}

bool ConfigStore::setPinned(const std::string& project_path, bool pinned) {
    entryFor(project_path).pinned = pinned;
    return save();
}

bool ConfigStore::setExcludedPaths(const std::string& project_path, const std::vector<std::string>& paths) {
    entryFor(project_path).excluded_paths = paths;
    return save();
}

std::vector<ProjectConfig> ConfigStore::recentProjects() const {
    std::vector<ProjectConfig> projects;
    for (const auto& entry : m_projects) {
        projects.push_back(entry.second);
    }
    std::stable_sort(projects.begin(), projects.end(), [](const ProjectConfig& a, const ProjectConfig& b) {
        if (a.pinned != b.pinned) {
            return a.pinned;
        }
        return timestampValue(a.last_opened) > timestampValue(b.last_opened);
    });
    return projects;
}

std::string ConfigStore::currentTimestamp() {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return std::to_string(seconds);
}

std::string ConfigStore::serialize() const {
    json projects = json::object();
    for (const auto& entry : m_projects) {
        const ProjectConfig& config = entry.second;
        json presets = json::object();
        for (const auto& preset : config.presets) {
            presets[preset.first] = preset.second;
        }
        projects[entry.first] = {
            {"project_path", config.project_path},
            {"checked_paths", config.checked_paths},
            {"excluded_paths", config.excluded_paths},
            {"last_opened", config.last_opened},
            {"presets", presets},
            {"pinned", config.pinned}
        };
    }

    json root = {{"projects", projects}};
    return root.dump(2) + "\n";
}

bool ConfigStore::deserialize(const std::string& text, std::string& error) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::exception& e) {
        error = e.what();
        return false;
    }

    if (!root.is_object() || !root.contains("projects") || !root["projects"].is_object()) {
        error = "missing \"projects\" object";
        return false;
    }

    std::map<std::string, ProjectConfig> projects;
    try {
        for (auto it = root["projects"].begin(); it != root["projects"].end(); ++it) {
            const json& value = it.value();
            if (!value.is_object()) {
                continue;
            }

            ProjectConfig config;
            config.project_path = value.value("project_path", it.key());
            config.checked_paths = stringList(value.value("checked_paths", json::array()));
            config.excluded_paths = stringList(value.value("excluded_paths", json::array()));
            config.last_opened = value.value("last_opened", std::string());
            config.pinned = value.value("pinned", false);

            const json presets = value.value("presets", json::object());
            if (presets.is_object()) {
                for (auto preset = presets.begin(); preset != presets.end(); ++preset) {
                    config.presets[preset.key()] = stringList(preset.value());
                }
            }
            projects[it.key()] = config;
        }
    } catch (const json::exception& e) {
        error = e.what();
        return false;
    }

    m_projects.swap(projects);
    return true;
}

ProjectConfig& ConfigStore::entryFor(const std::string& project_path) {
    ProjectConfig& config = m_projects[project_path];
    if (config.project_path.empty()) {
        config.project_path = project_path;
    }
    return config;
}

} // namespace CodePack
