// =================================================================
// src/CodePack/PluginRegistry.cpp
// =================================================================
// Implementation for JSON plugin definitions.

#include "CodePack/PluginRegistry.hpp"
#include "CodePack/Logger.hpp"
#include "CodePack/SysInteraction.hpp"
#include "nlohmann/json.hpp"
#include <filesystem>
#include <algorithm>
#include <stdexcept>
#include <cctype>

namespace CodePack {

namespace fs = std::filesystem;

static std::vector<std::string> readStringArray(const nlohmann::json& object, const char* key) {
    std::vector<std::string> values;
    auto it = object.find(key);
    if (it == object.end() || !it->is_array()) {
        return values;
    }
    for (const auto& item : *it) {
        if (item.is_string()) {
            values.push_back(item.get<std::string>());
        }
    }
    return values;
}

PluginRegistry::PluginRegistry(const std::string& plugins_dir)
    : m_plugins_dir(plugins_dir), m_loaded(false) {}

const std::vector<PluginDef>& PluginRegistry::getPlugins() {
    if (!m_loaded) {
        loadAll();
    }
    return m_plugins;
}

void PluginRegistry::reload() {
    m_loaded = false;
    m_plugins.clear();
    loadAll();
}

std::string PluginRegistry::save(const PluginDef& plugin) {
    std::string reason;
    if (!validate(plugin, reason)) {
        throw std::invalid_argument("Invalid plugin: " + reason);
    }

    fs::path file_path = fs::path(m_plugins_dir) / fileNameFor(plugin.name);
    SysInteraction sys;
    if (!sys.writeFileAtomic(file_path.string(), toJson(plugin))) {
        throw std::runtime_error("Failed to write plugin file: " + file_path.string());
    }

    LOG_INFO("PluginRegistry", "Saved plugin '" + plugin.name + "' to " + file_path.string());
    reload();
    return file_path.string();
}

bool PluginRegistry::remove(const std::string& name) {
    fs::path file_path = fs::path(m_plugins_dir) / fileNameFor(name);
    SysInteraction sys;
    if (!sys.removeFile(file_path.string())) {
        LOG_WARNING("PluginRegistry", "No plugin file to delete", file_path.string());
        return false;
    }

    LOG_INFO("PluginRegistry", "Deleted plugin '" + name + "'");
    reload();
    return true;
}

std::string PluginRegistry::fileNameFor(const std::string& name) {
    std::string file_name;
    for (char c : name) {
        if (c == ' ') {
            file_name += '-';
        } else {
            file_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return file_name + ".json";
}

bool PluginRegistry::parsePlugin(const std::string& json_text, PluginDef& plugin, std::string& error) {
    nlohmann::json doc = nlohmann::json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        error = "malformed JSON";
        return false;
    }
    if (!doc.is_object()) {
        error = "plugin definition must be a JSON object";
        return false;
    }

    auto name_it = doc.find("name");
    if (name_it == doc.end() || !name_it->is_string()) {
        error = "missing string field 'name'";
        return false;
    }

    PluginDef parsed;
    parsed.name = name_it->get<std::string>();
    auto version_it = doc.find("version");
    if (version_it != doc.end() && version_it->is_string()) {
        parsed.version = version_it->get<std::string>();
    }
    parsed.detect_files = readStringArray(doc, "detect_files");
    parsed.detect_dirs = readStringArray(doc, "detect_dirs");
    parsed.exclude_dirs = readStringArray(doc, "exclude_dirs");
    parsed.source_extensions = readStringArray(doc, "source_extensions");

    plugin = parsed;
    return true;
}

std::string PluginRegistry::toJson(const PluginDef& plugin) {
    nlohmann::ordered_json doc;
    doc["name"] = plugin.name;
    doc["version"] = plugin.version;
    doc["detect_files"] = plugin.detect_files;
    doc["detect_dirs"] = plugin.detect_dirs;
    doc["exclude_dirs"] = plugin.exclude_dirs;
    doc["source_extensions"] = plugin.source_extensions;
    return doc.dump(2) + "\n";
}

bool PluginRegistry::validate(const PluginDef& plugin, std::string& reason) {
    bool blank_name = std::all_of(plugin.name.begin(), plugin.name.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    if (blank_name) {
        reason = "plugin name must not be empty";
        return false;
    }
    if (plugin.detect_files.empty() && plugin.detect_dirs.empty()) {
        reason = "plugin '" + plugin.name + "' needs at least one of detect_files or detect_dirs";
        return false;
    }
    return true;
}

void PluginRegistry::loadAll() {
    m_loaded = true;
    m_plugins.clear();

    std::error_code ec;
    if (!fs::is_directory(m_plugins_dir, ec)) {
        return;
    }

    std::vector<fs::path> files;
    fs::directory_iterator it(m_plugins_dir, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const fs::path& path = it->path();
        std::error_code type_ec;
        if (path.extension() == ".json" && fs::is_regular_file(path, type_ec)) {
            files.push_back(path);
        }
    }
    if (ec) {
        LOG_WARNING("PluginRegistry", "Failed to list plugin directory", ec.message());
    }
    std::sort(files.begin(), files.end());

    SysInteraction sys;
    for (const auto& path : files) {
        std::string content;
        try {
            content = sys.readFile(path.string());
        } catch (const std::exception& e) {
            LOG_WARNING("PluginRegistry", "Skipping unreadable plugin", e.what());
            continue;
        }

        PluginDef plugin;
        std::string reason;
        if (!parsePlugin(content, plugin, reason) || !validate(plugin, reason)) {
            LOG_WARNING("PluginRegistry", "Skipping plugin " + path.filename().string(), reason);
            continue;
        }
        m_plugins.push_back(plugin);
    }

    LOG_DEBUG("PluginRegistry", "Loaded " + std::to_string(m_plugins.size()) + " plugins from " + m_plugins_dir);
}

} // namespace CodePack
