// =================================================================
// src/CodePack/ConfigParser.cpp
// =================================================================
// Implementation for the YAML settings reader.

#include "CodePack/ConfigParser.hpp"
#include "CodePack/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>

namespace CodePack {

static void flatten(const YAML::Node& node, const std::string& prefix,
                    std::map<std::string, std::string>& values,
                    std::map<std::string, std::vector<std::string>>& lists) {
    if (node.IsMap()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            flatten(it->second, prefix.empty() ? key : prefix + "." + key, values, lists);
        }
    } else if (node.IsSequence()) {
        std::vector<std::string>& items = lists[prefix];
        for (const auto& item : node) {
            if (item.IsScalar()) {
                items.push_back(item.as<std::string>());
            }
        }
    } else if (node.IsScalar()) {
        values[prefix] = node.as<std::string>();
    }
}

ConfigParser::ConfigParser(const std::string& config_path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(config_path, ec)) {
        // It's okay if the file doesn't exist, e.g., before `init` is run.
        return;
    }

    try {
        YAML::Node root = YAML::LoadFile(config_path);
        if (root.IsMap()) {
            flatten(root, "", m_config_values, m_config_lists);
        }
        m_loaded = true;
    } catch (const YAML::Exception& e) {
        Logger::getInstance().error("ConfigParser",
            "Failed to parse configuration file: " + std::string(e.what()), config_path);
        m_config_values.clear();
        m_config_lists.clear();
    }
}

std::string ConfigParser::getStringValue(const std::string& key) const {
    auto it = m_config_values.find(key);
    if (it != m_config_values.end()) {
        return it->second;
    }
    return ""; // Return empty string if key not found
}

std::vector<std::string> ConfigParser::getStringList(const std::string& key) const {
    auto it = m_config_lists.find(key);
    if (it != m_config_lists.end()) {
        return it->second;
    }
    return {};
}

bool ConfigParser::hasKey(const std::string& key) const {
    return m_config_values.count(key) > 0 || m_config_lists.count(key) > 0;
}

} // namespace CodePack
