// =================================================================
// include/CodePack/ConfigParser.hpp
// =================================================================
// Defines the reader for the .codepack/config.yml settings file.

#pragma once

#include <string>
#include <vector>
#include <map>

namespace CodePack {

class ConfigParser {
public:
    /**
     * @brief Constructs the parser and loads the configuration file.
     *
     * Nested maps are flattened into dotted keys ("pack.format"). A missing
     * or malformed file leaves the parser empty.
     * @param config_path The path to the config.yml file.
     */
    explicit ConfigParser(const std::string& config_path);

    /**
     * @brief Retrieves a scalar value for a given key.
     * @param key The dotted configuration key (e.g., "pack.max_file_bytes").
     * @return The corresponding value, or an empty string if not found.
     */
    std::string getStringValue(const std::string& key) const;

    /**
     * @brief Retrieves a sequence of scalars for a given key.
     * @return The values, or an empty vector if not found.
     */
    std::vector<std::string> getStringList(const std::string& key) const;

    bool hasKey(const std::string& key) const;

    /**
     * @brief Whether the file existed and parsed.
     */
    bool isLoaded() const { return m_loaded; }

private:
    std::map<std::string, std::string> m_config_values;
    std::map<std::string, std::vector<std::string>> m_config_lists;
    bool m_loaded = false;
};

} // namespace CodePack
