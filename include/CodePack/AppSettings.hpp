// =================================================================
// include/CodePack/AppSettings.hpp
// =================================================================
// Effective settings: defaults, then config.yml, then command-line flags.

#pragma once

#include "CodePack/Types.hpp"
#include "CodePack/TreeScanner.hpp"
#include <string>
#include <vector>

namespace CodePack {

class ConfigParser;
struct Commands;

struct AppSettings {
    // pack.*
    size_t pack_max_file_bytes = 1024 * 1024;
    std::string pack_format = "plain";
    bool pack_mask_secrets = false;

    // scan.*
    bool scan_include_hidden = false;
    size_t scan_max_file_bytes = 0;
    std::vector<std::string> scan_exclude;

    // paths.*
    std::string config_file = ".codepack/projects.json";
    std::string plugins_dir = ".codepack/plugins";

    // log.*
    std::string log_dir = ".codepack/logs";
    std::string log_level = "info";

    /**
     * @brief Override defaults with values present in the settings file
     *
     * Values that cannot be parsed are logged and ignored.
     */
    void loadFromConfig(const ConfigParser& config);

    /**
     * @brief Override with flags given on the command line
     */
    void applyCommandOverrides(const Commands& commands);

    /**
     * @brief Check the combined settings
     * @param error Receives the first problem found
     * @return True if the settings are usable
     */
    bool validate(std::string& error) const;

    ExportFormat exportFormat() const;

    ScanOptions toScanOptions() const;

    /**
     * @brief Content written by `codepack init`
     */
    static std::string defaultConfigYaml();
};

} // namespace CodePack
