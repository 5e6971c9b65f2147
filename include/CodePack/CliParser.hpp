// =================================================================
// include/CodePack/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>
#include <vector>

namespace CodePack {

// A simple struct to hold parsed command information.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    // Shared by the project commands
    std::string project_path = ".";
    std::string config_path = ".codepack/config.yml";
    bool quiet = false;
    bool verbose = false;

    // Options for 'scan'
    bool show_tree = false;

    // Options for 'pack'
    std::string format;               // Empty means the configured default
    size_t max_file_bytes = 0;        // 0 means the configured default
    bool include_diff = false;
    std::string instruction;
    bool mask_secrets = false;
    std::string output_path;          // Empty writes to stdout
    std::string filter;               // all, none, source, config, git or ext:<ext>

    // Options for 'preset'
    std::string preset_action;        // list, save, load, delete
    std::string preset_name;

    // Options for 'plugin'
    std::string plugin_action;        // list, save, delete
    std::string plugin_arg;           // JSON file for save, name for delete
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupInitCommand(CLI::App& app);
    void setupScanCommand(CLI::App& app);
    void setupPackCommand(CLI::App& app);
    void setupEstimateCommand(CLI::App& app);
    void setupStatsCommand(CLI::App& app);
    void setupSecretsCommand(CLI::App& app);
    void setupPresetCommand(CLI::App& app);
    void setupPluginCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace CodePack
