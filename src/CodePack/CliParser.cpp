// =================================================================
// src/CodePack/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "CodePack/CliParser.hpp"

namespace CodePack {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("CodePack: pack a project's source files into one AI-ready document.");
    m_app->require_subcommand(0, 1);

    m_app->add_option("-c,--config", m_commands.config_path, "Path to the settings file (default: .codepack/config.yml)");
    m_app->add_flag("-q,--quiet", m_commands.quiet, "Only log errors to the console");
    m_app->add_flag("-v,--verbose", m_commands.verbose, "Log debug messages to the console");

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    // Define all commands
    setupInitCommand(*m_app);
    setupScanCommand(*m_app);
    setupPackCommand(*m_app);
    setupEstimateCommand(*m_app);
    setupStatsCommand(*m_app);
    setupSecretsCommand(*m_app);
    setupPresetCommand(*m_app);
    setupPluginCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupInitCommand(CLI::App& app) {
    app.add_subcommand("init", "Writes a default .codepack/config.yml in the current directory.");
}

void CliParser::setupScanCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("scan", "Scans a project and prints its type, metadata and file count.");
    sub->add_option("root", m_commands.project_path, "Project root (default: current directory)");
    sub->add_flag("--tree", m_commands.show_tree, "Print the scanned file tree");
}

void CliParser::setupPackCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("pack", "Packs the selected files of a project into one document.");
    sub->add_option("root", m_commands.project_path, "Project root (default: current directory)");
    sub->add_option("-f,--format", m_commands.format, "Export format: plain, markdown or xml")
        ->check(CLI::IsMember({"plain", "txt", "text", "markdown", "md", "xml"}, CLI::ignore_case));
    sub->add_option("--max-file-bytes", m_commands.max_file_bytes, "Skip files larger than this many bytes");
    sub->add_flag("--include-diff", m_commands.include_diff, "Append the Git working-tree diff");
    sub->add_option("-i,--instruction", m_commands.instruction, "Reviewer instruction placed before the files");
    sub->add_flag("--mask", m_commands.mask_secrets, "Mask detected secrets in the output");
    sub->add_option("-o,--output", m_commands.output_path, "Write to this file instead of stdout");
    sub->add_option("--filter", m_commands.filter,
                    "Replace the saved selection: all, none, source, config, git or ext:<ext>");
}

void CliParser::setupEstimateCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("estimate", "Estimates the token count of the current selection.");
    sub->add_option("root", m_commands.project_path, "Project root (default: current directory)");
}

void CliParser::setupStatsCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("stats", "Prints per-language line and byte counts for the selection.");
    sub->add_option("root", m_commands.project_path, "Project root (default: current directory)");
}

void CliParser::setupSecretsCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("secrets", "Scans the selection for credentials.");
    sub->add_option("root", m_commands.project_path, "Project root (default: current directory)");
}

void CliParser::setupPresetCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("preset", "Manages named selections of a project.");
    sub->add_option("root", m_commands.project_path, "Project root")->required();
    sub->add_option("action", m_commands.preset_action, "list, save, load or delete")
        ->required()
        ->check(CLI::IsMember({"list", "save", "load", "delete"}));
    sub->add_option("name", m_commands.preset_name, "Preset name (required except for list)");
}

void CliParser::setupPluginCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("plugin", "Manages project-type plugins.");
    sub->add_option("action", m_commands.plugin_action, "list, save or delete")
        ->required()
        ->check(CLI::IsMember({"list", "save", "delete"}));
    sub->add_option("arg", m_commands.plugin_arg, "Plugin JSON file for save, plugin name for delete");
}

} // namespace CodePack
