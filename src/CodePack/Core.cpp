// =================================================================
// src/CodePack/Core.cpp
// =================================================================
// Implementation for the command dispatcher.

#include "CodePack/Core.hpp"
#include "CodePack/ConfigParser.hpp"
#include "CodePack/SysInteraction.hpp"
#include "CodePack/GitCollaborator.hpp"
#include "CodePack/ProjectSession.hpp"
#include "CodePack/PluginRegistry.hpp"
#include "CodePack/SelectionStateManager.hpp"
#include "CodePack/TokenEstimator.hpp"
#include "CodePack/SecretScanner.hpp"
#include "CodePack/Logger.hpp"
#include <iostream>
#include <iomanip>
#include <stdexcept>
#include <filesystem>
#include <chrono>

namespace CodePack {

static std::string joinList(const std::vector<std::string>& items) {
    std::string joined;
    for (const auto& item : items) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += item;
    }
    return joined;
}

Core::Core(const Commands& commands)
    : m_commands(commands),
      m_sys(std::make_unique<SysInteraction>()),
      m_git(std::make_unique<GitCollaborator>())
{
}

Core::~Core() = default;

int Core::run() {
    if (m_commands.active_command.empty()) {
        return 0;
    }

    if (!loadSettings()) {
        return 2;
    }
    configureLogging();

    Logger& logger = Logger::getInstance();
    logger.logSessionStart(m_commands.active_command, m_commands.project_path);
    auto start = std::chrono::steady_clock::now();

    int exit_code = 1;
    try {
        exit_code = dispatch();
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Core", e.what(), m_commands.active_command);
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 2;
    } catch (const std::exception& e) {
        LOG_ERROR("Core", e.what(), m_commands.active_command);
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 1;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    logger.logSessionEnd(m_commands.active_command, exit_code, static_cast<long>(elapsed.count()));
    logger.flush();
    return exit_code;
}

int Core::dispatch() {
    if (m_commands.active_command == "init") {
        return handleInit();
    } else if (m_commands.active_command == "scan") {
        return handleScan();
    } else if (m_commands.active_command == "pack") {
        return handlePack();
    } else if (m_commands.active_command == "estimate") {
        return handleEstimate();
    } else if (m_commands.active_command == "stats") {
        return handleStats();
    } else if (m_commands.active_command == "secrets") {
        return handleSecrets();
    } else if (m_commands.active_command == "preset") {
        return handlePreset();
    } else if (m_commands.active_command == "plugin") {
        return handlePlugin();
    }

    std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
    return 1;
}

bool Core::loadSettings() {
    // `init` writes the settings file, so it never reads one
    if (m_commands.active_command != "init") {
        m_config = std::make_unique<ConfigParser>(m_commands.config_path);
        m_settings.loadFromConfig(*m_config);
    }
    m_settings.applyCommandOverrides(m_commands);

    std::string error;
    if (!m_settings.validate(error)) {
        std::cerr << "Error: Invalid configuration: " << error << std::endl;
        return false;
    }
    return true;
}

void Core::configureLogging() {
    Logger& logger = Logger::getInstance();
    LogLevel level = LogLevel::INFO;
    if (Logger::parseLevel(m_settings.log_level, level)) {
        logger.setConsoleLogLevel(level);
    }
    if (m_commands.active_command == "init") {
        // The log directory lives inside the directory `init` creates
        logger.setFileLogging(false);
    }
    logger.initialize(m_settings.log_dir);
}

void Core::openSession() {
    m_session = std::make_unique<ProjectSession>(m_settings);
    m_session->open(m_commands.project_path);
}

bool Core::applyFilter(const std::string& filter) {
    std::string name = filter;
    std::string arg;
    size_t colon = filter.find(':');
    if (colon != std::string::npos) {
        name = filter.substr(0, colon);
        arg = filter.substr(colon + 1);
    }

    BulkAction action;
    if (!SelectionStateManager::parseBulkAction(name, action)) {
        std::cerr << "Error: Unknown filter '" << filter
                  << "' (expected all, none, source, config, git or ext:<ext>)." << std::endl;
        return false;
    }

    GitStatus git;
    if (action == BulkAction::SelectGitChanged) {
        git = m_git->status(m_session->getRootPath());
        if (!git.is_repo) {
            std::cerr << "Error: " << m_session->getRootPath() << " is not inside a Git repository." << std::endl;
            return false;
        }
    }
    m_session->applyBulk(action, arg, git);
    return true;
}

void Core::printTree(const FileNode& node, size_t depth) const {
    for (const auto& child : node.children) {
        const char* mark = child.indeterminate ? "[-]" : (child.checked ? "[x]" : "[ ]");
        std::cout << std::string(depth * 2, ' ') << mark << " " << child.name
                  << (child.is_dir ? "/" : "") << std::endl;
        if (child.is_dir) {
            printTree(child, depth + 1);
        }
    }
}

int Core::handleInit() {
    std::cout << "Initializing CodePack configuration..." << std::endl;

    const std::string& configFile = m_commands.config_path;
    std::string configDir = std::filesystem::path(configFile).parent_path().string();

    if (!configDir.empty() && !m_sys->directoryExists(configDir)) {
        if (!m_sys->createDirectories(configDir)) {
            std::cerr << "Error: Failed to create configuration directory '" << configDir << "'." << std::endl;
            return 1;
        }
        std::cout << "Created configuration directory: " << configDir << std::endl;
    }

    if (m_sys->fileExists(configFile)) {
        std::cout << "Configuration file '" << configFile << "' already exists. Skipping." << std::endl;
        return 0;
    }
    if (!m_sys->writeFileAtomic(configFile, AppSettings::defaultConfigYaml())) {
        std::cerr << "Error: Failed to write configuration file '" << configFile << "'." << std::endl;
        return 1;
    }
    std::cout << "Created default configuration file: " << configFile << std::endl;
    return 0;
}

int Core::handleScan() {
    openSession();
    const ScanResult& scan = m_session->getScanResult();
    const ProjectMetadata& meta = scan.metadata;

    std::cout << "Project:  " << meta.name << std::endl;
    std::cout << "Type:     " << scan.project_type << std::endl;
    if (!meta.version.empty()) {
        std::cout << "Version:  " << meta.version << std::endl;
    }
    if (!meta.description.empty()) {
        std::cout << "About:    " << meta.description << std::endl;
    }
    if (!meta.entry_point.empty()) {
        std::cout << "Entry:    " << meta.entry_point << std::endl;
    }
    if (!meta.runtime.empty()) {
        std::cout << "Runtime:  " << joinList(meta.runtime) << std::endl;
    }
    if (!meta.dependencies.empty()) {
        std::cout << "Deps:     " << joinList(meta.dependencies) << std::endl;
    }
    if (!meta.dev_dependencies.empty()) {
        std::cout << "Dev deps: " << joinList(meta.dev_dependencies) << std::endl;
    }
    std::cout << "Files:    " << scan.total_files << " ("
              << m_session->getCheckedPaths().size() << " selected)" << std::endl;

    if (m_commands.show_tree) {
        std::cout << std::endl << scan.tree.name << "/" << std::endl;
        printTree(scan.tree, 1);
    }
    return 0;
}

int Core::handlePack() {
    openSession();
    if (!m_commands.filter.empty() && !applyFilter(m_commands.filter)) {
        return 2;
    }

    PackRequest request;
    request.format = m_settings.exportFormat();
    request.max_file_bytes = m_settings.pack_max_file_bytes;
    request.instruction = m_commands.instruction;
    request.mask_secrets = m_settings.pack_mask_secrets;
    request.include_diff = m_commands.include_diff;
    if (request.include_diff) {
        request.diffs = m_git->diffs(m_session->getRootPath());
        if (request.diffs.empty()) {
            LOG_INFO("Core", "No working changes to include", m_session->getRootPath());
        }
    }

    PackResult result = m_session->pack(request);

    // Summaries go to stderr when the document itself goes to stdout
    std::ostream& report = m_commands.output_path.empty() ? std::cerr : std::cout;
    if (m_commands.output_path.empty()) {
        std::cout << result.content;
        std::cout.flush();
    } else {
        if (!m_session->getPacker().exportToFile(result, m_commands.output_path)) {
            std::cerr << "Error: Failed to write '" << m_commands.output_path << "'." << std::endl;
            return 1;
        }
        report << "Wrote " << m_commands.output_path << std::endl;
    }

    if (!m_commands.quiet) {
        report << "Packed " << result.file_count << " files, "
               << result.total_bytes << " bytes, ~"
               << TokenEstimator::formatTokens(result.estimated_tokens) << " tokens";
        if (!result.skipped_files.empty()) {
            report << " (" << result.skipped_files.size() << " skipped)";
        }
        report << std::endl;
        for (const auto& skipped : result.skipped_files) {
            report << "  skipped " << skipped.path << ": " << skipped.reason << std::endl;
        }
    }
    std::string warning = TokenEstimator::warningMessage(TokenEstimator::warningFor(result.estimated_tokens));
    if (!warning.empty()) {
        LOG_WARNING("Core", warning);
    }
    return 0;
}

int Core::handleEstimate() {
    openSession();
    TokenEstimate estimate = m_session->estimate();

    std::cout << "Selected files: " << m_session->getCheckedPaths().size() << std::endl;
    std::cout << "Total bytes:    " << estimate.total_bytes << std::endl;
    std::cout << "Tokens:         ~" << TokenEstimator::formatTokens(estimate.tokens) << std::endl;

    std::string warning = TokenEstimator::warningMessage(TokenEstimator::warningFor(estimate.tokens));
    if (!warning.empty()) {
        std::cout << "Warning:        " << warning << std::endl;
    }
    return 0;
}

int Core::handleStats() {
    openSession();
    ProjectStats stats = m_session->stats();

    std::cout << std::left << std::setw(16) << "Language"
              << std::right << std::setw(8) << "Files"
              << std::setw(10) << "Lines"
              << std::setw(12) << "Bytes" << std::endl;
    for (const auto& lang : stats.languages) {
        std::cout << std::left << std::setw(16) << lang.language
                  << std::right << std::setw(8) << lang.file_count
                  << std::setw(10) << lang.line_count
                  << std::setw(12) << lang.byte_count << std::endl;
    }
    std::cout << std::left << std::setw(16) << "Total"
              << std::right << std::setw(8) << stats.total_files
              << std::setw(10) << stats.total_lines
              << std::setw(12) << stats.total_bytes << std::endl;
    return 0;
}

int Core::handleSecrets() {
    openSession();
    std::vector<FileSecretReport> reports = m_session->secrets();

    if (reports.empty()) {
        std::cout << "No secrets found in " << m_session->getCheckedPaths().size() << " selected files." << std::endl;
        return 0;
    }

    size_t total = 0;
    for (const auto& report : reports) {
        std::cout << report.path << std::endl;
        for (const auto& match : report.matches) {
            std::cout << "  line " << match.line_number << ":" << match.start_index + 1
                      << "  " << match.rule_name << " (" << secretTypeToString(match.secret_type) << ")  "
                      << SecretScanner::maskValue(match.match_content) << std::endl;
            ++total;
        }
    }
    std::cout << total << " potential secrets in " << reports.size() << " files." << std::endl;
    return 1;
}

int Core::handlePreset() {
    const std::string& action = m_commands.preset_action;
    const std::string& name = m_commands.preset_name;
    if (action != "list" && name.empty()) {
        std::cerr << "Error: 'preset " << action << "' needs a preset name." << std::endl;
        return 2;
    }

    openSession();
    if (action == "list") {
        std::vector<std::string> presets = m_session->listPresets();
        if (presets.empty()) {
            std::cout << "No presets saved for " << m_session->getRootPath() << std::endl;
        }
        for (const auto& preset : presets) {
            std::cout << preset << std::endl;
        }
        return 0;
    } else if (action == "save") {
        if (!m_session->savePreset(name)) {
            std::cerr << "Error: Failed to save preset '" << name << "'." << std::endl;
            return 1;
        }
        std::cout << "Saved preset '" << name << "' (" << m_session->getCheckedPaths().size()
                  << " files)" << std::endl;
        return 0;
    } else if (action == "load") {
        if (!m_session->loadPreset(name)) {
            std::cerr << "Error: No preset named '" << name << "'." << std::endl;
            return 1;
        }
        std::cout << "Loaded preset '" << name << "' (" << m_session->getCheckedPaths().size()
                  << " files selected)" << std::endl;
        return 0;
    } else if (action == "delete") {
        if (!m_session->deletePreset(name)) {
            std::cerr << "Error: No preset named '" << name << "'." << std::endl;
            return 1;
        }
        std::cout << "Deleted preset '" << name << "'" << std::endl;
        return 0;
    }

    std::cerr << "Error: Unknown preset action '" << action << "'." << std::endl;
    return 2;
}

int Core::handlePlugin() {
    PluginRegistry registry(m_settings.plugins_dir);
    const std::string& action = m_commands.plugin_action;

    if (action == "list") {
        const std::vector<PluginDef>& plugins = registry.getPlugins();
        if (plugins.empty()) {
            std::cout << "No plugins in " << registry.getDirectory() << std::endl;
        }
        for (const auto& plugin : plugins) {
            std::cout << plugin.name;
            if (!plugin.version.empty()) {
                std::cout << " " << plugin.version;
            }
            std::cout << std::endl;
            if (!plugin.detect_files.empty()) {
                std::cout << "  detect files: " << joinList(plugin.detect_files) << std::endl;
            }
            if (!plugin.detect_dirs.empty()) {
                std::cout << "  detect dirs:  " << joinList(plugin.detect_dirs) << std::endl;
            }
            if (!plugin.exclude_dirs.empty()) {
                std::cout << "  excludes:     " << joinList(plugin.exclude_dirs) << std::endl;
            }
        }
        return 0;
    }

    if (m_commands.plugin_arg.empty()) {
        std::cerr << "Error: 'plugin " << action << "' needs an argument." << std::endl;
        return 2;
    }

    if (action == "save") {
        std::string text = m_sys->readFile(m_commands.plugin_arg);
        PluginDef plugin;
        std::string error;
        if (!PluginRegistry::parsePlugin(text, plugin, error)) {
            std::cerr << "Error: " << m_commands.plugin_arg << ": " << error << std::endl;
            return 2;
        }
        std::string written = registry.save(plugin);
        std::cout << "Saved plugin '" << plugin.name << "' to " << written << std::endl;
        return 0;
    } else if (action == "delete") {
        if (!registry.remove(m_commands.plugin_arg)) {
            std::cerr << "Error: No plugin named '" << m_commands.plugin_arg << "'." << std::endl;
            return 1;
        }
        std::cout << "Deleted plugin '" << m_commands.plugin_arg << "'" << std::endl;
        return 0;
    }

    std::cerr << "Error: Unknown plugin action '" << action << "'." << std::endl;
    return 2;
}

} // namespace CodePack
