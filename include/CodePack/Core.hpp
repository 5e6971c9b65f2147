// =================================================================
// include/CodePack/Core.hpp
// =================================================================
// Defines the command dispatcher behind the codepack executable.

#pragma once

#include "CodePack/CliParser.hpp"
#include "CodePack/AppSettings.hpp"
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace CodePack {
    class ConfigParser;
    class SysInteraction;
    class GitCollaborator;
    class ProjectSession;
    struct FileNode;
}

namespace CodePack {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Defined in the .cpp file because of the forward-declared members.
     */
    ~Core();

    /**
     * @brief Runs the selected subcommand.
     *
     * Exceptions thrown by the pipeline are reported here: rejected input
     * gives exit code 2, any other failure exit code 1.
     * @return 0 on success.
     */
    int run();

private:
    // Command Handlers
    int handleInit();
    int handleScan();
    int handlePack();
    int handleEstimate();
    int handleStats();
    int handleSecrets();
    int handlePreset();
    int handlePlugin();

    int dispatch();
    bool loadSettings();
    void configureLogging();
    void openSession();
    bool applyFilter(const std::string& filter);
    void printTree(const FileNode& node, size_t depth) const;

    const Commands& m_commands;
    AppSettings m_settings;
    std::unique_ptr<ConfigParser> m_config;
    std::unique_ptr<SysInteraction> m_sys;
    std::unique_ptr<GitCollaborator> m_git;
    std::unique_ptr<ProjectSession> m_session;
};

} // namespace CodePack
