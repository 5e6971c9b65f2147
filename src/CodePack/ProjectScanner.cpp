// =================================================================
// src/CodePack/ProjectScanner.cpp
// =================================================================
// Implementation for the classify, walk and describe step.

#include "CodePack/ProjectScanner.hpp"
#include "CodePack/ProjectClassifier.hpp"
#include "CodePack/MetadataExtractor.hpp"
#include "CodePack/Logger.hpp"
#include <chrono>

namespace CodePack {

ProjectScanner::ProjectScanner(const std::vector<PluginDef>& plugins, const ScanOptions& options)
    : m_plugins(plugins), m_options(options) {}

ScanResult ProjectScanner::scan(const std::string& root_path) const {
    auto start_time = std::chrono::steady_clock::now();

    const std::string root = TreeScanner::normalizeRoot(root_path);

    ProjectClassifier classifier(m_plugins);
    Classification classification = classifier.classify(root);

    TreeScanner tree_scanner(root, m_options);
    if (classification.plugin_matched) {
        tree_scanner.addPluginExcludes(classification.plugin.exclude_dirs);
        for (const auto& ext : classification.plugin.source_extensions) {
            tree_scanner.addSourceExtension(ext);
        }
    }

    ScanResult result;
    result.project_type = classification.project_type;
    result.tree = tree_scanner.scan();
    result.total_files = TreeScanner::countFiles(result.tree);
    result.metadata = MetadataExtractor::extract(root, result.project_type);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    Logger::getInstance().logScanCompleted(root, result.project_type, result.total_files,
                                           static_cast<long>(duration.count()));
    return result;
}

} // namespace CodePack
