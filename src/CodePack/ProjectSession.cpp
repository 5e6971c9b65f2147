// =================================================================
// src/CodePack/ProjectSession.cpp
// =================================================================
// Implementation for the open-project state.

#include "CodePack/ProjectSession.hpp"
#include "CodePack/ConfigStore.hpp"
#include "CodePack/PluginRegistry.hpp"
#include "CodePack/ProjectScanner.hpp"
#include "CodePack/TreeScanner.hpp"
#include "CodePack/TokenEstimator.hpp"
#include "CodePack/StatsCalculator.hpp"
#include "CodePack/SecretScanner.hpp"
#include "CodePack/Logger.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace CodePack {

// Drops user-excluded paths; directories emptied by this are dropped too
static void pruneExcluded(FileNode& node, const std::unordered_set<std::string>& excluded) {
    auto& children = node.children;
    children.erase(std::remove_if(children.begin(), children.end(), [&excluded](FileNode& child) {
        if (excluded.count(child.path) > 0) {
            return true;
        }
        if (child.is_dir) {
            pruneExcluded(child, excluded);
            return child.children.empty();
        }
        return false;
    }), children.end());
}

ProjectSession::ProjectSession(const AppSettings& settings)
    : m_settings(settings),
      m_store(std::make_unique<ConfigStore>(settings.config_file)),
      m_plugins(std::make_unique<PluginRegistry>(settings.plugins_dir))
{
}

ProjectSession::~ProjectSession() = default;

const ScanResult& ProjectSession::open(const std::string& root_path) {
    m_root_path = TreeScanner::normalizeRoot(root_path);
    if (!m_store->load()) {
        LOG_WARNING("ProjectSession", "Starting with an empty project store", m_store->getConfigPath());
    }

    m_scan = scanProject();
    m_open = true;

    ProjectConfig config;
    if (m_store->loadProject(m_root_path, config)) {
        SelectionStateManager::restore(m_scan.tree, config.checked_paths);
        LOG_INFO("ProjectSession", "Restored selection of " +
                 std::to_string(SelectionStateManager::collectChecked(m_scan.tree).size()) + " files");
    } else {
        SelectionStateManager::setAll(m_scan.tree, true);
        SelectionStateManager::updateParent(m_scan.tree);
    }

    persistSelection();
    return m_scan;
}

ReconcileReport ProjectSession::refresh() {
    requireOpen();

    bool expected = false;
    if (!m_refreshing.compare_exchange_strong(expected, true)) {
        LOG_DEBUG("ProjectSession", "Refresh already running");
        ReconcileReport skipped;
        skipped.performed = false;
        return skipped;
    }

    // Clears the flag on every exit path
    struct RefreshGuard {
        std::atomic<bool>& flag;
        ~RefreshGuard() { flag.store(false); }
    } guard{m_refreshing};

    ScanResult fresh = scanProject();
    ReconcileReport report = SelectionStateManager::reconcileOnRescan(m_scan.tree, fresh.tree);
    m_scan = std::move(fresh);
    persistSelection();

    LOG_INFO("ProjectSession", "Refreshed " + m_root_path,
             "added " + std::to_string(report.added) + ", removed " + std::to_string(report.removed) +
             ", checked " + std::to_string(report.checked));
    return report;
}

bool ProjectSession::toggle(const std::string& path, bool checked) {
    requireOpen();
    if (!SelectionStateManager::setChecked(m_scan.tree, path, checked)) {
        LOG_WARNING("ProjectSession", "Path is not in the tree", path);
        return false;
    }
    persistSelection();
    return true;
}

void ProjectSession::applyBulk(BulkAction action, const std::string& arg, const GitStatus& git) {
    requireOpen();
    SelectionStateManager::applyBulkAction(m_scan.tree, action, arg, git);
    persistSelection();
}

bool ProjectSession::savePreset(const std::string& name) {
    requireOpen();
    if (name.empty()) {
        throw std::invalid_argument("Preset name must not be empty");
    }
    std::vector<std::string> checked = getCheckedPaths();
    if (checked.empty()) {
        throw std::invalid_argument("Cannot save an empty selection as a preset");
    }
    return m_store->savePreset(m_root_path, name, checked);
}

bool ProjectSession::loadPreset(const std::string& name) {
    requireOpen();
    std::vector<std::string> paths;
    if (!m_store->getPreset(m_root_path, name, paths)) {
        LOG_WARNING("ProjectSession", "Unknown preset", name);
        return false;
    }
    SelectionStateManager::restore(m_scan.tree, paths);
    persistSelection();
    return true;
}

bool ProjectSession::deletePreset(const std::string& name) {
    requireOpen();
    return m_store->deletePreset(m_root_path, name);
}

std::vector<std::string> ProjectSession::listPresets() const {
    requireOpen();
    return m_store->listPresets(m_root_path);
}

PackResult ProjectSession::pack(PackRequest request) {
    requireOpen();
    request.paths = getCheckedPaths();
    request.project_path = m_root_path;
    request.project_type = m_scan.project_type;
    return m_packer.pack(request);
}

TokenEstimate ProjectSession::estimate() const {
    requireOpen();
    return TokenEstimator::estimate(getCheckedPaths());
}

ProjectStats ProjectSession::stats() const {
    requireOpen();
    return StatsCalculator::computeStats(getCheckedPaths());
}

std::vector<FileSecretReport> ProjectSession::secrets() const {
    requireOpen();
    return SecretScanner::scanFiles(getCheckedPaths());
}

const FileNode& ProjectSession::getTree() const {
    requireOpen();
    return m_scan.tree;
}

const ScanResult& ProjectSession::getScanResult() const {
    requireOpen();
    return m_scan;
}

std::vector<std::string> ProjectSession::getCheckedPaths() const {
    requireOpen();
    return SelectionStateManager::collectChecked(m_scan.tree);
}

ScanResult ProjectSession::scanProject() const {
    ProjectScanner scanner(m_plugins->getPlugins(), m_settings.toScanOptions());
    ScanResult result = scanner.scan(m_root_path);

    ProjectConfig config;
    if (m_store->loadProject(m_root_path, config) && !config.excluded_paths.empty()) {
        pruneExcluded(result.tree, std::unordered_set<std::string>(config.excluded_paths.begin(),
                                                                   config.excluded_paths.end()));
        result.total_files = TreeScanner::countFiles(result.tree);
    }
    return result;
}

bool ProjectSession::persistSelection() {
    if (!m_store->saveSelection(m_root_path, SelectionStateManager::collectChecked(m_scan.tree))) {
        LOG_WARNING("ProjectSession", "Selection kept in memory only", m_store->getConfigPath());
        return false;
    }
    return true;
}

void ProjectSession::requireOpen() const {
    if (!m_open) {
        throw std::runtime_error("No project is open");
    }
}

} // namespace CodePack
