// =================================================================
// include/CodePack/SelectionStateManager.hpp
// =================================================================
// Header for the tri-state file selection model.

#pragma once

#include "CodePack/Types.hpp"
#include <string>
#include <vector>
#include <set>
#include <unordered_set>
#include <functional>

namespace CodePack {

/**
 * @brief Bulk selection shortcuts offered to the user
 */
enum class BulkAction {
    SelectAll,
    SelectNone,
    SelectExtension,
    SelectSource,
    SelectConfig,
    SelectGitChanged
};

/**
 * @brief Tri-state selection over an externally owned FileNode tree
 *
 * Leaves carry the selection; a directory is checked when every leaf below
 * it is checked and indeterminate when only some are. Directory flags are
 * recomputed bottom-up from the direct children after each change, so no
 * parent pointers are needed. None of these operations fail.
 */
class SelectionStateManager {
public:
    /**
     * @brief Check or uncheck a node and everything below it
     */
    static void setAll(FileNode& node, bool checked);

    /**
     * @brief Recompute a directory's flags from its direct children
     *
     * A directory without children ends up unchecked and not indeterminate.
     */
    static void updateParent(FileNode& node);

    /**
     * @brief Apply a saved selection to a tree
     *
     * Leaves are checked exactly when their path is in the set; paths that
     * are not in the tree are ignored.
     */
    static void restore(FileNode& tree, const std::unordered_set<std::string>& checked_paths);
    static void restore(FileNode& tree, const std::vector<std::string>& checked_paths);

    /**
     * @brief Checked file paths in tree order
     */
    static std::vector<std::string> collectChecked(const FileNode& tree);

    /**
     * @brief All file paths in tree order
     */
    static std::vector<std::string> collectAllFilePaths(const FileNode& tree);

    /**
     * @brief Carry the selection of an old tree over to a new scan
     *
     * Files that only exist in the new tree stay unchecked.
     * @param old_tree Tree before the re-scan
     * @param new_tree Freshly scanned tree, modified in place
     * @return Counts of added, removed and checked files
     */
    static ReconcileReport reconcileOnRescan(const FileNode& old_tree, FileNode& new_tree);

    /**
     * @brief Replace the selection with the files matching a predicate
     */
    static void selectByFilter(FileNode& tree, const std::function<bool(const FileNode&)>& predicate);

    /**
     * @brief Select files whose name ends with ".<extension>"
     * @param extension Extension with or without the leading dot
     */
    static void selectByExtension(FileNode& tree, const std::string& extension);

    static void selectSourceFiles(FileNode& tree);
    static void selectConfigFiles(FileNode& tree);

    /**
     * @brief Select files reported as changed by Git, ignoring deletions
     */
    static void selectGitChanged(FileNode& tree, const GitStatus& git);

    /**
     * @brief Toggle one file or directory and refresh its ancestors
     * @return False if no node has this path
     */
    static bool setChecked(FileNode& tree, const std::string& path, bool checked);

    /**
     * @brief Find a node by path
     * @return Node, or nullptr if absent
     */
    static const FileNode* findNode(const FileNode& tree, const std::string& path);

    /**
     * @brief Parse "all", "none", "ext", "source", "config" or "git"
     */
    static bool parseBulkAction(const std::string& text, BulkAction& action);

    /**
     * @brief Run a bulk action
     *
     * Throws std::invalid_argument when SelectExtension is given no extension.
     * @param arg Extension for SelectExtension, ignored otherwise
     * @param git Status used by SelectGitChanged
     */
    static void applyBulkAction(FileNode& tree, BulkAction action,
                                const std::string& arg = "", const GitStatus& git = GitStatus());

    /**
     * @brief Lowercase text after the last '.', or the whole lowercase name
     */
    static std::string getSelectionExtension(const std::string& name);

    static const std::set<std::string>& getSourceExtensions();
    static const std::set<std::string>& getConfigExtensions();

private:
    static void collect(const FileNode& node, bool only_checked, std::vector<std::string>& out);
};

} // namespace CodePack
