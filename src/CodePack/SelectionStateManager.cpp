// =================================================================
// src/CodePack/SelectionStateManager.cpp
// =================================================================
// Implementation for the tri-state file selection model.

#include "CodePack/SelectionStateManager.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

namespace CodePack {

namespace fs = std::filesystem;

static std::string toLower(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

void SelectionStateManager::setAll(FileNode& node, bool checked) {
    node.checked = checked;
    node.indeterminate = false;
    for (auto& child : node.children) {
        setAll(child, checked);
    }
}

void SelectionStateManager::updateParent(FileNode& node) {
    if (!node.is_dir) {
        node.indeterminate = false;
        return;
    }
    if (node.children.empty()) {
        node.checked = false;
        node.indeterminate = false;
        return;
    }

    bool all_checked = true;
    bool any_checked = false;
    for (const auto& child : node.children) {
        if (!child.checked || child.indeterminate) {
            all_checked = false;
        }
        if (child.checked || child.indeterminate) {
            any_checked = true;
        }
    }

    node.checked = all_checked;
    node.indeterminate = any_checked && !all_checked;
}

void SelectionStateManager::restore(FileNode& tree, const std::unordered_set<std::string>& checked_paths) {
    selectByFilter(tree, [&checked_paths](const FileNode& leaf) {
        return checked_paths.count(leaf.path) > 0;
    });
}

void SelectionStateManager::restore(FileNode& tree, const std::vector<std::string>& checked_paths) {
    restore(tree, std::unordered_set<std::string>(checked_paths.begin(), checked_paths.end()));
}

std::vector<std::string> SelectionStateManager::collectChecked(const FileNode& tree) {
    std::vector<std::string> paths;
    collect(tree, true, paths);
    return paths;
}

std::vector<std::string> SelectionStateManager::collectAllFilePaths(const FileNode& tree) {
    std::vector<std::string> paths;
    collect(tree, false, paths);
    return paths;
}

void SelectionStateManager::collect(const FileNode& node, bool only_checked, std::vector<std::string>& out) {
    if (!node.is_dir) {
        if (!only_checked || node.checked) {
            out.push_back(node.path);
        }
        return;
    }
    for (const auto& child : node.children) {
        collect(child, only_checked, out);
    }
}

ReconcileReport SelectionStateManager::reconcileOnRescan(const FileNode& old_tree, FileNode& new_tree) {
    std::vector<std::string> old_files = collectAllFilePaths(old_tree);
    std::vector<std::string> new_files = collectAllFilePaths(new_tree);
    std::unordered_set<std::string> old_set(old_files.begin(), old_files.end());
    std::unordered_set<std::string> new_set(new_files.begin(), new_files.end());

    ReconcileReport report;
    for (const auto& path : new_files) {
        if (old_set.count(path) == 0) {
            ++report.added;
        }
    }
    for (const auto& path : old_files) {
        if (new_set.count(path) == 0) {
            ++report.removed;
        }
    }

    restore(new_tree, collectChecked(old_tree));
    report.checked = collectChecked(new_tree).size();
    return report;
}

void SelectionStateManager::selectByFilter(FileNode& tree, const std::function<bool(const FileNode&)>& predicate) {
    if (!tree.is_dir) {
        tree.checked = predicate(tree);
        tree.indeterminate = false;
        return;
    }
    for (auto& child : tree.children) {
        selectByFilter(child, predicate);
    }
    updateParent(tree);
}

void SelectionStateManager::selectByExtension(FileNode& tree, const std::string& extension) {
    std::string ext = toLower(extension);
    while (!ext.empty() && ext.front() == '.') {
        ext.erase(ext.begin());
    }
    const std::string suffix = "." + ext;

    selectByFilter(tree, [&suffix](const FileNode& leaf) {
        std::string name = toLower(leaf.name);
        return name.size() >= suffix.size() &&
               name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
    });
}

void SelectionStateManager::selectSourceFiles(FileNode& tree) {
    const auto& extensions = getSourceExtensions();
    selectByFilter(tree, [&extensions](const FileNode& leaf) {
        return extensions.count(getSelectionExtension(leaf.name)) > 0;
    });
}

void SelectionStateManager::selectConfigFiles(FileNode& tree) {
    const auto& extensions = getConfigExtensions();
    selectByFilter(tree, [&extensions](const FileNode& leaf) {
        return extensions.count(getSelectionExtension(leaf.name)) > 0;
    });
}

void SelectionStateManager::selectGitChanged(FileNode& tree, const GitStatus& git) {
    std::unordered_set<std::string> changed;
    for (const auto& file : git.changed_files) {
        if (file.status != "deleted") {
            changed.insert(fs::path(file.path).lexically_normal().string());
        }
    }

    selectByFilter(tree, [&changed](const FileNode& leaf) {
        return changed.count(fs::path(leaf.path).lexically_normal().string()) > 0;
    });
}

bool SelectionStateManager::setChecked(FileNode& tree, const std::string& path, bool checked) {
    if (tree.path == path) {
        setAll(tree, checked);
        if (tree.is_dir) {
            // Leaves below an empty directory cannot make it checked
            updateParent(tree);
        }
        return true;
    }
    if (!tree.is_dir) {
        return false;
    }
    for (auto& child : tree.children) {
        if (setChecked(child, path, checked)) {
            updateParent(tree);
            return true;
        }
    }
    return false;
}

const FileNode* SelectionStateManager::findNode(const FileNode& tree, const std::string& path) {
    if (tree.path == path) {
        return &tree;
    }
    for (const auto& child : tree.children) {
        if (const FileNode* found = findNode(child, path)) {
            return found;
        }
    }
    return nullptr;
}

bool SelectionStateManager::parseBulkAction(const std::string& text, BulkAction& action) {
    std::string lower = toLower(text);
    if (lower == "all") {
        action = BulkAction::SelectAll;
    } else if (lower == "none") {
        action = BulkAction::SelectNone;
    } else if (lower == "ext" || lower == "extension") {
        action = BulkAction::SelectExtension;
    } else if (lower == "source") {
        action = BulkAction::SelectSource;
    } else if (lower == "config") {
        action = BulkAction::SelectConfig;
    } else if (lower == "git") {
        action = BulkAction::SelectGitChanged;
    } else {
        return false;
    }
    return true;
}

void SelectionStateManager::applyBulkAction(FileNode& tree, BulkAction action,
                                            const std::string& arg, const GitStatus& git) {
    switch (action) {
        case BulkAction::SelectAll:
            setAll(tree, true);
            updateParent(tree);
            break;
        case BulkAction::SelectNone:
            setAll(tree, false);
            break;
        case BulkAction::SelectExtension:
            if (arg.empty()) {
                throw std::invalid_argument("Extension filter requires an extension");
            }
            selectByExtension(tree, arg);
            break;
        case BulkAction::SelectSource:
            selectSourceFiles(tree);
            break;
        case BulkAction::SelectConfig:
            selectConfigFiles(tree);
            break;
        case BulkAction::SelectGitChanged:
            selectGitChanged(tree, git);
            break;
    }
}

std::string SelectionStateManager::getSelectionExtension(const std::string& name) {
    std::string lower = toLower(name);
    size_t dot = lower.rfind('.');
    if (dot == std::string::npos) {
        return lower;
    }
    return lower.substr(dot + 1);
}

const std::set<std::string>& SelectionStateManager::getSourceExtensions() {
    static const std::set<std::string> extensions = {
        "rs", "ts", "tsx", "js", "jsx", "vue", "svelte", "py", "kt", "kts",
        "java", "dart", "go", "rb", "php", "swift", "c", "cpp", "h", "hpp",
        "cs", "m", "mm", "scala", "clj", "ex", "exs", "hs", "lua", "r", "jl",
        "sh", "bash", "bat", "ps1", "sql"
    };
    return extensions;
}

const std::set<std::string>& SelectionStateManager::getConfigExtensions() {
    static const std::set<std::string> extensions = {
        "json", "yaml", "yml", "toml", "xml", "ini", "cfg", "conf", "env",
        "properties", "editorconfig", "eslintrc", "prettierrc", "gitignore",
        "dockerfile", "makefile"
    };
    return extensions;
}

} // namespace CodePack
