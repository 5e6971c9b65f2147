// =================================================================
// src/CodePack/TreeScanner.cpp
// =================================================================
// Implementation for the depth-first project tree walk.

#include "CodePack/TreeScanner.hpp"
#include "CodePack/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace CodePack {

namespace fs = std::filesystem;

static std::string toLower(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

TreeScanner::TreeScanner(const std::string& root_path, const ScanOptions& options)
    : m_root_path(normalizeRoot(root_path)),
      m_options(options),
      m_error_count(0)
{
    for (const auto& rule : m_options.exclude_rules) {
        m_matcher.addRule(rule);
    }

    if (m_options.use_ignore_file) {
        size_t loaded = m_matcher.loadFromFile((fs::path(m_root_path) / ".codepackignore").string());
        if (loaded > 0) {
            LOG_INFO("TreeScanner", "Loaded .codepackignore with " + std::to_string(loaded) + " rules");
        }
    }

    if (m_options.use_git_ignore) {
        const fs::path root(m_root_path);
        for (const auto& ignore_file : {root / ".gitignore", root / ".git" / "info" / "exclude"}) {
            size_t loaded = m_matcher.loadFromFile(ignore_file.string());
            if (loaded > 0) {
                LOG_DEBUG("TreeScanner", "Loaded " + std::to_string(loaded) + " rules from " + ignore_file.string());
            }
        }
    }
}

void TreeScanner::addPluginExcludes(const std::vector<std::string>& dir_names) {
    m_matcher.addDirectoryRules(dir_names);
}

void TreeScanner::addSourceExtension(const std::string& extension) {
    std::string ext = toLower(extension);
    while (!ext.empty() && ext.front() == '.') {
        ext.erase(ext.begin());
    }
    if (!ext.empty()) {
        m_extra_extensions.insert(ext);
    }
}

FileNode TreeScanner::scan() {
    m_error_count = 0;

    fs::path root(m_root_path);
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw std::invalid_argument("Scan root is not a directory: " + m_root_path);
    }

    FileNode root_node;
    root_node.name = root.filename().string();
    if (root_node.name.empty()) {
        root_node.name = m_root_path;
    }
    root_node.path = m_root_path;
    root_node.is_dir = true;

    scanDirectory(root, root_node);

    if (m_error_count > 0) {
        LOG_WARNING("TreeScanner", "Skipped unreadable entries",
                    std::to_string(m_error_count) + " entries under " + m_root_path);
    }
    return root_node;
}

void TreeScanner::scanDirectory(const fs::path& dir, FileNode& node) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        ++m_error_count;
        LOG_DEBUG("TreeScanner", "Cannot open directory " + dir.string(), ec.message());
        return;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }

        const fs::path& entry_path = it->path();
        std::string name = entry_path.filename().string();

        if (!m_options.include_hidden && !name.empty() && name[0] == '.') {
            continue;
        }

        std::error_code status_ec;
        fs::file_status status = it->symlink_status(status_ec);
        if (status_ec) {
            ++m_error_count;
            LOG_DEBUG("TreeScanner", "Cannot stat " + entry_path.string(), status_ec.message());
            continue;
        }
        if (fs::is_symlink(status)) {
            continue;
        }

        if (fs::is_directory(status)) {
            if (m_matcher.isExcluded(name, true)) {
                continue;
            }

            FileNode child;
            child.name = name;
            child.path = entry_path.string();
            child.is_dir = true;
            scanDirectory(entry_path, child);

            if (!child.children.empty()) {
                node.children.push_back(std::move(child));
            }
        } else if (fs::is_regular_file(status)) {
            if (m_matcher.isExcluded(name, false) || !isSourceFile(name, m_extra_extensions)) {
                continue;
            }

            if (m_options.max_file_bytes > 0) {
                std::error_code size_ec;
                auto size = it->file_size(size_ec);
                if (size_ec) {
                    ++m_error_count;
                    continue;
                }
                if (size > m_options.max_file_bytes) {
                    continue;
                }
            }

            FileNode leaf;
            leaf.name = name;
            leaf.path = entry_path.string();
            leaf.is_dir = false;
            node.children.push_back(std::move(leaf));
        }
    }

    if (ec) {
        ++m_error_count;
        LOG_DEBUG("TreeScanner", "Directory listing interrupted in " + dir.string(), ec.message());
    }

    std::sort(node.children.begin(), node.children.end(), siblingLess);
}

size_t TreeScanner::countFiles(const FileNode& node) {
    if (!node.is_dir) {
        return 1;
    }
    size_t count = 0;
    for (const auto& child : node.children) {
        count += countFiles(child);
    }
    return count;
}

bool TreeScanner::isSourceFile(const std::string& name,
                               const std::unordered_set<std::string>& extra_extensions) {
    static const std::unordered_set<std::string> special_names = {
        "dockerfile", "makefile", "cmakelists.txt", "rakefile", "gemfile",
        "procfile", "justfile", "taskfile", "vagrantfile"
    };

    std::string lower = toLower(name);
    if (special_names.count(lower) > 0) {
        return true;
    }

    size_t dot = lower.rfind('.');
    if (dot == std::string::npos || dot + 1 >= lower.size()) {
        return false;
    }
    std::string ext = lower.substr(dot + 1);

    return getDefaultSourceExtensions().count(ext) > 0 || extra_extensions.count(ext) > 0;
}

const std::unordered_set<std::string>& TreeScanner::getDefaultSourceExtensions() {
    static const std::unordered_set<std::string> extensions = {
        "rs", "ts", "tsx", "js", "jsx", "mjs", "cjs", "vue", "svelte", "py", "pyi",
        "kt", "kts", "java", "dart", "go", "rb", "php", "swift",
        "c", "cc", "cpp", "cxx", "h", "hh", "hpp", "hxx", "cs", "m", "mm",
        "scala", "clj", "ex", "exs", "hs", "lua", "r", "jl", "sql",
        "sh", "bash", "zsh", "fish", "bat", "ps1",
        "yml", "yaml", "toml", "json", "xml", "html", "css", "scss", "sass", "less",
        "md", "mdx", "txt", "rst", "cfg", "ini", "conf", "env",
        "dockerfile", "makefile", "cmake", "gradle", "properties",
        "gitignore", "editorconfig", "eslintrc", "prettierrc",
        "graphql", "gql", "proto", "tf", "hcl", "nix", "astro",
        "mod", "sum", "lock"
    };
    return extensions;
}

std::string TreeScanner::normalizeRoot(const std::string& root_path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(fs::path(root_path), ec);
    if (ec) {
        absolute = fs::path(root_path);
    }
    absolute = absolute.lexically_normal();

    std::string normalized = absolute.string();
    while (normalized.size() > 1 && normalized.back() == fs::path::preferred_separator) {
        normalized.pop_back();
    }
    return normalized;
}

bool TreeScanner::siblingLess(const FileNode& lhs, const FileNode& rhs) {
    if (lhs.is_dir != rhs.is_dir) {
        return lhs.is_dir;
    }
    std::string left = toLower(lhs.name);
    std::string right = toLower(rhs.name);
    if (left != right) {
        return left < right;
    }
    return lhs.name < rhs.name;
}

} // namespace CodePack
