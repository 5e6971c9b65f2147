// =================================================================
// include/CodePack/TreeScanner.hpp
// =================================================================
// Header for the depth-first project tree walk.

#pragma once

#include "CodePack/Types.hpp"
#include "CodePack/ExclusionMatcher.hpp"
#include <string>
#include <vector>
#include <unordered_set>
#include <filesystem>

namespace CodePack {

/**
 * @brief Knobs for a single scan
 */
struct ScanOptions {
    bool include_hidden = false;           ///< Keep entries whose name starts with '.'
    size_t max_file_bytes = 0;             ///< Drop larger files; 0 disables the cap
    bool use_ignore_file = true;           ///< Read <root>/.codepackignore
    bool use_git_ignore = true;            ///< Read <root>/.gitignore and .git/info/exclude
    std::vector<std::string> exclude_rules;
};

/**
 * @brief Walks a project root and builds a sorted FileNode tree
 *
 * Directories matched by the exclusion rules are pruned without being
 * entered, symbolic links are never followed, and an entry that cannot be
 * read is left out while the walk continues. Only source files are kept and
 * directories left without files are dropped. Every node comes back
 * unchecked.
 */
class TreeScanner {
public:
    /**
     * @brief Construct a scanner
     * @param root_path Directory to scan
     * @param options Scan options
     */
    TreeScanner(const std::string& root_path, const ScanOptions& options = ScanOptions());

    /**
     * @brief Add exclusion rules contributed by a plugin
     * @param dir_names Directory names or globs
     */
    void addPluginExcludes(const std::vector<std::string>& dir_names);

    /**
     * @brief Accept an extra source extension (with or without the dot)
     * @param extension File extension such as "cs" or ".unity"
     */
    void addSourceExtension(const std::string& extension);

    /**
     * @brief Walk the tree
     *
     * Throws std::invalid_argument if the root is not a directory.
     * @return Root node
     */
    FileNode scan();

    /**
     * @brief Entries skipped because of I/O errors during the last scan
     */
    size_t getErrorCount() const { return m_error_count; }

    const std::string& getRootPath() const { return m_root_path; }

    /**
     * @brief Number of files (leaves) below a node
     */
    static size_t countFiles(const FileNode& node);

    /**
     * @brief Check a file name against the source allow-list
     * @param name File name
     * @param extra_extensions Additional lowercase extensions without dots
     * @return true if the file should appear in the tree
     */
    static bool isSourceFile(const std::string& name,
                             const std::unordered_set<std::string>& extra_extensions);

    /**
     * @brief Default source extensions (lowercase, no dot)
     */
    static const std::unordered_set<std::string>& getDefaultSourceExtensions();

    /**
     * @brief Absolute, normalized form of a root path without a trailing separator
     */
    static std::string normalizeRoot(const std::string& root_path);

    /**
     * @brief Sibling order: directories first, then case-insensitive name
     */
    static bool siblingLess(const FileNode& lhs, const FileNode& rhs);

private:
    std::string m_root_path;
    ScanOptions m_options;
    ExclusionMatcher m_matcher;
    std::unordered_set<std::string> m_extra_extensions;
    size_t m_error_count;

    void scanDirectory(const std::filesystem::path& dir, FileNode& node);
};

} // namespace CodePack
