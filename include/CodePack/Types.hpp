// =================================================================
// include/CodePack/Types.hpp
// =================================================================
// Shared data model for the scan / select / redact / pack pipeline.

#pragma once

#include <string>
#include <vector>
#include <map>
#include <cstddef>

namespace CodePack {

/**
 * @brief One entry of the scanned project tree
 *
 * Children are owned by value and kept sorted directories-first, then by
 * case-insensitive name. `checked` and `indeterminate` are derived state
 * maintained by SelectionStateManager.
 */
struct FileNode {
    std::string name;
    std::string path;              ///< Absolute path
    bool is_dir = false;
    std::vector<FileNode> children;
    bool checked = false;
    bool indeterminate = false;
};

/**
 * @brief Structural equality (names, paths, order and flags)
 */
bool operator==(const FileNode& lhs, const FileNode& rhs);
bool operator!=(const FileNode& lhs, const FileNode& rhs);

/**
 * @brief Manifest information extracted for the packed header
 *
 * Optional fields are left empty when the manifest does not provide them.
 */
struct ProjectMetadata {
    std::string name;
    std::string project_type;
    std::string version;
    std::string description;
    std::string entry_point;
    std::vector<std::string> dependencies;
    std::vector<std::string> dev_dependencies;
    std::vector<std::string> runtime;
    std::vector<std::string> requirements;
};

/**
 * @brief Data-only plugin that extends type detection and exclusion
 */
struct PluginDef {
    std::string name;
    std::string version;
    std::vector<std::string> detect_files;
    std::vector<std::string> detect_dirs;
    std::vector<std::string> exclude_dirs;
    std::vector<std::string> source_extensions;
};

enum class SecretType {
    ApiKey,
    PrivateKey,
    Password
};

struct SecretMatch {
    std::string rule_name;
    SecretType secret_type = SecretType::ApiKey;
    size_t line_number = 0;        ///< 1-based
    std::string match_content;
    size_t start_index = 0;        ///< Column span within the line
    size_t end_index = 0;
};

struct FileSecretReport {
    std::string path;
    std::vector<SecretMatch> matches;
};

/**
 * @brief Persisted per-project state, keyed by project root
 */
struct ProjectConfig {
    std::string project_path;
    std::vector<std::string> checked_paths;
    std::vector<std::string> excluded_paths;
    std::string last_opened;       ///< Seconds since epoch
    std::map<std::string, std::vector<std::string>> presets;
    bool pinned = false;
};

struct SkippedFile {
    std::string path;
    std::string reason;            ///< "binary", "limit", "unreadable" or "file-count"
    size_t size_bytes = 0;
};

struct PackResult {
    std::string content;
    size_t file_count = 0;
    size_t total_bytes = 0;
    size_t estimated_tokens = 0;
    std::vector<SkippedFile> skipped_files;
};

struct ChangedFile {
    std::string path;              ///< Absolute path
    std::string status;            ///< added, modified, deleted, renamed, typechange, unknown
};

struct GitStatus {
    bool is_repo = false;
    std::string branch;
    std::vector<ChangedFile> changed_files;
};

struct ScanResult {
    std::string project_type;
    FileNode tree;
    size_t total_files = 0;
    ProjectMetadata metadata;
};

/**
 * @brief Outcome of carrying a selection over to a fresh tree
 */
struct ReconcileReport {
    size_t added = 0;              ///< Files only present in the new tree
    size_t removed = 0;            ///< Files only present in the old tree
    size_t checked = 0;            ///< Checked files after reconciliation
    bool performed = true;         ///< False when a refresh was already running
};

struct TokenEstimate {
    size_t tokens = 0;
    size_t total_bytes = 0;
};

struct LangStat {
    std::string language;
    std::string extension;
    size_t file_count = 0;
    size_t line_count = 0;
    size_t byte_count = 0;
};

struct ProjectStats {
    size_t total_files = 0;
    size_t total_lines = 0;
    size_t total_bytes = 0;
    std::vector<LangStat> languages;
};

enum class ExportFormat {
    Plain,
    Markdown,
    Xml
};

/**
 * @brief Convert export format to its lowercase name
 */
std::string exportFormatToString(ExportFormat format);

/**
 * @brief Parse "plain", "markdown"/"md" or "xml" (case-insensitive)
 * @param text Format name
 * @param format Receives the parsed format
 * @return True if the name was recognized
 */
bool parseExportFormat(const std::string& text, ExportFormat& format);

std::string secretTypeToString(SecretType type);

} // namespace CodePack
