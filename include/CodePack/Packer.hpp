// =================================================================
// include/CodePack/Packer.hpp
// =================================================================
// Header for serializing a file selection into an AI-ready document.

#pragma once

#include "CodePack/Types.hpp"
#include <string>
#include <vector>
#include <map>
#include <unordered_map>

namespace CodePack {

/**
 * @brief Everything needed to pack one selection
 */
struct PackRequest {
    std::vector<std::string> paths;              ///< Absolute file paths
    std::string project_path;
    std::string project_type;
    ExportFormat format = ExportFormat::Plain;
    size_t max_file_bytes = 1024 * 1024;         ///< Per-file cap
    bool include_diff = false;
    std::map<std::string, std::string> diffs;    ///< Absolute path -> unified diff
    std::string instruction;                     ///< Reviewer instruction, optional
    bool mask_secrets = false;
};

/**
 * @brief Builds the packed document in plain, Markdown or XML form
 *
 * The document is a project header, an optional instruction preamble, a
 * file-tree overview, one section per included file and an optional diff
 * section. Output depends only on the request and the file contents, so
 * packing the same selection twice yields identical bytes.
 */
class Packer {
public:
    static const size_t DEFAULT_MAX_FILE_BYTES = 1024 * 1024;
    static const size_t MAX_FILE_COUNT = 5000;

    Packer() = default;

    /**
     * @brief Pack a selection
     *
     * Throws std::invalid_argument when no paths are given. Oversized,
     * binary, unreadable and surplus files are reported in skipped_files.
     * @param request Selection and output options
     * @return Document and statistics
     */
    PackResult pack(const PackRequest& request);

    /**
     * @brief Write a packed document through a temporary file and rename
     * @return True on success
     */
    bool exportToFile(const PackResult& result, const std::string& output_path);

    /**
     * @brief Statistics from the last pack (files_included, files_skipped, ...)
     */
    std::unordered_map<std::string, size_t> getLastPackStats() const;

    /**
     * @brief Line-comment token used in plain-format banners
     */
    static std::string commentDelimiter(const std::string& relative_path);

    /**
     * @brief Fence language tag for a file
     */
    static std::string markdownLanguage(const std::string& relative_path);

    static std::string xmlEscape(const std::string& text);

    /**
     * @brief Wrap text in CDATA, splitting any embedded "]]>"
     */
    static std::string cdataWrap(const std::string& text);

    /**
     * @brief Backtick fence longer than any run inside the content
     */
    static std::string markdownFence(const std::string& content);

    /**
     * @brief Deduplicate paths and put them in tree order
     *
     * Paths are compared component by component with directories before
     * files and names compared case-insensitively.
     */
    static std::vector<std::string> orderPaths(const std::vector<std::string>& paths,
                                               const std::string& project_path);

    /**
     * @brief Path relative to the project root with '/' separators
     *
     * A path outside the root is returned unchanged.
     */
    static std::string relativePath(const std::string& path, const std::string& project_path);

    /**
     * @brief Box-drawing tree of relative paths, one line per entry
     */
    static std::vector<std::string> buildTreeOverview(const std::vector<std::string>& relative_paths);

private:
    std::unordered_map<std::string, size_t> m_last_stats;

    std::string buildHeader(const ProjectMetadata& meta, size_t file_count,
                            size_t estimated_tokens, ExportFormat format) const;
    std::string buildInstruction(const std::string& instruction, ExportFormat format) const;
    std::string buildTreeSection(const std::vector<std::string>& relative_paths, ExportFormat format) const;
    std::string buildFileSection(const std::string& relative, const std::string& content,
                                 ExportFormat format) const;
    std::string buildSkippedPlaceholder(const std::string& relative, size_t size_bytes,
                                        size_t limit, ExportFormat format) const;
    std::string buildDiffSection(const std::map<std::string, std::string>& diffs,
                                 const std::string& project_path, ExportFormat format) const;
};

} // namespace CodePack
