// =================================================================
// src/CodePack/Packer.cpp
// =================================================================
// Implementation for serializing a file selection.

#include "CodePack/Packer.hpp"
#include "CodePack/MetadataExtractor.hpp"
#include "CodePack/SecretScanner.hpp"
#include "CodePack/TokenEstimator.hpp"
#include "CodePack/SysInteraction.hpp"
#include "CodePack/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>
#include <sstream>
#include <stdexcept>

namespace CodePack {

namespace fs = std::filesystem;

static std::string toLower(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

static std::string extensionOf(const std::string& relative_path) {
    std::string ext = fs::path(relative_path).extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext.erase(ext.begin());
    }
    return toLower(ext);
}

static std::string join(const std::vector<std::string>& values, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += values[i];
    }
    return out;
}

static void appendWithNewline(std::string& out, const std::string& text) {
    out += text;
    if (text.empty() || text.back() != '\n') {
        out += '\n';
    }
}

static std::vector<std::string> splitComponents(const std::string& relative) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : relative) {
        if (c == '/') {
            if (!current.empty()) {
                parts.push_back(current);
            }
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

namespace {

struct OverviewNode {
    std::string name;
    std::vector<OverviewNode> children;
};

OverviewNode& childNamed(OverviewNode& node, const std::string& name) {
    for (auto& child : node.children) {
        if (child.name == name) {
            return child;
        }
    }
    node.children.push_back({name, {}});
    return node.children.back();
}

void renderOverview(const OverviewNode& node, const std::string& prefix, bool is_root,
                    std::vector<std::string>& lines) {
    for (size_t i = 0; i < node.children.size(); ++i) {
        const OverviewNode& child = node.children[i];
        bool is_last = i + 1 == node.children.size();
        bool has_children = !child.children.empty();

        if (is_root) {
            lines.push_back(has_children ? child.name + "/" : child.name);
            if (has_children) {
                renderOverview(child, "  ", false, lines);
            }
            continue;
        }

        const std::string connector = is_last ? "└── " : "├── ";
        lines.push_back(prefix + connector + child.name + (has_children ? "/" : ""));
        if (has_children) {
            renderOverview(child, prefix + (is_last ? "    " : "│   "), false, lines);
        }
    }
}

} // namespace

PackResult Packer::pack(const PackRequest& request) {
    if (request.paths.empty()) {
        throw std::invalid_argument("No files selected for packing");
    }

    m_last_stats.clear();
    SysInteraction sys;
    const size_t limit = request.max_file_bytes > 0 ? request.max_file_bytes : DEFAULT_MAX_FILE_BYTES;

    PackResult result;
    std::string body;
    std::vector<std::string> included;

    for (const auto& path : orderPaths(request.paths, request.project_path)) {
        const std::string relative = relativePath(path, request.project_path);

        std::error_code ec;
        auto size = fs::file_size(path, ec);
        if (ec) {
            result.skipped_files.push_back({relative, "unreadable", 0});
            LOG_DEBUG("Packer", "Cannot stat " + path, ec.message());
            continue;
        }
        size_t size_bytes = static_cast<size_t>(size);

        if (size_bytes > limit) {
            result.skipped_files.push_back({relative, "limit", size_bytes});
            body += buildSkippedPlaceholder(relative, size_bytes, limit, request.format);
            continue;
        }

        std::string content;
        try {
            content = sys.readFile(path);
        } catch (const std::exception& e) {
            result.skipped_files.push_back({relative, "unreadable", size_bytes});
            LOG_DEBUG("Packer", "Cannot read " + path, e.what());
            continue;
        }

        if (SysInteraction::isBinaryContent(content)) {
            result.skipped_files.push_back({relative, "binary", size_bytes});
            continue;
        }

        if (result.file_count >= MAX_FILE_COUNT) {
            result.skipped_files.push_back({relative, "file-count", size_bytes});
            continue;
        }

        body += buildFileSection(relative, content, request.format);
        included.push_back(relative);
        result.total_bytes += content.size();
        ++result.file_count;
    }

    result.estimated_tokens = TokenEstimator::estimateTokens(result.total_bytes);

    ProjectMetadata meta = MetadataExtractor::extract(request.project_path, request.project_type);

    std::string content = buildHeader(meta, result.file_count, result.estimated_tokens, request.format);
    content += buildInstruction(request.instruction, request.format);
    content += buildTreeSection(included, request.format);
    content += body;

    std::string diff_section;
    if (request.include_diff) {
        diff_section = buildDiffSection(request.diffs, request.project_path, request.format);
    }

    if (request.format == ExportFormat::Xml) {
        content += "</files>\n";
        content += diff_section;
        content += "</codepack>\n";
    } else {
        content += diff_section;
    }

    size_t masked = 0;
    if (request.mask_secrets) {
        std::vector<SecretMatch> matches = SecretScanner::scan(content);
        masked = matches.size();
        if (!matches.empty()) {
            content = SecretScanner::mask(content, matches);
            LOG_INFO("Packer", "Masked " + std::to_string(masked) + " secret matches");
        }
    }

    result.content = content;

    m_last_stats["files_included"] = result.file_count;
    m_last_stats["files_skipped"] = result.skipped_files.size();
    m_last_stats["bytes_included"] = result.total_bytes;
    m_last_stats["tokens_estimated"] = result.estimated_tokens;
    m_last_stats["secrets_masked"] = masked;
    m_last_stats["output_bytes"] = result.content.size();

    Logger::getInstance().logPackCompleted(result, exportFormatToString(request.format));
    return result;
}

bool Packer::exportToFile(const PackResult& result, const std::string& output_path) {
    SysInteraction sys;
    if (!sys.writeFileAtomic(output_path, result.content)) {
        LOG_ERROR("Packer", "Failed to write export", output_path);
        return false;
    }
    LOG_INFO("Packer", "Exported " + std::to_string(result.content.size()) + " bytes to " + output_path);
    return true;
}

std::unordered_map<std::string, size_t> Packer::getLastPackStats() const {
    return m_last_stats;
}

std::string Packer::buildHeader(const ProjectMetadata& meta, size_t file_count,
                                size_t estimated_tokens, ExportFormat format) const {
    const std::string tokens = TokenEstimator::formatTokens(estimated_tokens);
    std::ostringstream h;

    switch (format) {
        case ExportFormat::Plain:
            h << "# Project: " << meta.name << "\n";
            h << "# Type: " << meta.project_type << "\n";
            if (!meta.version.empty()) h << "# Version: " << meta.version << "\n";
            if (!meta.description.empty()) h << "# Description: " << meta.description << "\n";
            if (!meta.entry_point.empty()) h << "# Entry Point: " << meta.entry_point << "\n";
            if (!meta.runtime.empty()) h << "# Runtime: " << join(meta.runtime, ", ") << "\n";
            if (!meta.dependencies.empty()) h << "# Dependencies: " << join(meta.dependencies, ", ") << "\n";
            if (!meta.dev_dependencies.empty()) {
                h << "# Dev Dependencies: " << join(meta.dev_dependencies, ", ") << "\n";
            }
            if (!meta.requirements.empty()) {
                h << "# Requirements:\n";
                for (const auto& req : meta.requirements) {
                    h << "#   " << req << "\n";
                }
            }
            h << "# Files: " << file_count << "\n";
            h << "# Estimated Tokens: " << tokens << "\n";
            h << std::string(60, '=') << "\n\n";
            break;

        case ExportFormat::Markdown:
            h << "# " << meta.name << "\n\n";
            h << "- **Type:** " << meta.project_type << "\n";
            if (!meta.version.empty()) h << "- **Version:** " << meta.version << "\n";
            if (!meta.description.empty()) h << "- **Description:** " << meta.description << "\n";
            if (!meta.entry_point.empty()) h << "- **Entry Point:** `" << meta.entry_point << "`\n";
            if (!meta.runtime.empty()) h << "- **Runtime:** " << join(meta.runtime, ", ") << "\n";
            if (!meta.dependencies.empty()) {
                h << "- **Dependencies (" << meta.dependencies.size() << "):** "
                  << join(meta.dependencies, ", ") << "\n";
            }
            if (!meta.dev_dependencies.empty()) {
                h << "- **Dev Dependencies (" << meta.dev_dependencies.size() << "):** "
                  << join(meta.dev_dependencies, ", ") << "\n";
            }
            if (!meta.requirements.empty()) {
                h << "- **Requirements:**\n";
                for (const auto& req : meta.requirements) {
                    h << "  - `" << req << "`\n";
                }
            }
            h << "- **Files:** " << file_count << "\n";
            h << "- **Estimated Tokens:** " << tokens << "\n";
            h << "\n---\n\n";
            break;

        case ExportFormat::Xml:
            h << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
            h << "<codepack>\n<metadata>\n";
            h << "  <name>" << xmlEscape(meta.name) << "</name>\n";
            h << "  <type>" << xmlEscape(meta.project_type) << "</type>\n";
            if (!meta.version.empty()) h << "  <version>" << xmlEscape(meta.version) << "</version>\n";
            if (!meta.description.empty()) {
                h << "  <description>" << xmlEscape(meta.description) << "</description>\n";
            }
            if (!meta.entry_point.empty()) {
                h << "  <entry_point>" << xmlEscape(meta.entry_point) << "</entry_point>\n";
            }
            if (!meta.runtime.empty()) {
                h << "  <runtime>\n";
                for (const auto& env : meta.runtime) {
                    h << "    <env>" << xmlEscape(env) << "</env>\n";
                }
                h << "  </runtime>\n";
            }
            if (!meta.dependencies.empty()) {
                h << "  <dependencies>\n";
                for (const auto& dep : meta.dependencies) {
                    h << "    <dep>" << xmlEscape(dep) << "</dep>\n";
                }
                h << "  </dependencies>\n";
            }
            if (!meta.requirements.empty()) {
                h << "  <requirements>\n";
                for (const auto& req : meta.requirements) {
                    h << "    <req>" << xmlEscape(req) << "</req>\n";
                }
                h << "  </requirements>\n";
            }
            h << "  <file_count>" << file_count << "</file_count>\n";
            h << "  <estimated_tokens>" << tokens << "</estimated_tokens>\n";
            h << "</metadata>\n";
            break;
    }

    return h.str();
}

std::string Packer::buildInstruction(const std::string& instruction, ExportFormat format) const {
    if (instruction.empty()) {
        return "";
    }

    std::string out;
    switch (format) {
        case ExportFormat::Plain:
            out += "# ----- Review Instructions -----\n";
            appendWithNewline(out, instruction);
            out += "\n";
            break;
        case ExportFormat::Markdown:
            out += "## Review Instructions\n\n";
            appendWithNewline(out, instruction);
            out += "\n";
            break;
        case ExportFormat::Xml:
            out += "<instruction>\n" + cdataWrap(instruction) + "\n</instruction>\n";
            break;
    }
    return out;
}

std::string Packer::buildTreeSection(const std::vector<std::string>& relative_paths, ExportFormat format) const {
    std::string out;
    if (format == ExportFormat::Xml) {
        if (!relative_paths.empty()) {
            std::string tree;
            for (const auto& line : buildTreeOverview(relative_paths)) {
                tree += line + "\n";
            }
            out += "<file_tree>\n" + cdataWrap(tree) + "\n</file_tree>\n";
        }
        out += "<files>\n\n";
        return out;
    }

    if (relative_paths.empty()) {
        return out;
    }

    std::vector<std::string> lines = buildTreeOverview(relative_paths);
    if (format == ExportFormat::Plain) {
        out += "# File Tree:\n";
        for (const auto& line : lines) {
            out += "#   " + line + "\n";
        }
        out += "#\n\n";
    } else {
        out += "## File Tree\n\n```\n";
        for (const auto& line : lines) {
            out += line + "\n";
        }
        out += "```\n\n";
    }
    return out;
}

std::string Packer::buildFileSection(const std::string& relative, const std::string& content,
                                     ExportFormat format) const {
    std::string out;
    switch (format) {
        case ExportFormat::Plain:
            // Banner, raw content, blank line; splitting on banners recovers the content
            out += commentDelimiter(relative) + " ===== " + relative + " =====\n";
            out += content;
            out += "\n\n";
            break;
        case ExportFormat::Markdown: {
            const std::string fence = markdownFence(content);
            out += "## " + relative + "\n\n";
            out += fence + markdownLanguage(relative) + "\n";
            appendWithNewline(out, content);
            out += fence + "\n\n";
            break;
        }
        case ExportFormat::Xml:
            out += "<file path=\"" + xmlEscape(relative) + "\">\n";
            out += cdataWrap(content);
            out += "\n</file>\n\n";
            break;
    }
    return out;
}

std::string Packer::buildSkippedPlaceholder(const std::string& relative, size_t size_bytes,
                                            size_t limit, ExportFormat format) const {
    const std::string size_kb = std::to_string(size_bytes / 1024);
    const std::string limit_kb = std::to_string(limit / 1024);

    switch (format) {
        case ExportFormat::Plain:
            // Own banner line, so the previous section ends before it
            return commentDelimiter(relative) + " ===== " + relative + " [SKIPPED: " + size_kb +
                   "KB > " + limit_kb + "KB limit] =====\n\n";
        case ExportFormat::Markdown:
            return "*" + relative + " skipped: " + size_kb + "KB > " + limit_kb + "KB limit*\n\n";
        case ExportFormat::Xml:
            return "<file path=\"" + xmlEscape(relative) + "\" skipped=\"true\" size_kb=\"" +
                   size_kb + "\" />\n\n";
    }
    return "";
}

std::string Packer::buildDiffSection(const std::map<std::string, std::string>& diffs,
                                     const std::string& project_path, ExportFormat format) const {
    if (diffs.empty()) {
        return "";
    }

    // Keys are absolute, so ordering by relative path needs a second map
    std::map<std::string, std::string> by_relative;
    for (const auto& entry : diffs) {
        by_relative[relativePath(entry.first, project_path)] = entry.second;
    }

    std::string out;
    switch (format) {
        case ExportFormat::Plain:
            out += "# ----- Git Diff (Working Changes) -----\n\n";
            for (const auto& entry : by_relative) {
                out += "# --- " + entry.first + " ---\n";
                appendWithNewline(out, entry.second);
                out += "\n";
            }
            break;
        case ExportFormat::Markdown:
            out += "## Git Diff (Working Changes)\n\n";
            for (const auto& entry : by_relative) {
                const std::string fence = markdownFence(entry.second);
                out += "### " + entry.first + "\n\n" + fence + "diff\n";
                appendWithNewline(out, entry.second);
                out += fence + "\n\n";
            }
            break;
        case ExportFormat::Xml:
            out += "<diffs>\n";
            for (const auto& entry : by_relative) {
                out += "<diff path=\"" + xmlEscape(entry.first) + "\">\n";
                out += cdataWrap(entry.second);
                out += "\n</diff>\n";
            }
            out += "</diffs>\n";
            break;
    }
    return out;
}

std::string Packer::commentDelimiter(const std::string& relative_path) {
    static const std::set<std::string> hash_exts = {
        "py", "rb", "sh", "bash", "zsh", "fish", "yaml", "yml", "toml",
        "ini", "cfg", "conf", "r", "jl", "pl"
    };

    const std::string ext = extensionOf(relative_path);
    if (ext == "html" || ext == "xml" || ext == "svg" || ext == "vue" || ext == "svelte") {
        return "<!--";
    }
    if (ext == "css" || ext == "scss" || ext == "sass" || ext == "less") {
        return "/*";
    }
    if (hash_exts.count(ext) > 0) {
        return "#";
    }
    if (ext == "sql" || ext == "lua" || ext == "hs") {
        return "--";
    }
    if (ext == "bat") {
        return "REM";
    }
    return "//";
}

std::string Packer::markdownLanguage(const std::string& relative_path) {
    static const std::map<std::string, std::string> languages = {
        {"rs", "rust"}, {"py", "python"}, {"js", "javascript"}, {"jsx", "jsx"},
        {"ts", "typescript"}, {"tsx", "tsx"}, {"rb", "ruby"}, {"kt", "kotlin"},
        {"kts", "kotlin"}, {"cs", "csharp"}, {"cc", "cpp"}, {"cxx", "cpp"},
        {"hpp", "cpp"}, {"h", "c"}, {"sh", "bash"}, {"zsh", "bash"}, {"yml", "yaml"},
        {"md", "markdown"}, {"ps1", "powershell"}, {"hs", "haskell"}, {"ex", "elixir"},
        {"exs", "elixir"}, {"jl", "julia"}, {"tf", "hcl"}, {"gql", "graphql"}
    };

    const std::string ext = extensionOf(relative_path);
    auto it = languages.find(ext);
    return it != languages.end() ? it->second : ext;
}

std::string Packer::xmlEscape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::string Packer::cdataWrap(const std::string& text) {
    std::string body;
    size_t start = 0;
    size_t pos = text.find("]]>");
    while (pos != std::string::npos) {
        body += text.substr(start, pos - start) + "]]]]><![CDATA[>";
        start = pos + 3;
        pos = text.find("]]>", start);
    }
    body += text.substr(start);

    std::string out = "<![CDATA[\n";
    appendWithNewline(out, body);
    out += "]]>";
    return out;
}

std::string Packer::markdownFence(const std::string& content) {
    size_t longest = 0;
    size_t run = 0;
    for (char c : content) {
        if (c == '`') {
            longest = std::max(longest, ++run);
        } else {
            run = 0;
        }
    }
    return std::string(std::max<size_t>(3, longest + 1), '`');
}

std::vector<std::string> Packer::orderPaths(const std::vector<std::string>& paths,
                                            const std::string& project_path) {
    std::vector<std::string> unique;
    std::set<std::string> seen;
    for (const auto& path : paths) {
        if (seen.insert(path).second) {
            unique.push_back(path);
        }
    }

    std::vector<std::pair<std::vector<std::string>, std::string>> keyed;
    for (const auto& path : unique) {
        keyed.push_back({splitComponents(relativePath(path, project_path)), path});
    }

    std::sort(keyed.begin(), keyed.end(), [](const auto& lhs, const auto& rhs) {
        const auto& a = lhs.first;
        const auto& b = rhs.first;
        size_t common = std::min(a.size(), b.size());
        for (size_t i = 0; i < common; ++i) {
            if (a[i] == b[i]) {
                continue;
            }
            bool a_dir = i + 1 < a.size();
            bool b_dir = i + 1 < b.size();
            if (a_dir != b_dir) {
                return a_dir;
            }
            std::string left = toLower(a[i]);
            std::string right = toLower(b[i]);
            if (left != right) {
                return left < right;
            }
            return a[i] < b[i];
        }
        if (a.size() != b.size()) {
            return a.size() > b.size();
        }
        return lhs.second < rhs.second;
    });

    std::vector<std::string> ordered;
    for (const auto& entry : keyed) {
        ordered.push_back(entry.second);
    }
    return ordered;
}

std::string Packer::relativePath(const std::string& path, const std::string& project_path) {
    if (project_path.empty()) {
        return fs::path(path).generic_string();
    }
    fs::path relative = fs::path(path).lexically_normal()
                            .lexically_relative(fs::path(project_path).lexically_normal());
    std::string rel = relative.generic_string();
    if (rel.empty() || rel == "." || rel.compare(0, 2, "..") == 0) {
        return fs::path(path).generic_string();
    }
    return rel;
}

std::vector<std::string> Packer::buildTreeOverview(const std::vector<std::string>& relative_paths) {
    OverviewNode root;
    for (const auto& path : relative_paths) {
        OverviewNode* current = &root;
        for (const auto& part : splitComponents(path)) {
            current = &childNamed(*current, part);
        }
    }

    std::vector<std::string> lines;
    renderOverview(root, "", true, lines);
    return lines;
}

} // namespace CodePack
