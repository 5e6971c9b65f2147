// =================================================================
// src/CodePack/StatsCalculator.cpp
// =================================================================
// Implementation for per-language statistics.

#include "CodePack/StatsCalculator.hpp"
#include "CodePack/SysInteraction.hpp"
#include "CodePack/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>

namespace CodePack {

namespace fs = std::filesystem;

ProjectStats StatsCalculator::computeStats(const std::vector<std::string>& file_paths) {
    SysInteraction sys;
    ProjectStats stats;
    std::map<std::string, LangStat> by_language;

    for (const auto& path : file_paths) {
        std::string content;
        try {
            content = sys.readFile(path);
        } catch (const std::exception& e) {
            LOG_DEBUG("StatsCalculator", "Skipping unreadable file " + path, e.what());
            continue;
        }
        if (SysInteraction::isBinaryContent(content)) {
            continue;
        }

        std::string ext = fs::path(path).extension().string();
        if (!ext.empty() && ext[0] == '.') {
            ext.erase(ext.begin());
        }
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (ext.empty()) {
            ext = "other";
        }

        size_t lines = countLines(content);
        stats.total_files += 1;
        stats.total_lines += lines;
        stats.total_bytes += content.size();

        const std::string language = extensionToLanguage(ext);
        auto it = by_language.find(language);
        if (it == by_language.end()) {
            LangStat entry;
            entry.language = language;
            entry.extension = ext;
            it = by_language.emplace(language, entry).first;
        }
        it->second.file_count += 1;
        it->second.line_count += lines;
        it->second.byte_count += content.size();
    }

    for (const auto& entry : by_language) {
        stats.languages.push_back(entry.second);
    }
    std::sort(stats.languages.begin(), stats.languages.end(), [](const LangStat& a, const LangStat& b) {
        if (a.line_count != b.line_count) {
            return a.line_count > b.line_count;
        }
        return a.language < b.language;
    });

    return stats;
}

std::string StatsCalculator::extensionToLanguage(const std::string& extension) {
    static const std::map<std::string, std::string> languages = {
        {"rs", "Rust"}, {"ts", "TypeScript"}, {"tsx", "TypeScript"},
        {"js", "JavaScript"}, {"jsx", "JavaScript"}, {"vue", "Vue"}, {"svelte", "Svelte"},
        {"py", "Python"}, {"kt", "Kotlin"}, {"kts", "Kotlin"}, {"java", "Java"},
        {"dart", "Dart"}, {"go", "Go"}, {"rb", "Ruby"}, {"php", "PHP"}, {"swift", "Swift"},
        {"c", "C"}, {"cpp", "C++"}, {"cc", "C++"}, {"cxx", "C++"},
        {"h", "C/C++ Header"}, {"hpp", "C/C++ Header"}, {"cs", "C#"}, {"scala", "Scala"},
        {"html", "HTML"}, {"css", "CSS"}, {"scss", "CSS (preprocessor)"},
        {"sass", "CSS (preprocessor)"}, {"less", "CSS (preprocessor)"},
        {"json", "JSON"}, {"yaml", "YAML"}, {"yml", "YAML"}, {"toml", "TOML"}, {"xml", "XML"},
        {"md", "Markdown"}, {"mdx", "Markdown"}, {"sql", "SQL"},
        {"sh", "Shell"}, {"bash", "Shell"}, {"zsh", "Shell"}, {"fish", "Shell"},
        {"bat", "PowerShell/Batch"}, {"ps1", "PowerShell/Batch"},
        {"graphql", "GraphQL"}, {"gql", "GraphQL"}, {"proto", "Protobuf"},
        {"tf", "Terraform/HCL"}, {"hcl", "Terraform/HCL"},
        {"lua", "Lua"}, {"r", "R"}, {"jl", "Julia"}
    };

    auto it = languages.find(extension);
    return it != languages.end() ? it->second : extension;
}

size_t StatsCalculator::countLines(const std::string& content) {
    if (content.empty()) {
        return 0;
    }
    size_t lines = static_cast<size_t>(std::count(content.begin(), content.end(), '\n'));
    if (content.back() != '\n') {
        ++lines;
    }
    return lines;
}

} // namespace CodePack
