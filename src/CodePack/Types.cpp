// =================================================================
// src/CodePack/Types.cpp
// =================================================================
// Helpers for the shared data model.

#include "CodePack/Types.hpp"
#include <algorithm>
#include <cctype>

namespace CodePack {

bool operator==(const FileNode& lhs, const FileNode& rhs) {
    return lhs.name == rhs.name &&
           lhs.path == rhs.path &&
           lhs.is_dir == rhs.is_dir &&
           lhs.checked == rhs.checked &&
           lhs.indeterminate == rhs.indeterminate &&
           lhs.children == rhs.children;
}

bool operator!=(const FileNode& lhs, const FileNode& rhs) {
    return !(lhs == rhs);
}

std::string exportFormatToString(ExportFormat format) {
    switch (format) {
        case ExportFormat::Plain: return "plain";
        case ExportFormat::Markdown: return "markdown";
        case ExportFormat::Xml: return "xml";
        default: return "plain";
    }
}

bool parseExportFormat(const std::string& text, ExportFormat& format) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "plain" || lower == "txt" || lower == "text") {
        format = ExportFormat::Plain;
        return true;
    }
    if (lower == "markdown" || lower == "md") {
        format = ExportFormat::Markdown;
        return true;
    }
    if (lower == "xml") {
        format = ExportFormat::Xml;
        return true;
    }
    return false;
}

std::string secretTypeToString(SecretType type) {
    switch (type) {
        case SecretType::ApiKey: return "ApiKey";
        case SecretType::PrivateKey: return "PrivateKey";
        case SecretType::Password: return "Password";
        default: return "Unknown";
    }
}

} // namespace CodePack
