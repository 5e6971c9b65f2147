// =================================================================
// include/CodePack/MetadataExtractor.hpp
// =================================================================
// Header for manifest parsing (package.json, Cargo.toml, pyproject, ...).

#pragma once

#include "CodePack/Types.hpp"
#include <string>
#include <vector>
#include <filesystem>

namespace CodePack {

/**
 * @brief Reads project manifests into ProjectMetadata
 *
 * The manifest is chosen from the project type. A missing or malformed
 * manifest leaves the fields it would have filled empty; extraction never
 * throws. Dependency lists keep declaration order without duplicates and
 * `requirements` is capped at MAX_REQUIREMENTS entries.
 */
class MetadataExtractor {
public:
    static const size_t MAX_REQUIREMENTS = 50;

    /**
     * @brief Extract metadata for a scanned root
     * @param root_path Project root
     * @param project_type Type returned by ProjectClassifier
     * @return Metadata; name defaults to the root directory name
     */
    static ProjectMetadata extract(const std::string& root_path, const std::string& project_type);

    /**
     * @brief Text of the first <tag>...</tag> in a document, trimmed
     * @return Tag content, or an empty string if absent
     */
    static std::string extractXmlTag(const std::string& text, const std::string& tag);

    /**
     * @brief Package name from a requirement spec ("flask>=2.0" -> "flask")
     */
    static std::string requirementName(const std::string& requirement);

private:
    static void extractPackageJson(const std::filesystem::path& root, ProjectMetadata& meta);
    static void extractCargoToml(const std::filesystem::path& root, ProjectMetadata& meta);
    static void extractPython(const std::filesystem::path& root, ProjectMetadata& meta);
    static void extractGoMod(const std::filesystem::path& root, ProjectMetadata& meta);
    static void extractPubspec(const std::filesystem::path& root, ProjectMetadata& meta);
    static void extractPomXml(const std::filesystem::path& root, ProjectMetadata& meta);
    static void extractGradle(const std::filesystem::path& root, ProjectMetadata& meta);

    /**
     * @brief Deduplicate lists in order and apply the requirements cap
     */
    static void finalize(ProjectMetadata& meta);
};

} // namespace CodePack
