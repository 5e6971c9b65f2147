// =================================================================
// include/CodePack/ExclusionMatcher.hpp
// =================================================================
// Header for path-segment exclusion rules (built-in, user and plugin).

#pragma once

#include <string>
#include <vector>

namespace CodePack {

/**
 * @brief Decides whether a single path segment is excluded from a scan
 *
 * Rules are exact names or simple globs (`*` and `?`) compared ASCII
 * case-insensitively against one file or directory name, never against a
 * whole path. A trailing `/` restricts a rule to directories. The built-in
 * names are always present; user and plugin rules only add to them.
 */
class ExclusionMatcher {
public:
    /**
     * @brief Construct a matcher seeded with the built-in directory names
     */
    ExclusionMatcher();

    /**
     * @brief Add a user rule (e.g. "*.log", "fixtures/", "secrets.txt")
     * @param rule Rule text; blank lines, `#` comments, `!` negations and
     *             multi-segment paths are skipped
     * @return True if a rule was added
     */
    bool addRule(const std::string& rule);

    /**
     * @brief Add directory-only rules contributed by a plugin
     * @param dir_names Directory names or globs
     */
    void addDirectoryRules(const std::vector<std::string>& dir_names);

    /**
     * @brief Load one rule per line from an ignore file (e.g. .codepackignore)
     * @param file_path Path to ignore file
     * @return Number of rules loaded (0 if the file does not exist)
     */
    size_t loadFromFile(const std::string& file_path);

    /**
     * @brief Check whether a segment is excluded
     * @param name File or directory name (no separators)
     * @param is_directory True if the segment is a directory
     * @return true if the segment matches any rule
     */
    bool isExcluded(const std::string& name, bool is_directory) const;

    /**
     * @brief Number of active rules, built-ins included
     */
    size_t size() const { return m_rules.size(); }

    /**
     * @brief Built-in excluded directory names
     */
    static const std::vector<std::string>& getBuiltinNames();

    /**
     * @brief Case-insensitive glob match supporting `*` and `?`
     * @param pattern Glob pattern
     * @param name Segment to test
     * @return true if the whole segment matches
     */
    static bool globMatch(const std::string& pattern, const std::string& name);

private:
    struct Rule {
        std::string pattern;       ///< Lowercased
        bool directory_only;
        bool is_glob;
    };

    std::vector<Rule> m_rules;

    void addNormalizedRule(std::string pattern, bool directory_only);
};

} // namespace CodePack
