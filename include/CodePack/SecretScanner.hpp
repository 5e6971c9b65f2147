// =================================================================
// include/CodePack/SecretScanner.hpp
// =================================================================
// Header for secret detection and masking in selected files.

#pragma once

#include "CodePack/Types.hpp"
#include <string>
#include <vector>
#include <regex>

namespace CodePack {

/**
 * @brief A named detection pattern
 */
struct SecretRule {
    std::string name;
    SecretType type;
    std::regex pattern;
};

/**
 * @brief Line-oriented regex scanner for credentials
 *
 * Every rule runs against every line and every non-overlapping match is
 * reported. Lines longer than MAX_LINE_LENGTH are skipped, which keeps
 * minified bundles from dominating the scan.
 */
class SecretScanner {
public:
    static const size_t MAX_LINE_LENGTH = 1000;

    /**
     * @brief Scan text
     * @param content Text to scan
     * @return Matches ordered by line, then rule, then column
     */
    static std::vector<SecretMatch> scan(const std::string& content);

    /**
     * @brief Scan a file; an unreadable file yields no matches
     */
    static std::vector<SecretMatch> scanFile(const std::string& file_path);

    /**
     * @brief Scan a selection
     * @return One report per file with at least one match, in input order
     */
    static std::vector<FileSecretReport> scanFiles(const std::vector<std::string>& file_paths);

    /**
     * @brief Replace every occurrence of each matched secret with its mask
     *
     * Longer secrets are replaced first so that a secret containing another
     * one is masked whole. Applying the same matches twice changes nothing.
     */
    static std::string mask(const std::string& content, const std::vector<SecretMatch>& matches);

    /**
     * @brief First three characters followed by "******"
     */
    static std::string maskValue(const std::string& secret);

    static const std::vector<SecretRule>& getRules();
};

} // namespace CodePack
