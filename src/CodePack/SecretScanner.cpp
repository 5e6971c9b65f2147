// =================================================================
// src/CodePack/SecretScanner.cpp
// =================================================================
// Implementation for secret detection and masking.

#include "CodePack/SecretScanner.hpp"
#include "CodePack/SysInteraction.hpp"
#include "CodePack/Logger.hpp"
#include <algorithm>
#include <set>

namespace CodePack {

const std::vector<SecretRule>& SecretScanner::getRules() {
    static const std::vector<SecretRule> rules = {
        {"AWS Access Key ID", SecretType::ApiKey,
         std::regex(R"((A3T[A-Z0-9]|AKIA|AGPA|AIDA|AROA|AIPA|ANPA|ANVA|ASIA)[A-Z0-9]{16})")},
        {"Private Key Header", SecretType::PrivateKey,
         std::regex(R"(-----BEGIN [A-Z ]*PRIVATE KEY-----)")},
        {"OpenAI API Key", SecretType::ApiKey,
         std::regex(R"(sk-[a-zA-Z0-9]{32,})")},
        {"GitHub PAT", SecretType::ApiKey,
         std::regex(R"(ghp_[a-zA-Z0-9]{36})")},
        {"Google API Key", SecretType::ApiKey,
         std::regex(R"(AIza[0-9A-Za-z_-]{35})")},
        {"Potential Hardcoded Secret", SecretType::Password,
         std::regex(R"((password|passwd|pwd|secret|api_key|apikey|access_token)\s*[:=]\s*["'][^"']{6,}["'])",
                    std::regex_constants::ECMAScript | std::regex_constants::icase)}
    };
    return rules;
}

std::vector<SecretMatch> SecretScanner::scan(const std::string& content) {
    std::vector<SecretMatch> matches;
    const auto& rules = getRules();

    size_t line_start = 0;
    size_t line_number = 0;
    while (line_start <= content.size()) {
        size_t line_end = content.find('\n', line_start);
        if (line_end == std::string::npos) {
            line_end = content.size();
        }
        ++line_number;

        std::string line = content.substr(line_start, line_end - line_start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (!line.empty() && line.size() <= MAX_LINE_LENGTH) {
            for (const auto& rule : rules) {
                auto begin = std::sregex_iterator(line.begin(), line.end(), rule.pattern);
                for (auto it = begin; it != std::sregex_iterator(); ++it) {
                    SecretMatch match;
                    match.rule_name = rule.name;
                    match.secret_type = rule.type;
                    match.line_number = line_number;
                    match.match_content = it->str();
                    match.start_index = static_cast<size_t>(it->position());
                    match.end_index = match.start_index + match.match_content.size();
                    matches.push_back(match);
                }
            }
        }

        if (line_end == content.size()) {
            break;
        }
        line_start = line_end + 1;
    }

    return matches;
}

std::vector<SecretMatch> SecretScanner::scanFile(const std::string& file_path) {
    SysInteraction sys;
    try {
        return scan(sys.readFile(file_path));
    } catch (const std::exception& e) {
        LOG_DEBUG("SecretScanner", "Skipping unreadable file " + file_path, e.what());
        return {};
    }
}

std::vector<FileSecretReport> SecretScanner::scanFiles(const std::vector<std::string>& file_paths) {
    std::vector<FileSecretReport> reports;
    size_t total_matches = 0;

    for (const auto& path : file_paths) {
        std::vector<SecretMatch> matches = scanFile(path);
        if (matches.empty()) {
            continue;
        }
        total_matches += matches.size();
        reports.push_back({path, std::move(matches)});
    }

    Logger::getInstance().logSecretScan(file_paths.size(), reports.size(), total_matches);
    return reports;
}

std::string SecretScanner::mask(const std::string& content, const std::vector<SecretMatch>& matches) {
    std::set<std::string> unique;
    for (const auto& match : matches) {
        if (!match.match_content.empty()) {
            unique.insert(match.match_content);
        }
    }

    std::vector<std::string> secrets(unique.begin(), unique.end());
    std::stable_sort(secrets.begin(), secrets.end(), [](const std::string& a, const std::string& b) {
        return a.size() > b.size();
    });

    std::string masked = content;
    for (const auto& secret : secrets) {
        const std::string replacement = maskValue(secret);
        size_t pos = masked.find(secret);
        while (pos != std::string::npos) {
            masked.replace(pos, secret.size(), replacement);
            pos = masked.find(secret, pos + replacement.size());
        }
    }
    return masked;
}

std::string SecretScanner::maskValue(const std::string& secret) {
    return secret.substr(0, 3) + "******";
}

} // namespace CodePack
