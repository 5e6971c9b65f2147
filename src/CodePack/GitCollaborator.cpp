// =================================================================
// src/CodePack/GitCollaborator.cpp
// =================================================================
// Implementation for reading working-tree status and diffs from git.

#include "CodePack/GitCollaborator.hpp"
#include "CodePack/Logger.hpp"
#include <filesystem>
#include <sstream>

namespace CodePack {

namespace fs = std::filesystem;

static std::string trimLine(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// git quotes paths with unusual characters using C-style escapes
static std::string unquotePath(const std::string& path) {
    if (path.size() < 2 || path.front() != '"' || path.back() != '"') {
        return path;
    }
    std::string out;
    for (size_t i = 1; i + 1 < path.size(); ++i) {
        char c = path[i];
        if (c == '\\' && i + 2 < path.size()) {
            char next = path[++i];
            switch (next) {
                case 'n': out += '\n'; break;
                case 't': out += '\t'; break;
                default: out += next; break;
            }
        } else {
            out += c;
        }
    }
    return out;
}

GitCollaborator::GitCollaborator()
    : m_sys(std::make_unique<SysInteraction>()) {}

bool GitCollaborator::findRepoRoot(const std::string& project_path, std::string& repo_root) {
    try {
        auto result = m_sys->executeCommand("git", {"-C", project_path, "rev-parse", "--show-toplevel"});
        if (result.second != 0) {
            return false;
        }
        repo_root = trimLine(result.first);
        return !repo_root.empty();
    } catch (const std::exception& e) {
        LOG_WARNING("GitCollaborator", "Failed to run git", e.what());
        return false;
    }
}

GitStatus GitCollaborator::status(const std::string& project_path) {
    GitStatus status;
    std::string repo_root;
    if (!findRepoRoot(project_path, repo_root)) {
        LOG_DEBUG("GitCollaborator", "Not a git repository: " + project_path);
        return status;
    }
    status.is_repo = true;

    try {
        auto branch = m_sys->executeCommand("git", {"-C", project_path, "rev-parse", "--abbrev-ref", "HEAD"});
        status.branch = branch.second == 0 ? trimLine(branch.first) : "HEAD";
        if (status.branch.empty()) {
            status.branch = "HEAD";
        }

        auto porcelain = m_sys->executeCommand("git", {"-C", project_path, "status", "--porcelain", "-uall"});
        if (porcelain.second != 0) {
            LOG_WARNING("GitCollaborator", "git status failed", "exit code " + std::to_string(porcelain.second));
            return status;
        }
        status.changed_files = parsePorcelain(porcelain.first, repo_root);
    } catch (const std::exception& e) {
        LOG_WARNING("GitCollaborator", "Failed to run git", e.what());
    }

    LOG_DEBUG("GitCollaborator", "Branch " + status.branch + " with " +
              std::to_string(status.changed_files.size()) + " changed files");
    return status;
}

std::map<std::string, std::string> GitCollaborator::diffs(const std::string& project_path) {
    std::map<std::string, std::string> result;
    std::string repo_root;
    if (!findRepoRoot(project_path, repo_root)) {
        return result;
    }

    try {
        auto diff = m_sys->executeCommand("git", {"-C", project_path, "diff", "HEAD"});
        if (diff.second != 0) {
            // No HEAD yet
            diff = m_sys->executeCommand("git", {"-C", project_path, "diff"});
        }
        if (diff.second != 0) {
            LOG_WARNING("GitCollaborator", "git diff failed", "exit code " + std::to_string(diff.second));
            return result;
        }

        for (const auto& entry : splitUnifiedDiff(diff.first)) {
            std::string absolute = (fs::path(repo_root) / entry.first).lexically_normal().string();
            result[absolute] = entry.second;
        }
    } catch (const std::exception& e) {
        LOG_WARNING("GitCollaborator", "Failed to run git", e.what());
    }
    return result;
}

std::vector<ChangedFile> GitCollaborator::parsePorcelain(const std::string& output, const std::string& repo_root) {
    std::vector<ChangedFile> files;
    std::istringstream stream(output);
    std::string line;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.size() < 4) {
            continue;
        }

        char x = line[0];
        char y = line[1];
        if (x == '!' && y == '!') {
            continue;
        }

        std::string path = line.substr(3);
        size_t arrow = path.find(" -> ");
        if (arrow != std::string::npos) {
            path = path.substr(arrow + 4);
        }
        path = unquotePath(path);

        ChangedFile file;
        file.path = (fs::path(repo_root) / path).lexically_normal().string();
        file.status = statusLabel(x, y);
        files.push_back(file);
    }
    return files;
}

std::map<std::string, std::string> GitCollaborator::splitUnifiedDiff(const std::string& diff_text) {
    std::map<std::string, std::string> result;
    std::string current_path;
    std::string current_diff;

    auto flush = [&]() {
        if (!current_path.empty()) {
            result[current_path] += current_diff;
        }
        current_path.clear();
        current_diff.clear();
    };

    size_t start = 0;
    while (start < diff_text.size()) {
        size_t end = diff_text.find('\n', start);
        size_t next = end == std::string::npos ? diff_text.size() : end + 1;
        std::string line = diff_text.substr(start, next - start);

        if (line.compare(0, 11, "diff --git ") == 0) {
            flush();
            std::string header = trimLine(line);
            size_t b_pos = header.rfind(" b/");
            if (b_pos != std::string::npos) {
                current_path = unquotePath(header.substr(b_pos + 3));
            }
        }
        current_diff += line;
        start = next;
    }
    flush();

    return result;
}

std::string GitCollaborator::statusLabel(char index_status, char worktree_status) {
    auto either = [index_status, worktree_status](char c) {
        return index_status == c || worktree_status == c;
    };

    if (either('A') || index_status == '?') {
        return "added";
    }
    if (either('M')) {
        return "modified";
    }
    if (either('D')) {
        return "deleted";
    }
    if (either('R') || either('C')) {
        return "renamed";
    }
    if (either('T')) {
        return "typechange";
    }
    return "unknown";
}

} // namespace CodePack
