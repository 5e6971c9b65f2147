// =================================================================
// include/CodePack/GitCollaborator.hpp
// =================================================================
// Header for reading working-tree status and diffs from git.

#pragma once

#include "CodePack/Types.hpp"
#include "CodePack/SysInteraction.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>

namespace CodePack {

/**
 * @brief Runs the git CLI and turns its output into GitStatus and diff maps
 *
 * Only the front end talks to git; the packing pipeline receives the
 * resulting snapshot. Paths in the results are absolute.
 */
class GitCollaborator {
public:
    GitCollaborator();

    /**
     * @brief Branch and changed files of the repository containing a path
     * @return Status with is_repo=false when the path is not inside a repository
     */
    GitStatus status(const std::string& project_path);

    /**
     * @brief Working-tree diff against HEAD, split per file
     *
     * Falls back to the unstaged diff when the repository has no commits.
     * @return Absolute path -> unified diff text; empty outside a repository
     */
    std::map<std::string, std::string> diffs(const std::string& project_path);

    /**
     * @brief Parse `git status --porcelain` output
     * @param output Porcelain v1 text
     * @param repo_root Absolute repository root used to resolve paths
     * @return Changed files, ignored entries left out
     */
    static std::vector<ChangedFile> parsePorcelain(const std::string& output, const std::string& repo_root);

    /**
     * @brief Split a multi-file unified diff on its "diff --git" headers
     * @return Repository-relative path (new side) -> that file's diff
     */
    static std::map<std::string, std::string> splitUnifiedDiff(const std::string& diff_text);

    /**
     * @brief Label for a porcelain XY pair: added, modified, deleted, renamed,
     *        typechange or unknown
     */
    static std::string statusLabel(char index_status, char worktree_status);

private:
    std::unique_ptr<SysInteraction> m_sys;

    bool findRepoRoot(const std::string& project_path, std::string& repo_root);
};

} // namespace CodePack
