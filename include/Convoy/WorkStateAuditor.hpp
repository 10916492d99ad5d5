// =================================================================
// include/Convoy/WorkStateAuditor.hpp
// =================================================================
// Decides whether a working copy holds any work that would be lost if
// it were deleted: uncommitted changes, stashes, unpushed commits.

#pragma once

#include "Convoy/Git.hpp"
#include <string>
#include <vector>

namespace Convoy {

/**
 * @brief Parsed `git status --porcelain` result.
 *
 * Each reported path lands in exactly one list. Renames and copies are
 * recorded as added under the new path; type changes and unmerged paths
 * count as modified.
 */
struct GitStatus {
    bool clean = true;
    std::vector<std::string> modified;
    std::vector<std::string> added;
    std::vector<std::string> deleted;
    std::vector<std::string> untracked;
};

/**
 * @brief Everything that makes a working copy unsafe to delete.
 */
struct UncommittedWorkStatus {
    bool has_uncommitted_changes = false;
    int stash_count = 0;
    int unpushed_commits = 0;
    std::vector<std::string> modified_files;   ///< modified + added + deleted
    std::vector<std::string> untracked_files;

    /**
     * @brief Strict verdict: nothing uncommitted, no stashes, nothing unpushed.
     */
    bool clean() const;

    /**
     * @brief Relaxed verdict that ignores paths inside dir.
     *
     * A path is ignored when it contains dir followed by a separator.
     * Stashes and unpushed commits are never ignored.
     */
    bool cleanExcluding(const std::string& dir) const;

    /**
     * @brief One-line human readable description, "clean" when clean().
     */
    std::string summary() const;
};

class WorkStateAuditor {
public:
    explicit WorkStateAuditor(const Git& git);

    GitStatus status() const;

    /**
     * @brief Number of entries in `git stash list`.
     */
    int stashCount() const;

    /**
     * @brief Commits on HEAD that are not on the upstream branch.
     *
     * Returns 0 when no upstream is configured.
     */
    int unpushedCommits() const;

    bool hasUncommittedChanges() const;

    /**
     * @brief Collects status, stash count and unpushed count in one report.
     */
    UncommittedWorkStatus checkUncommittedWork() const;

    /**
     * @brief Parses NUL-separated `git status --porcelain -z` output.
     * @throws std::runtime_error on a truncated entry.
     */
    static GitStatus parsePorcelainStatus(const std::string& output);

private:
    Git m_git;
};

} // namespace Convoy
