// =================================================================
// include/Convoy/WorktreeManager.hpp
// =================================================================
// Adds, lists and removes linked worktrees of a (possibly bare)
// repository.

#pragma once

#include "Convoy/Git.hpp"
#include <string>
#include <vector>

namespace Convoy {

/**
 * @brief One linked working copy as reported by git.
 */
struct Worktree {
    std::string path;    ///< Absolute path of the working copy
    std::string branch;  ///< Checked-out branch, empty when detached
    std::string commit;  ///< Commit at HEAD
};

/**
 * @brief Worktree operations against one repository.
 *
 * Every add variant applies the same sparse-checkout exclusion as a
 * fresh clone, since a new worktree is a fresh checkout too.
 */
class WorktreeManager {
public:
    explicit WorktreeManager(const Git& git);

    /**
     * @brief Adds a worktree on a new branch created from the current HEAD.
     */
    void add(const std::string& path, const std::string& branch) const;

    /**
     * @brief Adds a worktree on a new branch created from start_point.
     * @param start_point Usually a remote-tracking ref such as origin/main.
     */
    void addFromRef(const std::string& path, const std::string& branch,
                    const std::string& start_point) const;

    /**
     * @brief Adds a worktree with a detached HEAD at ref.
     */
    void addDetached(const std::string& path, const std::string& ref) const;

    /**
     * @brief Adds a worktree for a branch that already exists.
     */
    void addExisting(const std::string& path, const std::string& branch) const;

    /**
     * @brief Adds a worktree for a branch even if it is checked out elsewhere.
     */
    void addExistingForce(const std::string& path, const std::string& branch) const;

    /**
     * @brief Removes a worktree.
     * @param force Discard local changes in the worktree.
     */
    void remove(const std::string& path, bool force = false) const;

    /**
     * @brief Drops worktree entries whose directories no longer exist.
     */
    void prune() const;

    /**
     * @brief Lists all worktrees of the repository, main one included.
     */
    std::vector<Worktree> list() const;

    /**
     * @brief Parses `git worktree list --porcelain` output.
     */
    static std::vector<Worktree> parsePorcelain(const std::string& output);

private:
    void addAndConfigure(const std::vector<std::string>& args, const std::string& path) const;

    Git m_git;
};

} // namespace Convoy
