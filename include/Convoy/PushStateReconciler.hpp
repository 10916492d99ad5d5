// =================================================================
// include/Convoy/PushStateReconciler.hpp
// =================================================================
// Answers "has this branch's work reached the remote?" for worktrees
// whose remote-tracking configuration may be incomplete.

#pragma once

#include "Convoy/Git.hpp"
#include <string>
#include <vector>

namespace Convoy {

/**
 * @brief Result of a push-state check.
 */
struct PushState {
    bool pushed = false;     ///< True iff no local commits are missing on the remote
    int unpushed_count = 0;  ///< Commits reachable from HEAD but not from the remote branch
};

/**
 * @brief One line of `git ls-remote` output.
 */
struct RemoteRef {
    std::string sha;
    std::string ref;
};

class PushStateReconciler {
public:
    /**
     * @brief Construct a reconciler
     * @param git Repository or worktree to inspect
     * @param trunk_ref Remote-tracking ref of the trunk, used when the branch
     *                  was never pushed
     */
    explicit PushStateReconciler(const Git& git, const std::string& trunk_ref = "origin/main");

    /**
     * @brief Counts local commits on HEAD that have not reached remote/branch.
     *
     * Fallbacks run in order, each only when the previous step failed:
     * branch missing on the remote -> count against the trunk ref, then all
     * of HEAD; local tracking ref missing after fetch -> create it from
     * FETCH_HEAD; counting against the tracking ref fails -> count against
     * the SHA reported by ls-remote. Nothing is retried.
     *
     * @throws CommandError or std::runtime_error when every fallback fails,
     *         or when the remote reports more than one commit for the branch.
     */
    PushState branchPushedToRemote(const std::string& branch, const std::string& remote) const;

    /**
     * @brief Parses `git ls-remote` output.
     */
    static std::vector<RemoteRef> parseLsRemote(const std::string& output);

    /**
     * @brief Picks the commit of exactly refs/heads/<branch> from ls-remote output.
     * @throws std::runtime_error when the ref is absent or reported with different SHAs.
     */
    static std::string resolveRemoteSha(const std::vector<RemoteRef>& refs, const std::string& branch);

private:
    int countUnpublished() const;
    int countAgainstRemote(const std::string& branch, const std::string& remote) const;

    Git m_git;
    std::string m_trunk_ref;
};

} // namespace Convoy
