// =================================================================
// include/Convoy/ConflictProber.hpp
// =================================================================
// Detects merge conflicts with a trial merge that is always undone.

#pragma once

#include "Convoy/Git.hpp"
#include <string>
#include <vector>

namespace Convoy {

/**
 * @brief Reversible trial merge between two branches.
 *
 * This is the only operation that deliberately mutates a working tree,
 * and it always puts it back: after checkConflicts() returns or throws,
 * the worktree is on the target branch, at the target's original commit,
 * with a clean status. It must not run concurrently with anything else on
 * the same worktree because it checks out another branch while it works.
 */
class ConflictProber {
public:
    explicit ConflictProber(const Git& git);

    /**
     * @brief Checks whether source merges cleanly into target.
     *
     * The caller must make sure the working directory is clean first.
     *
     * @param source Branch that would be merged.
     * @param target Branch that would receive the merge.
     * @return Conflicting paths; empty when the merge would be clean.
     * @throws CommandError when checkout fails, or when the trial merge fails
     *         for a reason other than content conflicts (e.g. unrelated histories).
     */
    std::vector<std::string> checkConflicts(const std::string& source, const std::string& target) const;

    /**
     * @brief Lists unmerged paths of an in-progress merge.
     *
     * Uses `git diff --diff-filter=U` rather than parsing merge output.
     */
    std::vector<std::string> conflictingFiles() const;

private:
    void restore(const std::string& original_head, bool merge_failed) const;

    Git m_git;
};

} // namespace Convoy
