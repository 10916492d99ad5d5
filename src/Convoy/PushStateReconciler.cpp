// =================================================================
// src/Convoy/PushStateReconciler.cpp
// =================================================================
// Implementation of push-state reconciliation for linked worktrees.

#include "Convoy/PushStateReconciler.hpp"
#include "Convoy/Logger.hpp"
#include <sstream>
#include <stdexcept>

namespace Convoy {

PushStateReconciler::PushStateReconciler(const Git& git, const std::string& trunk_ref)
    : m_git(git), m_trunk_ref(trunk_ref) {}

std::vector<RemoteRef> PushStateReconciler::parseLsRemote(const std::string& output) {
    std::vector<RemoteRef> refs;
    for (const auto& line : splitLines(output)) {
        std::istringstream fields(line);
        RemoteRef ref;
        if (fields >> ref.sha >> ref.ref) {
            refs.push_back(ref);
        }
    }
    return refs;
}

std::string PushStateReconciler::resolveRemoteSha(const std::vector<RemoteRef>& refs,
                                                  const std::string& branch) {
    const std::string wanted = "refs/heads/" + branch;
    std::string sha;
    for (const auto& ref : refs) {
        if (ref.ref != wanted) {
            continue;
        }
        if (!sha.empty() && sha != ref.sha) {
            throw std::runtime_error("ambiguous remote ref " + wanted + ": " + sha + " and " + ref.sha);
        }
        sha = ref.sha;
    }
    if (sha.empty()) {
        throw std::runtime_error("remote branch not found: " + wanted);
    }
    return sha;
}

PushState PushStateReconciler::branchPushedToRemote(const std::string& branch,
                                                    const std::string& remote) const {
    PushState state;

    if (!m_git.remoteBranchExists(remote, branch)) {
        state.unpushed_count = countUnpublished();
    } else {
        state.unpushed_count = countAgainstRemote(branch, remote);
    }

    state.pushed = state.unpushed_count == 0;
    return state;
}

int PushStateReconciler::countUnpublished() const {
    try {
        return m_git.revListCount(m_trunk_ref + "..HEAD");
    } catch (const CommandError& e) {
        // No usable trunk ref: everything on HEAD is unpublished
        Logger::getInstance().logCommandFailure("PushStateReconciler", e, LogLevel::DEBUG);
    }
    return m_git.revListCount("HEAD");
}

int PushStateReconciler::countAgainstRemote(const std::string& branch, const std::string& remote) const {
    const std::string remote_branch = remote + "/" + branch;
    const std::string tracking_ref = "refs/remotes/" + remote_branch;

    // Best-effort: make sure the local tracking ref reflects the remote
    ProcessResult fetch = m_git.runUnchecked({"fetch", remote, branch});
    if (fetch.exit_code != 0) {
        Logger::getInstance().debug("PushStateReconciler", "fetch " + remote + " " + branch + " failed",
                                    trimWhitespace(fetch.stderr_output));
    }

    // Worktrees without a fetch refspec only update FETCH_HEAD
    if (m_git.runUnchecked({"rev-parse", "--verify", tracking_ref}).exit_code != 0 && fetch.exit_code == 0) {
        ProcessResult update = m_git.runUnchecked({"update-ref", tracking_ref, "FETCH_HEAD"});
        if (update.exit_code != 0) {
            Logger::getInstance().debug("PushStateReconciler", "Could not create " + tracking_ref,
                                        trimWhitespace(update.stderr_output));
        }
    }

    try {
        return m_git.revListCount(remote_branch + "..HEAD");
    } catch (const CommandError& e) {
        Logger::getInstance().logCommandFailure("PushStateReconciler", e, LogLevel::DEBUG);
    }

    // Tracking ref still unusable: compare against the SHA the remote reports
    auto refs = parseLsRemote(m_git.run({"ls-remote", remote, "refs/heads/" + branch}));
    std::string remote_sha = resolveRemoteSha(refs, branch);
    return m_git.revListCount(remote_sha + "..HEAD");
}

} // namespace Convoy
