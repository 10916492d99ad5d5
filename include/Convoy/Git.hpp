// =================================================================
// include/Convoy/Git.hpp
// =================================================================
// Runs git subcommands against one repository or worktree.
// Every other component is built on top of this executor.

#pragma once

#include "Convoy/GitError.hpp"
#include "Convoy/SysInteraction.hpp"
#include <string>
#include <utility>
#include <vector>

namespace Convoy {

/**
 * @brief Identifies where git commands run.
 *
 * work_dir is the directory git is started in. When git_dir is set, every
 * command gets an explicit --git-dir so bare repositories and detached
 * worktrees never depend on directory-walk discovery.
 */
struct RepositoryHandle {
    std::string work_dir;
    std::string git_dir;

    RepositoryHandle() = default;
    explicit RepositoryHandle(std::string work)
        : work_dir(std::move(work)) {}
    RepositoryHandle(std::string work, std::string git)
        : work_dir(std::move(work)), git_dir(std::move(git)) {}
};

/**
 * @brief Thin, stateless wrapper around the git CLI.
 *
 * Failures are never retried and never logged here; a non-zero exit throws
 * CommandError and a launch failure throws std::system_error.
 */
class Git {
public:
    /**
     * @brief Creates a wrapper running in the given working directory.
     */
    explicit Git(const std::string& work_dir, const std::string& git_binary = "git");

    /**
     * @brief Creates a wrapper for an explicit repository handle.
     */
    explicit Git(RepositoryHandle handle, const std::string& git_binary = "git");

    /**
     * @brief Creates a wrapper with an explicit git directory (bare repos).
     * @param git_dir The repository metadata directory.
     * @param work_dir Working directory, may be empty.
     */
    static Git withGitDir(const std::string& git_dir, const std::string& work_dir = "",
                          const std::string& git_binary = "git");

    const RepositoryHandle& handle() const { return m_handle; }
    const std::string& workDir() const { return m_handle.work_dir; }
    const std::string& gitBinary() const { return m_git_binary; }

    /**
     * @brief Adds environment variables for every command run by this wrapper.
     */
    void setEnvironment(EnvironmentOverrides env) { m_env = std::move(env); }

    /**
     * @brief Runs a subcommand and returns its trimmed stdout.
     * @throws CommandError on non-zero exit.
     */
    std::string run(const std::vector<std::string>& args) const;

    /**
     * @brief Runs a subcommand and returns stdout exactly as git printed it.
     * @throws CommandError on non-zero exit.
     */
    std::string runRaw(const std::vector<std::string>& args) const;

    /**
     * @brief Runs a subcommand without turning a non-zero exit into an error.
     *
     * Used by predicates that branch on the exit code.
     */
    ProcessResult runUnchecked(const std::vector<std::string>& args) const;

    /**
     * @brief Builds the CommandError for a finished invocation.
     */
    static CommandError makeError(const std::vector<std::string>& args, const ProcessResult& result);

    // Repository queries
    bool isRepo() const;
    bool hasCommits() const;
    std::string currentBranch() const;
    std::string defaultBranch() const;
    std::string remoteDefaultBranch() const;
    std::string remoteUrl(const std::string& remote) const;
    std::vector<std::string> remotes() const;

    /**
     * @brief Reads a config value.
     * @return The value, or an empty string when the key is not set.
     */
    std::string configGet(const std::string& key) const;
    void configSet(const std::string& key, const std::string& value) const;

    // Working tree operations
    void checkout(const std::string& ref) const;
    void add(const std::vector<std::string>& paths) const;
    void commit(const std::string& message) const;
    void commitAll(const std::string& message) const;

    // Remote operations
    void fetch(const std::string& remote) const;
    void fetchBranch(const std::string& remote, const std::string& branch) const;
    void pull(const std::string& remote, const std::string& branch) const;
    void push(const std::string& remote, const std::string& branch, bool force = false) const;
    void deleteRemoteBranch(const std::string& remote, const std::string& branch) const;

    // Merge and rebase
    void merge(const std::string& branch) const;
    void mergeNoFF(const std::string& branch, const std::string& message) const;

    /**
     * @brief Squash-merges a branch and commits it as a single commit.
     */
    void mergeSquash(const std::string& branch, const std::string& message) const;
    void abortMerge() const;
    void rebase(const std::string& onto) const;
    void abortRebase() const;

    /**
     * @brief Returns the full message of the commit at the tip of a branch.
     */
    std::string branchCommitMessage(const std::string& branch) const;

    // Branches
    void createBranch(const std::string& name) const;
    void createBranchFrom(const std::string& name, const std::string& ref) const;
    bool branchExists(const std::string& name) const;
    bool remoteBranchExists(const std::string& remote, const std::string& branch) const;
    void deleteBranch(const std::string& name, bool force = false) const;

    /**
     * @brief Lists local branches, optionally filtered by a git pattern.
     * @return Short branch names (no refs/heads/ prefix).
     */
    std::vector<std::string> listBranches(const std::string& pattern = "") const;

    /**
     * @brief Force-moves a branch to point at a ref.
     */
    void resetBranch(const std::string& name, const std::string& ref) const;

    // History
    std::string rev(const std::string& ref) const;
    bool isAncestor(const std::string& ancestor, const std::string& descendant) const;

    /**
     * @brief Counts commits on branch that are not on base.
     */
    int commitsAhead(const std::string& base, const std::string& branch) const;

    /**
     * @brief Counts commits on ref that are not on HEAD.
     */
    int countCommitsBehind(const std::string& ref) const;

    /**
     * @brief Committer date (YYYY-MM-DD) of the first commit the branch added
     *        on top of main, falling back to the branch tip.
     */
    std::string branchCreatedDate(const std::string& branch) const;

    /**
     * @brief Runs rev-list --count for a revision range and parses the result.
     * @throws CommandError if git fails, std::runtime_error if the output is not a number.
     */
    int revListCount(const std::string& range) const;

    /**
     * @brief Parses the output of rev-list --count.
     * @throws std::runtime_error on non-numeric input.
     */
    static int parseCount(const std::string& output);

private:
    std::vector<std::string> prependGitDir(const std::vector<std::string>& args) const;

    RepositoryHandle m_handle;
    std::string m_git_binary;
    EnvironmentOverrides m_env;
};

/**
 * @brief Trims leading and trailing whitespace.
 */
std::string trimWhitespace(const std::string& s);

/**
 * @brief Splits text into lines, dropping empty ones.
 */
std::vector<std::string> splitLines(const std::string& text);

} // namespace Convoy
