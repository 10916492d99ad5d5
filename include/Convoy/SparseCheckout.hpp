// =================================================================
// include/Convoy/SparseCheckout.hpp
// =================================================================
// Keeps agent-instruction files from a cloned source repository out
// of every clone and worktree, using git's sparse-checkout patterns.

#pragma once

#include <string>
#include <vector>

namespace Convoy {

/**
 * @brief One path excluded from every working tree.
 */
struct ExcludedPath {
    std::string name;     ///< Path relative to the working tree root
    bool is_directory;    ///< Directories get a trailing '/' in the pattern
    bool required;        ///< Must be present for the health check to pass
};

class SparseCheckout {
public:
    /**
     * @brief The fixed list of excluded agent-instruction artifacts.
     *
     * .mcp.json is intentionally absent so worktrees inherit MCP server
     * configuration from the source repository.
     */
    static const std::vector<ExcludedPath>& excludedPaths();

    /**
     * @brief Content written to <gitdir>/info/sparse-checkout.
     */
    static std::string patternFileContent();

    /**
     * @brief Enables sparse checkout and removes excluded files from a checkout.
     *
     * The pattern file is written directly because `git sparse-checkout set`
     * mangles patterns that start with '!'. The tree is only reapplied when
     * HEAD exists.
     *
     * @param repo_path Clone or worktree root.
     * @param git_binary Git executable to use.
     * @throws CommandError if a git step fails, std::runtime_error if the
     *         pattern file cannot be written.
     */
    static void configure(const std::string& repo_path, const std::string& git_binary = "git");

    /**
     * @brief Lists excluded entries still present in a working tree.
     *
     * They survive read-tree when untracked or locally modified; callers
     * warn and remove them.
     */
    static std::vector<std::string> checkExcludedFilesExist(const std::string& repo_path);

    /**
     * @brief Reports whether sparse checkout is on and excludes every required path.
     *
     * Accepts both "!/.claude/" and the legacy "!.claude/" spelling.
     */
    static bool isConfigured(const std::string& repo_path, const std::string& git_binary = "git");

    /**
     * @brief Resolves the absolute git directory of a clone or worktree.
     */
    static std::string resolveGitDir(const std::string& repo_path, const std::string& git_binary = "git");
};

} // namespace Convoy
