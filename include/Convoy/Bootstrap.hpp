// =================================================================
// include/Convoy/Bootstrap.hpp
// =================================================================
// Clones repositories for agents: plain clones, clones sharing objects
// with a local reference, and bare clones used as the shared object
// database for many worktrees.

#pragma once

#include <string>

namespace Convoy {

/**
 * @brief Plan for moving a repository directory to a new location.
 */
struct Migration {
    std::string name;         ///< Logical name of the repository
    std::string source_path;  ///< Current location
    std::string target_path;  ///< Desired location
};

/**
 * @brief Clone protocol shared by every way of creating a repository.
 *
 * Each clone runs inside a fresh temporary directory with
 * GIT_CEILING_DIRECTORIES pointing at it, so git can never discover an
 * unrelated repository above the process's current directory. The result
 * is then moved to its destination and post-configured. The temporary
 * directory is removed whether or not the clone succeeded.
 */
class Bootstrap {
public:
    explicit Bootstrap(const std::string& git_binary = "git",
                       const std::string& hooks_dir = ".githooks");

    /**
     * @brief Clones url into dest as a normal working copy.
     * @throws CommandError if git fails, std::runtime_error on filesystem errors.
     */
    void clone(const std::string& url, const std::string& dest) const;

    /**
     * @brief Clones url into dest, borrowing objects from a local repository.
     *
     * Uses --reference-if-able, so an unusable reference only costs disk.
     */
    void cloneWithReference(const std::string& url, const std::string& dest,
                            const std::string& reference) const;

    /**
     * @brief Clones url into dest as a bare repository.
     *
     * The standard origin fetch refspec is configured and fetched once so
     * origin/<branch> resolves before any worktree is created from it.
     */
    void cloneBare(const std::string& url, const std::string& dest) const;

    /**
     * @brief Bare clone borrowing objects from a local repository.
     */
    void cloneBareWithReference(const std::string& url, const std::string& dest,
                                const std::string& reference) const;

    /**
     * @brief Moves a repository directory as described by a migration plan.
     *
     * The hooks path is re-applied at the new location.
     */
    void relocate(const Migration& migration) const;

    /**
     * @brief Points core.hooksPath at the hooks directory if the checkout has one.
     *
     * Keeps the push policy hook active for every clone regardless of the
     * source repository's own hook settings.
     */
    void configureHooksPath(const std::string& repo_path) const;

    /**
     * @brief Sets the origin fetch refspec of a bare repository and fetches once.
     */
    void configureRefspec(const std::string& repo_path) const;

    /**
     * @brief Moves a directory, copying across filesystems when rename cannot.
     *
     * Symbolic links are copied as links. An existing destination is an error.
     */
    static void moveDirectory(const std::string& src, const std::string& dest);

    /**
     * @brief The cross-filesystem half of moveDirectory().
     *
     * A failed copy removes whatever reached the destination and leaves the
     * source untouched.
     */
    static void copyThenRemove(const std::string& src, const std::string& dest);

private:
    void cloneInto(const std::string& url, const std::string& dest,
                   const std::string& reference, bool bare) const;

    std::string m_git_binary;
    std::string m_hooks_dir;
};

} // namespace Convoy
