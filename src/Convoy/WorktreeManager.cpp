// =================================================================
// src/Convoy/WorktreeManager.cpp
// =================================================================
// Implementation for linked worktree management.

#include "Convoy/WorktreeManager.hpp"
#include "Convoy/Logger.hpp"
#include "Convoy/SparseCheckout.hpp"
#include <filesystem>
#include <sstream>

namespace Convoy {

static bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

WorktreeManager::WorktreeManager(const Git& git) : m_git(git) {}

void WorktreeManager::addAndConfigure(const std::vector<std::string>& args, const std::string& path) const {
    m_git.run(args);

    // Relative paths were resolved by git against the repository's work dir
    std::filesystem::path worktree_path(path);
    if (worktree_path.is_relative() && !m_git.workDir().empty()) {
        worktree_path = std::filesystem::path(m_git.workDir()) / worktree_path;
    }
    SparseCheckout::configure(worktree_path.string(), m_git.gitBinary());

    Logger::getInstance().debug("WorktreeManager", "Added worktree " + worktree_path.string());
}

void WorktreeManager::add(const std::string& path, const std::string& branch) const {
    addAndConfigure({"worktree", "add", "-b", branch, path}, path);
}

void WorktreeManager::addFromRef(const std::string& path, const std::string& branch,
                                 const std::string& start_point) const {
    addAndConfigure({"worktree", "add", "-b", branch, path, start_point}, path);
}

void WorktreeManager::addDetached(const std::string& path, const std::string& ref) const {
    addAndConfigure({"worktree", "add", "--detach", path, ref}, path);
}

void WorktreeManager::addExisting(const std::string& path, const std::string& branch) const {
    addAndConfigure({"worktree", "add", path, branch}, path);
}

void WorktreeManager::addExistingForce(const std::string& path, const std::string& branch) const {
    addAndConfigure({"worktree", "add", "--force", path, branch}, path);
}

void WorktreeManager::remove(const std::string& path, bool force) const {
    std::vector<std::string> args = {"worktree", "remove", path};
    if (force) {
        args.push_back("--force");
    }
    m_git.run(args);
}

void WorktreeManager::prune() const {
    m_git.run({"worktree", "prune"});
}

std::vector<Worktree> WorktreeManager::list() const {
    return parsePorcelain(m_git.run({"worktree", "list", "--porcelain"}));
}

std::vector<Worktree> WorktreeManager::parsePorcelain(const std::string& output) {
    std::vector<Worktree> worktrees;
    Worktree current;

    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            if (!current.path.empty()) {
                worktrees.push_back(current);
                current = Worktree();
            }
            continue;
        }

        if (startsWith(line, "worktree ")) {
            current.path = line.substr(9);
        } else if (startsWith(line, "HEAD ")) {
            current.commit = line.substr(5);
        } else if (startsWith(line, "branch ")) {
            std::string ref = line.substr(7);
            current.branch = startsWith(ref, "refs/heads/") ? ref.substr(11) : ref;
        }
    }

    // Output may end without a trailing separator
    if (!current.path.empty()) {
        worktrees.push_back(current);
    }
    return worktrees;
}

} // namespace Convoy
