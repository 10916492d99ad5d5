// =================================================================
// src/Convoy/SparseCheckout.cpp
// =================================================================
// Implementation for sparse-checkout exclusion of agent-instruction
// files.

#include "Convoy/SparseCheckout.hpp"
#include "Convoy/Git.hpp"
#include "Convoy/SysInteraction.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace Convoy {

const std::vector<ExcludedPath>& SparseCheckout::excludedPaths() {
    static const std::vector<ExcludedPath> paths = {
        {".claude", true, true},            // settings, rules, agents, commands
        {"CLAUDE.md", false, true},         // primary context file
        {"CLAUDE.local.md", false, false},  // personal context file
    };
    return paths;
}

std::string SparseCheckout::patternFileContent() {
    std::string content = "/*\n";
    for (const auto& path : excludedPaths()) {
        content += "!/" + path.name + (path.is_directory ? "/" : "") + "\n";
    }
    return content;
}

std::string SparseCheckout::resolveGitDir(const std::string& repo_path, const std::string& git_binary) {
    Git git(repo_path, git_binary);
    fs::path git_dir = git.run({"rev-parse", "--git-dir"});
    if (!git_dir.is_absolute()) {
        git_dir = fs::path(repo_path) / git_dir;
    }
    return git_dir.lexically_normal().string();
}

void SparseCheckout::configure(const std::string& repo_path, const std::string& git_binary) {
    Git git(repo_path, git_binary);
    git.configSet("core.sparseCheckout", "true");

    fs::path info_dir = fs::path(resolveGitDir(repo_path, git_binary)) / "info";
    std::error_code ec;
    fs::create_directories(info_dir, ec);
    if (ec) {
        throw std::runtime_error("creating " + info_dir.string() + ": " + ec.message());
    }

    SysInteraction sys;
    fs::path sparse_file = info_dir / "sparse-checkout";
    if (!sys.writeFile(sparse_file.string(), patternFileContent())) {
        throw std::runtime_error("writing " + sparse_file.string());
    }

    // A repository without commits has nothing to reapply yet
    if (!git.hasCommits()) {
        return;
    }
    git.run({"read-tree", "-mu", "HEAD"});
}

std::vector<std::string> SparseCheckout::checkExcludedFilesExist(const std::string& repo_path) {
    std::vector<std::string> remaining;
    for (const auto& path : excludedPaths()) {
        std::error_code ec;
        if (fs::exists(fs::path(repo_path) / path.name, ec)) {
            remaining.push_back(path.name);
        }
    }
    return remaining;
}

bool SparseCheckout::isConfigured(const std::string& repo_path, const std::string& git_binary) {
    Git git(repo_path, git_binary);
    if (git.configGet("core.sparseCheckout") != "true") {
        return false;
    }

    std::string content;
    try {
        SysInteraction sys;
        content = sys.readFile((fs::path(resolveGitDir(repo_path, git_binary)) / "info" / "sparse-checkout").string());
    } catch (const std::runtime_error&) {
        // No readable pattern file (or no git dir) means not configured
        return false;
    }

    for (const auto& path : excludedPaths()) {
        if (!path.required) {
            continue;
        }
        std::string entry = path.name + (path.is_directory ? "/" : "");
        std::string current = "!/" + entry;
        std::string legacy = "!" + entry;
        if (content.find(current) == std::string::npos && content.find(legacy) == std::string::npos) {
            return false;
        }
    }
    return true;
}

} // namespace Convoy
