// =================================================================
// src/Convoy/Git.cpp
// =================================================================
// Implementation of the git command executor and the plain
// repository operations built directly on it.

#include "Convoy/Git.hpp"
#include <sstream>
#include <stdexcept>

namespace Convoy {

std::string trimWhitespace(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

Git::Git(const std::string& work_dir, const std::string& git_binary)
    : m_handle(work_dir), m_git_binary(git_binary) {}

Git::Git(RepositoryHandle handle, const std::string& git_binary)
    : m_handle(std::move(handle)), m_git_binary(git_binary) {}

Git Git::withGitDir(const std::string& git_dir, const std::string& work_dir,
                    const std::string& git_binary) {
    return Git(RepositoryHandle(work_dir, git_dir), git_binary);
}

std::vector<std::string> Git::prependGitDir(const std::vector<std::string>& args) const {
    if (m_handle.git_dir.empty()) {
        return args;
    }
    std::vector<std::string> full;
    full.reserve(args.size() + 1);
    full.push_back("--git-dir=" + m_handle.git_dir);
    full.insert(full.end(), args.begin(), args.end());
    return full;
}

ProcessResult Git::runUnchecked(const std::vector<std::string>& args) const {
    SysInteraction sys;
    return sys.runProcess(m_git_binary, prependGitDir(args), m_handle.work_dir, m_env);
}

CommandError Git::makeError(const std::vector<std::string>& args, const ProcessResult& result) {
    return CommandError(CommandError::inferCommandName(args), args,
                        trimWhitespace(result.stdout_output),
                        trimWhitespace(result.stderr_output),
                        result.exit_code);
}

std::string Git::runRaw(const std::vector<std::string>& args) const {
    auto full_args = prependGitDir(args);
    SysInteraction sys;
    ProcessResult result = sys.runProcess(m_git_binary, full_args, m_handle.work_dir, m_env);
    if (result.exit_code != 0) {
        throw makeError(full_args, result);
    }
    return result.stdout_output;
}

std::string Git::run(const std::vector<std::string>& args) const {
    return trimWhitespace(runRaw(args));
}

bool Git::isRepo() const {
    return runUnchecked({"rev-parse", "--git-dir"}).exit_code == 0;
}

bool Git::hasCommits() const {
    return runUnchecked({"rev-parse", "--verify", "HEAD"}).exit_code == 0;
}

std::string Git::currentBranch() const {
    return run({"rev-parse", "--abbrev-ref", "HEAD"});
}

std::string Git::defaultBranch() const {
    // symbolic-ref works for bare repositories too
    ProcessResult result = runUnchecked({"symbolic-ref", "--short", "HEAD"});
    std::string branch = trimWhitespace(result.stdout_output);
    if (result.exit_code == 0 && !branch.empty()) {
        return branch;
    }
    return "main";
}

std::string Git::remoteDefaultBranch() const {
    ProcessResult head = runUnchecked({"symbolic-ref", "refs/remotes/origin/HEAD"});
    std::string ref = trimWhitespace(head.stdout_output);
    if (head.exit_code == 0 && !ref.empty()) {
        return ref.substr(ref.find_last_of('/') + 1);
    }
    if (runUnchecked({"rev-parse", "--verify", "origin/master"}).exit_code == 0) {
        return "master";
    }
    return "main";
}

std::string Git::remoteUrl(const std::string& remote) const {
    return run({"remote", "get-url", remote});
}

std::vector<std::string> Git::remotes() const {
    return splitLines(run({"remote"}));
}

std::string Git::configGet(const std::string& key) const {
    // Exit code 1 means the key is not set
    ProcessResult result = runUnchecked({"config", "--get", key});
    if (result.exit_code != 0) {
        return "";
    }
    return trimWhitespace(result.stdout_output);
}

void Git::configSet(const std::string& key, const std::string& value) const {
    run({"config", key, value});
}

void Git::checkout(const std::string& ref) const {
    run({"checkout", ref});
}

void Git::add(const std::vector<std::string>& paths) const {
    std::vector<std::string> args = {"add"};
    args.insert(args.end(), paths.begin(), paths.end());
    run(args);
}

void Git::commit(const std::string& message) const {
    run({"commit", "-m", message});
}

void Git::commitAll(const std::string& message) const {
    run({"commit", "-am", message});
}

void Git::fetch(const std::string& remote) const {
    run({"fetch", remote});
}

void Git::fetchBranch(const std::string& remote, const std::string& branch) const {
    run({"fetch", remote, branch});
}

void Git::pull(const std::string& remote, const std::string& branch) const {
    run({"pull", remote, branch});
}

void Git::push(const std::string& remote, const std::string& branch, bool force) const {
    std::vector<std::string> args = {"push", remote, branch};
    if (force) {
        args.push_back("--force");
    }
    run(args);
}

void Git::deleteRemoteBranch(const std::string& remote, const std::string& branch) const {
    run({"push", remote, "--delete", branch});
}

void Git::merge(const std::string& branch) const {
    run({"merge", branch});
}

void Git::mergeNoFF(const std::string& branch, const std::string& message) const {
    run({"merge", "--no-ff", "-m", message, branch});
}

void Git::mergeSquash(const std::string& branch, const std::string& message) const {
    run({"merge", "--squash", branch});
    run({"commit", "-m", message});
}

void Git::abortMerge() const {
    run({"merge", "--abort"});
}

void Git::rebase(const std::string& onto) const {
    run({"rebase", onto});
}

void Git::abortRebase() const {
    run({"rebase", "--abort"});
}

std::string Git::branchCommitMessage(const std::string& branch) const {
    return run({"log", "-1", "--format=%B", branch});
}

void Git::createBranch(const std::string& name) const {
    run({"branch", name});
}

void Git::createBranchFrom(const std::string& name, const std::string& ref) const {
    run({"branch", name, ref});
}

bool Git::branchExists(const std::string& name) const {
    std::vector<std::string> args = {"show-ref", "--verify", "--quiet", "refs/heads/" + name};
    ProcessResult result = runUnchecked(args);
    if (result.exit_code == 0) {
        return true;
    }
    if (result.exit_code == 1) {
        return false;
    }
    throw makeError(prependGitDir(args), result);
}

bool Git::remoteBranchExists(const std::string& remote, const std::string& branch) const {
    std::string wanted = "refs/heads/" + branch;
    for (const auto& line : splitLines(run({"ls-remote", "--heads", remote, branch}))) {
        std::istringstream fields(line);
        std::string sha, ref;
        fields >> sha >> ref;
        if (ref == wanted) {
            return true;
        }
    }
    return false;
}

void Git::deleteBranch(const std::string& name, bool force) const {
    run({"branch", force ? "-D" : "-d", name});
}

std::vector<std::string> Git::listBranches(const std::string& pattern) const {
    std::vector<std::string> args = {"branch", "--list", "--format=%(refname:short)"};
    if (!pattern.empty()) {
        args.push_back(pattern);
    }
    return splitLines(run(args));
}

void Git::resetBranch(const std::string& name, const std::string& ref) const {
    run({"branch", "-f", name, ref});
}

std::string Git::rev(const std::string& ref) const {
    return run({"rev-parse", ref});
}

bool Git::isAncestor(const std::string& ancestor, const std::string& descendant) const {
    std::vector<std::string> args = {"merge-base", "--is-ancestor", ancestor, descendant};
    ProcessResult result = runUnchecked(args);
    if (result.exit_code == 0) {
        return true;
    }
    // Exit code 1 means "not an ancestor"; anything else is a real failure
    if (result.exit_code == 1) {
        return false;
    }
    throw makeError(prependGitDir(args), result);
}

int Git::parseCount(const std::string& output) {
    std::string text = trimWhitespace(output);
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("parsing commit count: unexpected output '" + text + "'");
    }
    if (consumed != text.size() || value < 0) {
        throw std::runtime_error("parsing commit count: unexpected output '" + text + "'");
    }
    return value;
}

int Git::revListCount(const std::string& range) const {
    return parseCount(run({"rev-list", "--count", range}));
}

int Git::commitsAhead(const std::string& base, const std::string& branch) const {
    return revListCount(base + ".." + branch);
}

int Git::countCommitsBehind(const std::string& ref) const {
    return revListCount("HEAD.." + ref);
}

std::string Git::branchCreatedDate(const std::string& branch) const {
    ProcessResult base = runUnchecked({"merge-base", "main", branch});
    if (base.exit_code != 0) {
        return run({"log", "-1", "--format=%cs", branch});
    }
    std::string merge_base = trimWhitespace(base.stdout_output);

    auto dates = splitLines(run({"log", "--format=%cs", "--reverse", merge_base + ".." + branch}));
    if (!dates.empty()) {
        return dates.front();
    }
    // Branch still points at the merge base
    return run({"log", "-1", "--format=%cs", merge_base});
}

} // namespace Convoy
