// =================================================================
// src/Convoy/WorkStateAuditor.cpp
// =================================================================
// Implementation of the work-state audit used before reaping worktrees.

#include "Convoy/WorkStateAuditor.hpp"
#include <sstream>
#include <stdexcept>

namespace Convoy {

namespace {

bool insideDirectory(const std::string& path, const std::string& dir) {
    return path.find(dir + "/") != std::string::npos ||
           path.find(dir + "\\") != std::string::npos;
}

std::string plural(int count, const std::string& noun, const std::string& suffix) {
    return std::to_string(count) + " " + noun + (count == 1 ? "" : suffix);
}

} // namespace

bool UncommittedWorkStatus::clean() const {
    return !has_uncommitted_changes && stash_count == 0 && unpushed_commits == 0;
}

bool UncommittedWorkStatus::cleanExcluding(const std::string& dir) const {
    if (stash_count > 0 || unpushed_commits > 0) {
        return false;
    }
    for (const auto& path : modified_files) {
        if (!insideDirectory(path, dir)) {
            return false;
        }
    }
    for (const auto& path : untracked_files) {
        if (!insideDirectory(path, dir)) {
            return false;
        }
    }
    return true;
}

std::string UncommittedWorkStatus::summary() const {
    if (clean()) {
        return "clean";
    }

    std::vector<std::string> parts;
    if (has_uncommitted_changes) {
        int changes = static_cast<int>(modified_files.size() + untracked_files.size());
        parts.push_back(plural(changes, "uncommitted change", "s"));
    }
    if (stash_count > 0) {
        parts.push_back(plural(stash_count, "stash", "es"));
    }
    if (unpushed_commits > 0) {
        parts.push_back(plural(unpushed_commits, "unpushed commit", "s"));
    }

    std::ostringstream out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << parts[i];
    }
    return out.str();
}

WorkStateAuditor::WorkStateAuditor(const Git& git) : m_git(git) {}

GitStatus WorkStateAuditor::parsePorcelainStatus(const std::string& output) {
    GitStatus status;

    size_t pos = 0;
    while (pos < output.size()) {
        size_t end = output.find('\0', pos);
        if (end == std::string::npos) {
            end = output.size();
        }
        std::string entry = output.substr(pos, end - pos);
        pos = end + 1;

        if (entry.empty()) {
            continue;
        }
        if (entry.size() < 4) {
            throw std::runtime_error("malformed status entry: '" + entry + "'");
        }

        char index = entry[0];
        char worktree = entry[1];
        std::string path = entry.substr(3);

        if (index == 'R' || index == 'C' || worktree == 'R' || worktree == 'C') {
            // The original path follows as its own NUL-terminated field
            if (pos >= output.size()) {
                throw std::runtime_error("rename entry without source path: '" + path + "'");
            }
            size_t source_end = output.find('\0', pos);
            pos = source_end == std::string::npos ? output.size() : source_end + 1;
            status.added.push_back(path);
        } else if (index == '?' && worktree == '?') {
            status.untracked.push_back(path);
        } else if (index == '!' && worktree == '!') {
            continue;
        } else if (index == 'U' || worktree == 'U' || (index == 'A' && worktree == 'A') ||
                   (index == 'D' && worktree == 'D')) {
            status.modified.push_back(path);
        } else if (index == 'A') {
            status.added.push_back(path);
        } else if (index == 'D' || worktree == 'D') {
            status.deleted.push_back(path);
        } else {
            status.modified.push_back(path);
        }
    }

    status.clean = status.modified.empty() && status.added.empty() &&
                   status.deleted.empty() && status.untracked.empty();
    return status;
}

GitStatus WorkStateAuditor::status() const {
    return parsePorcelainStatus(m_git.runRaw({"status", "--porcelain", "-z"}));
}

int WorkStateAuditor::stashCount() const {
    return static_cast<int>(splitLines(m_git.run({"stash", "list"})).size());
}

int WorkStateAuditor::unpushedCommits() const {
    ProcessResult upstream = m_git.runUnchecked({"rev-parse", "--abbrev-ref", "@{u}"});
    if (upstream.exit_code != 0) {
        // No upstream configured, nothing to compare against
        return 0;
    }
    return m_git.revListCount(trimWhitespace(upstream.stdout_output) + "..HEAD");
}

bool WorkStateAuditor::hasUncommittedChanges() const {
    return !status().clean;
}

UncommittedWorkStatus WorkStateAuditor::checkUncommittedWork() const {
    UncommittedWorkStatus result;

    GitStatus current = status();
    result.has_uncommitted_changes = !current.clean;
    result.modified_files.insert(result.modified_files.end(), current.modified.begin(), current.modified.end());
    result.modified_files.insert(result.modified_files.end(), current.added.begin(), current.added.end());
    result.modified_files.insert(result.modified_files.end(), current.deleted.begin(), current.deleted.end());
    result.untracked_files = current.untracked;

    result.stash_count = stashCount();
    result.unpushed_commits = unpushedCommits();
    return result;
}

} // namespace Convoy
