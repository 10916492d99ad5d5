// =================================================================
// src/Convoy/ConflictProber.cpp
// =================================================================
// Implementation of the reversible trial merge.

#include "Convoy/ConflictProber.hpp"
#include "Convoy/Logger.hpp"

namespace Convoy {

ConflictProber::ConflictProber(const Git& git) : m_git(git) {}

std::vector<std::string> ConflictProber::checkConflicts(const std::string& source,
                                                        const std::string& target) const {
    m_git.checkout(target);
    const std::string original_head = m_git.rev("HEAD");

    try {
        m_git.run({"merge", "--no-commit", "--no-ff", source});
    } catch (const CommandError& merge_error) {
        std::vector<std::string> conflicts;
        try {
            conflicts = conflictingFiles();
        } catch (const CommandError& e) {
            Logger::getInstance().logCommandFailure("ConflictProber", e, LogLevel::DEBUG);
        }

        restore(original_head, true);

        if (!conflicts.empty()) {
            Logger::getInstance().debug("ConflictProber",
                                        source + " conflicts with " + target,
                                        std::to_string(conflicts.size()) + " path(s)");
            return conflicts;
        }
        // Not a content conflict: unrelated histories, unknown ref, ...
        throw;
    }

    // The merge went through; merge --abort is not valid here, so reset
    restore(original_head, false);
    return {};
}

std::vector<std::string> ConflictProber::conflictingFiles() const {
    return splitLines(m_git.run({"diff", "--name-only", "--diff-filter=U"}));
}

void ConflictProber::restore(const std::string& original_head, bool merge_failed) const {
    if (merge_failed) {
        ProcessResult abort = m_git.runUnchecked({"merge", "--abort"});
        if (abort.exit_code == 0) {
            return;
        }
        Logger::getInstance().debug("ConflictProber", "merge --abort failed, resetting",
                                    trimWhitespace(abort.stderr_output));
    }

    ProcessResult reset = m_git.runUnchecked({"reset", "--hard", original_head});
    if (reset.exit_code != 0) {
        Logger::getInstance().warning("ConflictProber", "Could not reset after trial merge",
                                      trimWhitespace(reset.stderr_output));
    }
}

} // namespace Convoy
