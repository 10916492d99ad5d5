// =================================================================
// include/Convoy/GitError.hpp
// =================================================================
// Error raised when a git subcommand exits with a non-zero status.

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace Convoy {

/**
 * @brief A failed git invocation, carrying the raw process output.
 *
 * The error does not guess why git failed. Callers that need to tell
 * failure classes apart (missing ref, held lock, merge conflict) inspect
 * stdoutText(), stderrText() and exitCode() themselves.
 */
class CommandError : public std::runtime_error {
public:
    CommandError(std::string command, std::vector<std::string> args,
                 std::string stdout_output, std::string stderr_output, int exit_code);

    /// Subcommand name: first non-flag argument, else the first argument.
    const std::string& command() const { return m_command; }

    /// Full argument vector as passed to git (without the binary name).
    const std::vector<std::string>& args() const { return m_args; }

    const std::string& stdoutText() const { return m_stdout; }
    const std::string& stderrText() const { return m_stderr; }

    /// Process exit status; negative when the child was killed by a signal.
    int exitCode() const { return m_exit_code; }

    /**
     * @brief Infers the subcommand name from an argument vector.
     * @param args Arguments as passed to git.
     * @return First argument not starting with '-', else the first argument,
     *         else an empty string.
     */
    static std::string inferCommandName(const std::vector<std::string>& args);

private:
    std::string m_command;
    std::vector<std::string> m_args;
    std::string m_stdout;
    std::string m_stderr;
    int m_exit_code;
};

} // namespace Convoy
