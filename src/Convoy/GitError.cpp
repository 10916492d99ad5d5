// =================================================================
// src/Convoy/GitError.cpp
// =================================================================

#include "Convoy/GitError.hpp"

namespace Convoy {

static std::string describe(const std::string& command, const std::string& stderr_output,
                            int exit_code) {
    if (!stderr_output.empty()) {
        return "git " + command + ": " + stderr_output;
    }
    return "git " + command + ": exit status " + std::to_string(exit_code);
}

CommandError::CommandError(std::string command, std::vector<std::string> args,
                           std::string stdout_output, std::string stderr_output, int exit_code)
    : std::runtime_error(describe(command, stderr_output, exit_code)),
      m_command(std::move(command)),
      m_args(std::move(args)),
      m_stdout(std::move(stdout_output)),
      m_stderr(std::move(stderr_output)),
      m_exit_code(exit_code) {}

std::string CommandError::inferCommandName(const std::vector<std::string>& args) {
    for (const auto& arg : args) {
        if (!arg.empty() && arg[0] != '-') {
            return arg;
        }
    }
    return args.empty() ? std::string() : args.front();
}

} // namespace Convoy
