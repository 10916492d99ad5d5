// =================================================================
// include/Convoy/SysInteraction.hpp
// =================================================================
// Defines the interface for system-level operations like file I/O
// and running external processes.

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace Convoy {

/**
 * @brief Captured result of a finished child process.
 */
struct ProcessResult {
    std::string stdout_output;  ///< Everything the child wrote to stdout
    std::string stderr_output;  ///< Everything the child wrote to stderr
    int exit_code = 0;          ///< Exit status, or -signal if killed by a signal
};

using EnvironmentOverrides = std::vector<std::pair<std::string, std::string>>;

class SysInteraction {
public:
    /**
     * @brief Reads the entire content of a file into a string.
     * @param file_path The path to the file.
     * @return The content of the file. Throws std::runtime_error on failure.
     */
    std::string readFile(const std::string& file_path);

    /**
     * @brief Writes content to a file, overwriting it.
     * @param file_path The path to the file.
     * @param content The content to write.
     * @return True on success, false on failure.
     */
    bool writeFile(const std::string& file_path, const std::string& content);

    /**
     * @brief Checks if a file exists.
     */
    bool fileExists(const std::string& file_path);

    /**
     * @brief Checks if a directory exists.
     */
    bool directoryExists(const std::string& dir_path);

    /**
     * @brief Creates a directory.
     */
    bool createDirectory(const std::string& dir_path);

    /**
     * @brief Runs an external program directly (no shell) and waits for it.
     *
     * stdout and stderr are captured into separate buffers. The program is
     * looked up on PATH. A non-zero exit is not an error here; it is
     * reported through ProcessResult::exit_code.
     *
     * @param command Program to execute.
     * @param args Arguments, not including argv[0].
     * @param working_dir Directory to run in; empty keeps the current one.
     * @param env Variables set on top of the inherited environment.
     * @return Captured output and exit status.
     * @throws std::system_error if the program could not be started.
     */
    ProcessResult runProcess(const std::string& command,
                             const std::vector<std::string>& args,
                             const std::string& working_dir = "",
                             const EnvironmentOverrides& env = {});
};

} // namespace Convoy
