// =================================================================
// include/Convoy/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>

namespace Convoy {

// Parsed command-line state.
struct Commands {
    std::string active_command;  // Name of the subcommand triggered
    std::string subcommand;      // Nested action for 'worktree' and 'sparse'

    // Global options
    std::string repo_path = ".";
    std::string git_dir;
    std::string config_path = ".convoy/config.yml";
    bool verbose = false;
    bool json = false;

    // 'clone'
    std::string url;
    std::string dest;
    std::string reference;
    bool bare = false;

    // 'worktree'
    std::string path;
    std::string branch;
    std::string from_ref;
    std::string detach_ref;
    bool existing = false;
    bool force = false;

    // 'conflicts'
    std::string source;
    std::string target;

    // 'pushed'
    std::string remote;

    // 'audit'
    bool relaxed = false;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupInitCommand(CLI::App& app);
    void setupCloneCommand(CLI::App& app);
    void setupWorktreeCommand(CLI::App& app);
    void setupConflictsCommand(CLI::App& app);
    void setupPushedCommand(CLI::App& app);
    void setupAuditCommand(CLI::App& app);
    void setupSparseCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Convoy
