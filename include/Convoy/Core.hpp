// =================================================================
// include/Convoy/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "Convoy/CliParser.hpp"
#include "Convoy/ConfigParser.hpp"
#include <string>

namespace Convoy {

class CommandError;
class Git;

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Runs the command selected on the command line.
     * @return 0 on success, 1 for a negative answer (conflicts, unpushed
     *         work, dirty workspace, missing exclusions), 2 on failure.
     */
    int run();

private:
    // Command Handlers
    int handleInit();
    int handleClone();
    int handleWorktree();
    int handleConflicts();
    int handlePushed();
    int handleAudit();
    int handleSparse();

    int dispatch();
    void configureLogging();
    Git openRepository() const;
    void reportCommandError(const CommandError& error) const;

    const Commands& m_commands;
    ConfigCache m_config_cache;
    ConvoyConfig m_config;
};

} // namespace Convoy
