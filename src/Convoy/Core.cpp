// =================================================================
// src/Convoy/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Convoy/Core.hpp"
#include "Convoy/Bootstrap.hpp"
#include "Convoy/ConflictProber.hpp"
#include "Convoy/Git.hpp"
#include "Convoy/GitError.hpp"
#include "Convoy/Logger.hpp"
#include "Convoy/PushStateReconciler.hpp"
#include "Convoy/SparseCheckout.hpp"
#include "Convoy/SysInteraction.hpp"
#include "Convoy/WorkStateAuditor.hpp"
#include "Convoy/WorktreeManager.hpp"
#include "nlohmann/json.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace Convoy {

namespace {

constexpr int kExitNegative = 1;
constexpr int kExitFailure = 2;

nlohmann::json toJson(const Worktree& worktree) {
    return {
        {"path", worktree.path},
        {"branch", worktree.branch},
        {"commit", worktree.commit}
    };
}

} // namespace

Core::Core(const Commands& commands)
    : m_commands(commands),
      m_config(m_config_cache.get(commands.config_path))
{
    configureLogging();
}

void Core::configureLogging() {
    Logger& logger = Logger::getInstance();
    logger.setConsoleLogLevel(m_commands.verbose ? LogLevel::DEBUG : m_config.log.console_level);
    logger.setFileLogLevel(m_config.log.file_level);

    // init runs before a log directory is wanted
    if (m_commands.active_command != "init" && !m_config.log.dir.empty()) {
        logger.enableFileLogging(m_config.log.dir, m_config.log.max_size_mb * 1024 * 1024,
                                 m_config.log.max_files);
    }
}

int Core::run() {
    auto start = std::chrono::steady_clock::now();
    Logger::getInstance().logSessionStart(m_commands.active_command, m_commands.repo_path);

    int exit_code = kExitFailure;
    try {
        exit_code = dispatch();
    } catch (const CommandError& e) {
        Logger::getInstance().logCommandFailure("Core", e);
        reportCommandError(e);
    } catch (const std::filesystem::filesystem_error& e) {
        Logger::getInstance().error("Core", "Filesystem operation failed", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
    } catch (const std::system_error& e) {
        Logger::getInstance().error("Core", "System call failed", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
    } catch (const std::runtime_error& e) {
        Logger::getInstance().error("Core", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    Logger::getInstance().logSessionEnd(m_commands.active_command, exit_code,
                                        static_cast<long>(elapsed.count()));
    Logger::getInstance().flush();
    return exit_code;
}

int Core::dispatch() {
    if (m_commands.active_command == "init") {
        return handleInit();
    } else if (m_commands.active_command == "clone") {
        return handleClone();
    } else if (m_commands.active_command == "worktree") {
        return handleWorktree();
    } else if (m_commands.active_command == "conflicts") {
        return handleConflicts();
    } else if (m_commands.active_command == "pushed") {
        return handlePushed();
    } else if (m_commands.active_command == "audit") {
        return handleAudit();
    } else if (m_commands.active_command == "sparse") {
        return handleSparse();
    }

    std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
    return kExitFailure;
}

Git Core::openRepository() const {
    if (!m_commands.git_dir.empty()) {
        return Git::withGitDir(m_commands.git_dir, m_commands.repo_path, m_config.git_binary);
    }
    return Git(m_commands.repo_path, m_config.git_binary);
}

void Core::reportCommandError(const CommandError& error) const {
    if (m_commands.json) {
        nlohmann::json out = {
            {"error", error.what()},
            {"command", error.command()},
            {"args", error.args()},
            {"exit_code", error.exitCode()},
            {"stdout", error.stdoutText()},
            {"stderr", error.stderrText()}
        };
        std::cout << out.dump(2) << std::endl;
        return;
    }

    std::cerr << "Error: " << error.what() << std::endl;
    std::cerr << "  exit code: " << error.exitCode() << std::endl;
    if (!error.stdoutText().empty()) {
        std::cerr << "  stdout: " << error.stdoutText() << std::endl;
    }
    if (!error.stderrText().empty()) {
        std::cerr << "  stderr: " << error.stderrText() << std::endl;
    }
}

int Core::handleInit() {
    std::cout << "Initializing Convoy configuration..." << std::endl;

    SysInteraction sys;
    const std::string configDir = ".convoy";
    const std::string configFile = configDir + "/config.yml";

    if (!sys.directoryExists(configDir)) {
        if (!sys.createDirectory(configDir)) {
            std::cerr << "Error: Failed to create configuration directory '" << configDir << "'." << std::endl;
            return kExitFailure;
        }
        std::cout << "Created configuration directory: " << configDir << std::endl;
    }

    if (sys.fileExists(configFile)) {
        std::cout << "Configuration file '" << configFile << "' already exists. Skipping." << std::endl;
        return 0;
    }
    if (!sys.writeFile(configFile, ConfigParser::defaultConfigText())) {
        std::cerr << "Error: Failed to write configuration file '" << configFile << "'." << std::endl;
        return kExitFailure;
    }
    std::cout << "Created default configuration file: " << configFile << std::endl;
    CONVOY_LOG_INFO("Core", "Created default configuration " + configFile);
    return 0;
}

int Core::handleClone() {
    Bootstrap bootstrap(m_config.git_binary, m_config.hooks_dir);

    if (m_commands.bare) {
        if (m_commands.reference.empty()) {
            bootstrap.cloneBare(m_commands.url, m_commands.dest);
        } else {
            bootstrap.cloneBareWithReference(m_commands.url, m_commands.dest, m_commands.reference);
        }
    } else {
        if (m_commands.reference.empty()) {
            bootstrap.clone(m_commands.url, m_commands.dest);
        } else {
            bootstrap.cloneWithReference(m_commands.url, m_commands.dest, m_commands.reference);
        }
    }

    if (!m_commands.bare) {
        for (const auto& leftover : SparseCheckout::checkExcludedFilesExist(m_commands.dest)) {
            Logger::getInstance().warning("Core", "Excluded path still present after clone", leftover);
            std::cerr << "Warning: excluded path still present: " << leftover << std::endl;
        }
    }

    std::cout << "Cloned " << m_commands.url << " into " << m_commands.dest
              << (m_commands.bare ? " (bare)" : "") << std::endl;
    return 0;
}

int Core::handleWorktree() {
    WorktreeManager manager(openRepository());
    const std::string& action = m_commands.subcommand;

    if (action == "add") {
        if (!m_commands.detach_ref.empty()) {
            manager.addDetached(m_commands.path, m_commands.detach_ref);
        } else if (m_commands.existing) {
            if (m_commands.force) {
                manager.addExistingForce(m_commands.path, m_commands.branch);
            } else {
                manager.addExisting(m_commands.path, m_commands.branch);
            }
        } else if (m_commands.branch.empty()) {
            std::cerr << "Error: worktree add needs -b <branch> or --detach <ref>." << std::endl;
            return kExitFailure;
        } else if (!m_commands.from_ref.empty()) {
            manager.addFromRef(m_commands.path, m_commands.branch, m_commands.from_ref);
        } else {
            manager.add(m_commands.path, m_commands.branch);
        }
        std::cout << "Added worktree " << m_commands.path << std::endl;
        return 0;
    }
    if (action == "remove") {
        manager.remove(m_commands.path, m_commands.force);
        std::cout << "Removed worktree " << m_commands.path << std::endl;
        return 0;
    }
    if (action == "prune") {
        manager.prune();
        CONVOY_LOG_DEBUG("Core", "Pruned stale worktree entries");
        return 0;
    }
    if (action == "list") {
        auto worktrees = manager.list();
        if (m_commands.json) {
            nlohmann::json out = nlohmann::json::array();
            for (const auto& worktree : worktrees) {
                out.push_back(toJson(worktree));
            }
            std::cout << out.dump(2) << std::endl;
        } else {
            for (const auto& worktree : worktrees) {
                std::cout << worktree.path << "  " << worktree.commit.substr(0, 12) << "  "
                          << (worktree.branch.empty() ? "(detached)" : "[" + worktree.branch + "]")
                          << std::endl;
            }
        }
        return 0;
    }

    std::cerr << "Error: Unknown worktree action '" << action << "'." << std::endl;
    return kExitFailure;
}

int Core::handleConflicts() {
    ConflictProber prober(openRepository());
    auto conflicts = prober.checkConflicts(m_commands.source, m_commands.target);

    if (m_commands.json) {
        nlohmann::json out = {
            {"source", m_commands.source},
            {"target", m_commands.target},
            {"clean", conflicts.empty()},
            {"conflicts", conflicts}
        };
        std::cout << out.dump(2) << std::endl;
    } else if (conflicts.empty()) {
        std::cout << m_commands.source << " merges cleanly into " << m_commands.target << std::endl;
    } else {
        std::cout << m_commands.source << " conflicts with " << m_commands.target << ":" << std::endl;
        for (const auto& path : conflicts) {
            std::cout << "  " << path << std::endl;
        }
    }
    return conflicts.empty() ? 0 : kExitNegative;
}

int Core::handlePushed() {
    const std::string remote = m_commands.remote.empty() ? m_config.remote : m_commands.remote;
    PushStateReconciler reconciler(openRepository(), m_config.trunk_ref);
    PushState state = reconciler.branchPushedToRemote(m_commands.branch, remote);

    if (m_commands.json) {
        nlohmann::json out = {
            {"branch", m_commands.branch},
            {"remote", remote},
            {"pushed", state.pushed},
            {"unpushed_count", state.unpushed_count}
        };
        std::cout << out.dump(2) << std::endl;
    } else if (state.pushed) {
        std::cout << m_commands.branch << " is fully pushed to " << remote << std::endl;
    } else {
        std::cout << m_commands.branch << " has " << state.unpushed_count
                  << " commit(s) not on " << remote << std::endl;
    }
    return state.pushed ? 0 : kExitNegative;
}

int Core::handleAudit() {
    WorkStateAuditor auditor(openRepository());
    UncommittedWorkStatus status = auditor.checkUncommittedWork();
    Logger::getInstance().logAudit(m_commands.repo_path, status);

    bool safe = m_commands.relaxed ? status.cleanExcluding(m_config.sync_state_dir) : status.clean();

    if (m_commands.json) {
        nlohmann::json out = {
            {"path", m_commands.repo_path},
            {"clean", safe},
            {"relaxed", m_commands.relaxed},
            {"has_uncommitted_changes", status.has_uncommitted_changes},
            {"stash_count", status.stash_count},
            {"unpushed_commits", status.unpushed_commits},
            {"modified_files", status.modified_files},
            {"untracked_files", status.untracked_files}
        };
        std::cout << out.dump(2) << std::endl;
    } else if (safe) {
        std::cout << m_commands.repo_path << ": clean"
                  << (m_commands.relaxed && !status.clean() ? " (ignoring " + m_config.sync_state_dir + ")" : "")
                  << std::endl;
    } else {
        std::cout << m_commands.repo_path << ": " << status.summary() << std::endl;
        for (const auto& path : status.modified_files) {
            std::cout << "  M " << path << std::endl;
        }
        for (const auto& path : status.untracked_files) {
            std::cout << "  ? " << path << std::endl;
        }
    }
    return safe ? 0 : kExitNegative;
}

int Core::handleSparse() {
    const std::string& path = m_commands.path;

    if (m_commands.subcommand == "apply") {
        SparseCheckout::configure(path, m_config.git_binary);
        std::cout << "Sparse-checkout exclusions applied to " << path << std::endl;
        for (const auto& leftover : SparseCheckout::checkExcludedFilesExist(path)) {
            std::cerr << "Warning: excluded path still present: " << leftover << std::endl;
        }
        return 0;
    }
    if (m_commands.subcommand != "check") {
        std::cerr << "Error: Unknown sparse action '" << m_commands.subcommand << "'." << std::endl;
        return kExitFailure;
    }

    bool configured = SparseCheckout::isConfigured(path, m_config.git_binary);
    auto leftovers = SparseCheckout::checkExcludedFilesExist(path);

    if (m_commands.json) {
        nlohmann::json out = {
            {"path", path},
            {"configured", configured},
            {"present", leftovers}
        };
        std::cout << out.dump(2) << std::endl;
    } else {
        std::cout << path << ": sparse-checkout " << (configured ? "configured" : "not configured") << std::endl;
        for (const auto& leftover : leftovers) {
            std::cout << "  still present: " << leftover << std::endl;
        }
    }
    return configured && leftovers.empty() ? 0 : kExitNegative;
}

} // namespace Convoy
