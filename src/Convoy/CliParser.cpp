// =================================================================
// src/Convoy/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Convoy/CliParser.hpp"

namespace Convoy {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Convoy: git worktree and merge-safety tooling for parallel agents.");
    m_app->require_subcommand(1);

    m_app->add_option("-C,--repo", m_commands.repo_path, "Repository or worktree to operate on (default: .)");
    m_app->add_option("--git-dir", m_commands.git_dir, "Explicit git directory, bypassing repository discovery");
    m_app->add_option("--config", m_commands.config_path, "Configuration file (default: .convoy/config.yml)");
    m_app->add_flag("-v,--verbose", m_commands.verbose, "Show debug output on the console");
    m_app->add_flag("--json", m_commands.json, "Print results as JSON");

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    setupInitCommand(*m_app);
    setupCloneCommand(*m_app);
    setupWorktreeCommand(*m_app);
    setupConflictsCommand(*m_app);
    setupPushedCommand(*m_app);
    setupAuditCommand(*m_app);
    setupSparseCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupInitCommand(CLI::App& app) {
    app.add_subcommand("init", "Writes a default .convoy/config.yml in the current directory.");
}

void CliParser::setupCloneCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("clone", "Clones a repository with hooks, sparse-checkout and refspec configured.");
    sub->add_option("url", m_commands.url, "Repository to clone.")->required();
    sub->add_option("dest", m_commands.dest, "Destination directory; must not exist.")->required();
    sub->add_option("--reference", m_commands.reference, "Local repository to share objects with.")
        ->check(CLI::ExistingDirectory);
    sub->add_flag("--bare", m_commands.bare, "Create a bare repository for hosting worktrees.");
}

void CliParser::setupWorktreeCommand(CLI::App& app) {
    auto* worktree_cmd = app.add_subcommand("worktree", "Manage linked worktrees");
    worktree_cmd->require_subcommand(1);

    auto* add_cmd = worktree_cmd->add_subcommand("add", "Add a worktree");
    add_cmd->add_option("path", m_commands.path, "Location of the new worktree.")->required();
    auto* branch_opt = add_cmd->add_option("-b,--branch", m_commands.branch, "Branch to create (or check out with --existing).");
    auto* from_opt = add_cmd->add_option("--from", m_commands.from_ref, "Start point of the new branch (e.g. origin/main).");
    auto* detach_opt = add_cmd->add_option("--detach", m_commands.detach_ref, "Check out this ref with a detached HEAD.");
    auto* existing_flag = add_cmd->add_flag("--existing", m_commands.existing, "Check out an existing branch instead of creating one.");
    add_cmd->add_flag("--force", m_commands.force, "With --existing, allow a branch checked out elsewhere.");
    from_opt->needs(branch_opt);
    existing_flag->needs(branch_opt);
    existing_flag->excludes(from_opt);
    detach_opt->excludes(branch_opt);
    add_cmd->callback([this]() { m_commands.subcommand = "add"; });

    auto* remove_cmd = worktree_cmd->add_subcommand("remove", "Remove a worktree");
    remove_cmd->add_option("path", m_commands.path, "Worktree to remove.")->required();
    remove_cmd->add_flag("--force", m_commands.force, "Remove even with local changes.");
    remove_cmd->callback([this]() { m_commands.subcommand = "remove"; });

    auto* prune_cmd = worktree_cmd->add_subcommand("prune", "Forget worktrees whose directories are gone");
    prune_cmd->callback([this]() { m_commands.subcommand = "prune"; });

    auto* list_cmd = worktree_cmd->add_subcommand("list", "List worktrees");
    list_cmd->callback([this]() { m_commands.subcommand = "list"; });
}

void CliParser::setupConflictsCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("conflicts", "Reports whether source would merge cleanly into target.");
    sub->add_option("source", m_commands.source, "Branch to merge.")->required();
    sub->add_option("target", m_commands.target, "Branch receiving the merge.")->required();
}

void CliParser::setupPushedCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("pushed", "Reports whether a branch's commits have reached the remote.");
    sub->add_option("branch", m_commands.branch, "Branch to check.")->required();
    sub->add_option("--remote", m_commands.remote, "Remote name (default from configuration).");
}

void CliParser::setupAuditCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("audit", "Reports uncommitted changes, stashes and unpushed commits.");
    sub->add_flag("--relaxed", m_commands.relaxed, "Ignore changes inside the synchronized-state directory.");
}

void CliParser::setupSparseCommand(CLI::App& app) {
    auto* sparse_cmd = app.add_subcommand("sparse", "Inspect or apply the sparse-checkout exclusions");
    sparse_cmd->require_subcommand(1);

    auto* check_cmd = sparse_cmd->add_subcommand("check", "Verify exclusions are configured and applied");
    check_cmd->add_option("path", m_commands.path, "Working copy to check.")->required();
    check_cmd->callback([this]() { m_commands.subcommand = "check"; });

    auto* apply_cmd = sparse_cmd->add_subcommand("apply", "Configure exclusions on an existing working copy");
    apply_cmd->add_option("path", m_commands.path, "Working copy to configure.")->required();
    apply_cmd->callback([this]() { m_commands.subcommand = "apply"; });
}

} // namespace Convoy
