// =================================================================
// tests/CommandExecutorTest.cpp
// =================================================================
// Unit tests for process execution and git command error reporting.

#include "Convoy/Git.hpp"
#include "Convoy/GitError.hpp"
#include "Convoy/SysInteraction.hpp"
#include "TestRepository.hpp"
#include <cassert>
#include <cerrno>
#include <iostream>
#include <stdexcept>
#include <system_error>

using ConvoyTest::ScratchDirectory;

class CommandExecutorTest {
public:
    void testRunProcessCapturesBothStreams() {
        std::cout << "Testing separate stdout/stderr capture..." << std::endl;

        Convoy::SysInteraction sys;
        auto result = sys.runProcess("sh", {"-c", "printf out; printf err >&2; exit 3"});

        assert(result.stdout_output == "out");
        assert(result.stderr_output == "err");
        assert(result.exit_code == 3 && "Exit status should be reported as-is");

        std::cout << "✓ Stream capture test passed" << std::endl;
    }

    void testRunProcessEnvironmentAndDirectory() {
        std::cout << "Testing environment overrides and working directory..." << std::endl;

        ScratchDirectory scratch;
        Convoy::SysInteraction sys;
        auto result = sys.runProcess("sh", {"-c", "printf '%s|' \"$CONVOY_PROBE\"; pwd -P"},
                                     scratch.path().string(), {{"CONVOY_PROBE", "42"}});

        assert(result.exit_code == 0);
        std::string expected_dir = std::filesystem::canonical(scratch.path()).string();
        assert(result.stdout_output == "42|" + expected_dir + "\n");

        std::cout << "✓ Environment and directory test passed" << std::endl;
    }

    void testRunProcessLargeOutput() {
        std::cout << "Testing output larger than a pipe buffer..." << std::endl;

        Convoy::SysInteraction sys;
        // Writes 200000 bytes to each stream, enough to block a naive reader
        auto result = sys.runProcess("sh", {"-c",
            "head -c 200000 /dev/zero | tr '\\0' a; head -c 200000 /dev/zero | tr '\\0' b >&2"});

        assert(result.exit_code == 0);
        assert(result.stdout_output.size() == 200000);
        assert(result.stderr_output.size() == 200000);
        assert(result.stdout_output.find('b') == std::string::npos);

        std::cout << "✓ Large output test passed" << std::endl;
    }

    void testLaunchFailureIsSystemError() {
        std::cout << "Testing launch failure of a missing program..." << std::endl;

        Convoy::SysInteraction sys;
        bool threw = false;
        try {
            sys.runProcess("convoy-no-such-program-xyz", {});
        } catch (const std::system_error& e) {
            threw = true;
            assert(e.code().value() == ENOENT);
        }
        assert(threw && "Missing program should raise std::system_error");

        Convoy::Git git(".", "convoy-no-such-git-xyz");
        threw = false;
        try {
            git.run({"status"});
        } catch (const std::system_error&) {
            threw = true;
        }
        assert(threw && "Git wrapper should surface launch failures unchanged");

        std::cout << "✓ Launch failure test passed" << std::endl;
    }

    void testCommandErrorCarriesRawOutput() {
        std::cout << "Testing CommandError contents..." << std::endl;

        ScratchDirectory scratch;
        Convoy::Git git(scratch.path().string());
        // GIT_CEILING_DIRECTORIES keeps discovery from escaping the scratch dir
        git.setEnvironment({{"GIT_CEILING_DIRECTORIES", scratch.path().parent_path().string()}});

        bool threw = false;
        try {
            git.run({"rev-parse", "HEAD"});
        } catch (const Convoy::CommandError& e) {
            threw = true;
            assert(e.command() == "rev-parse");
            assert(e.args().size() == 2 && e.args()[1] == "HEAD");
            assert(e.exitCode() == 128);
            assert(!e.stderrText().empty());
            assert(e.stderrText().back() != '\n' && "stderr should be trimmed");
            assert(std::string(e.what()).rfind("git rev-parse: ", 0) == 0);
        }
        assert(threw && "Non-zero exit should raise CommandError");

        auto result = git.runUnchecked({"rev-parse", "HEAD"});
        assert(result.exit_code == 128 && "runUnchecked should not throw");

        std::cout << "✓ CommandError test passed" << std::endl;
    }

    void testCommandErrorMessageWithoutStderr() {
        std::cout << "Testing error message without stderr..." << std::endl;

        Convoy::CommandError error("diff", {"diff", "--quiet"}, "", "", 1);
        assert(std::string(error.what()) == "git diff: exit status 1");

        Convoy::CommandError with_stderr("push", {"push"}, "", "rejected", 1);
        assert(std::string(with_stderr.what()) == "git push: rejected");

        std::cout << "✓ Error message test passed" << std::endl;
    }

    void testInferCommandName() {
        std::cout << "Testing command name inference..." << std::endl;

        using Convoy::CommandError;
        assert(CommandError::inferCommandName({"--git-dir=/x", "-c", "fetch", "origin"}) == "fetch");
        assert(CommandError::inferCommandName({"--version"}) == "--version");
        assert(CommandError::inferCommandName({}).empty());

        std::cout << "✓ Command name inference test passed" << std::endl;
    }

    void testGitDirIsPrepended() {
        std::cout << "Testing explicit git dir handling..." << std::endl;

        ScratchDirectory scratch;
        Convoy::Git(scratch.path().string()).run({"init", "--bare", "--initial-branch=main", "bare.git"});

        Convoy::Git git = Convoy::Git::withGitDir(scratch / "bare.git");
        assert(git.run({"rev-parse", "--is-bare-repository"}) == "true");

        bool threw = false;
        try {
            git.run({"rev-parse", "--verify", "HEAD"});
        } catch (const Convoy::CommandError& e) {
            threw = true;
            assert(e.args().front() == "--git-dir=" + (scratch / "bare.git"));
            assert(e.command() == "rev-parse");
        }
        assert(threw && "Empty repository has no HEAD commit");

        std::cout << "✓ Git dir test passed" << std::endl;
    }

    void testPredicatesUseExitStatus() {
        std::cout << "Testing exit-status predicates..." << std::endl;

        ScratchDirectory scratch;
        Convoy::Git git = ConvoyTest::initRepository(scratch / "repo");
        ConvoyTest::commitFile(git, "a.txt", "a\n", "first");
        std::string first = git.rev("HEAD");
        ConvoyTest::commitFile(git, "b.txt", "b\n", "second");

        assert(git.branchExists("main"));
        assert(!git.branchExists("no-such-branch"));
        assert(git.isAncestor(first, "HEAD"));
        assert(!git.isAncestor("HEAD", first));
        assert(git.revListCount(first + "..HEAD") == 1);
        assert(git.commitsAhead(first, "main") == 1);
        assert(git.currentBranch() == "main");
        assert(git.defaultBranch() == "main");
        assert(git.configGet("convoy.missing-key").empty());

        bool threw = false;
        try {
            git.isAncestor("no-such-ref", "HEAD");
        } catch (const Convoy::CommandError&) {
            threw = true;
        }
        assert(threw && "Unknown refs are errors, not a negative answer");

        std::cout << "✓ Predicate test passed" << std::endl;
    }

    void testParseCount() {
        std::cout << "Testing count parsing..." << std::endl;

        assert(Convoy::Git::parseCount("7") == 7);
        assert(Convoy::Git::parseCount(" 12\n") == 12);

        bool threw = false;
        try {
            Convoy::Git::parseCount("seven");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);

        std::cout << "✓ Count parsing test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running command executor unit tests..." << std::endl;

        testRunProcessCapturesBothStreams();
        testRunProcessEnvironmentAndDirectory();
        testRunProcessLargeOutput();
        testLaunchFailureIsSystemError();
        testCommandErrorCarriesRawOutput();
        testCommandErrorMessageWithoutStderr();
        testInferCommandName();
        testGitDirIsPrepended();
        testPredicatesUseExitStatus();
        testParseCount();

        std::cout << "All command executor tests passed!" << std::endl;
    }
};

int main() {
    try {
        CommandExecutorTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
