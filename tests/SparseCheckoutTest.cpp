// =================================================================
// tests/SparseCheckoutTest.cpp
// =================================================================
// Tests for sparse-checkout exclusion of agent-instruction files.

#include "Convoy/SparseCheckout.hpp"
#include "TestRepository.hpp"
#include <algorithm>
#include <cassert>
#include <iostream>

using ConvoyTest::ScratchDirectory;
using Convoy::SparseCheckout;
namespace fs = std::filesystem;

class SparseCheckoutTest {
private:
    static bool contains(const std::vector<std::string>& list, const std::string& item) {
        return std::find(list.begin(), list.end(), item) != list.end();
    }

public:
    void testPatternFileContent() {
        std::cout << "Testing pattern file content..." << std::endl;

        assert(SparseCheckout::patternFileContent() ==
               "/*\n!/.claude/\n!/CLAUDE.md\n!/CLAUDE.local.md\n");

        bool mcp_listed = false;
        for (const auto& path : SparseCheckout::excludedPaths()) {
            mcp_listed = mcp_listed || path.name == ".mcp.json";
        }
        assert(!mcp_listed && "MCP server config must stay checked out");

        std::cout << "✓ Pattern file test passed" << std::endl;
    }

    void testConfigureRemovesTrackedArtifacts() {
        std::cout << "Testing exclusion of committed agent files..." << std::endl;

        ScratchDirectory scratch;
        std::string repo = scratch / "repo";
        Convoy::Git git = ConvoyTest::initRepository(repo);
        ConvoyTest::writeFile(repo + "/CLAUDE.md", "instructions\n");
        ConvoyTest::writeFile(repo + "/.claude/settings.json", "{}\n");
        ConvoyTest::writeFile(repo + "/.mcp.json", "{}\n");
        ConvoyTest::writeFile(repo + "/src/app.cpp", "int main() {}\n");
        git.add({"."});
        git.commit("Initial commit");

        assert(!SparseCheckout::isConfigured(repo));

        SparseCheckout::configure(repo);

        assert(!fs::exists(repo + "/CLAUDE.md"));
        assert(!fs::exists(repo + "/.claude"));
        assert(fs::exists(repo + "/.mcp.json"));
        assert(fs::exists(repo + "/src/app.cpp"));
        assert(SparseCheckout::checkExcludedFilesExist(repo).empty());
        assert(SparseCheckout::isConfigured(repo));
        assert(git.configGet("core.sparseCheckout") == "true");

        std::cout << "✓ Tracked artifact test passed" << std::endl;
    }

    void testUntrackedArtifactsAreReported() {
        std::cout << "Testing untracked leftovers..." << std::endl;

        ScratchDirectory scratch;
        std::string repo = scratch / "repo";
        Convoy::Git git = ConvoyTest::initRepository(repo);
        ConvoyTest::commitFile(git, "README.md", "readme\n", "Initial commit");
        ConvoyTest::writeFile(repo + "/CLAUDE.local.md", "personal\n");

        SparseCheckout::configure(repo);

        auto remaining = SparseCheckout::checkExcludedFilesExist(repo);
        assert(remaining.size() == 1);
        assert(contains(remaining, "CLAUDE.local.md"));

        std::cout << "✓ Untracked leftover test passed" << std::endl;
    }

    void testRepositoryWithoutCommits() {
        std::cout << "Testing configuration of an empty repository..." << std::endl;

        ScratchDirectory scratch;
        std::string repo = scratch / "empty";
        ConvoyTest::initRepository(repo);

        SparseCheckout::configure(repo);
        assert(SparseCheckout::isConfigured(repo));

        std::cout << "✓ Empty repository test passed" << std::endl;
    }

    void testLegacyPatternSpelling() {
        std::cout << "Testing legacy pattern spelling..." << std::endl;

        ScratchDirectory scratch;
        std::string repo = scratch / "repo";
        Convoy::Git git = ConvoyTest::initRepository(repo);
        git.configSet("core.sparseCheckout", "true");
        ConvoyTest::writeFile(repo + "/.git/info/sparse-checkout", "/*\n!.claude/\n!CLAUDE.md\n");
        assert(SparseCheckout::isConfigured(repo));

        // Missing a required entry
        ConvoyTest::writeFile(repo + "/.git/info/sparse-checkout", "/*\n!/.claude/\n");
        assert(!SparseCheckout::isConfigured(repo));

        // Pattern file without the config switch
        ConvoyTest::writeFile(repo + "/.git/info/sparse-checkout", SparseCheckout::patternFileContent());
        git.configSet("core.sparseCheckout", "false");
        assert(!SparseCheckout::isConfigured(repo));

        std::cout << "✓ Legacy spelling test passed" << std::endl;
    }

    void testResolveGitDirIsAbsolute() {
        std::cout << "Testing git dir resolution..." << std::endl;

        ScratchDirectory scratch;
        std::string repo = scratch / "repo";
        ConvoyTest::initRepository(repo);

        fs::path git_dir = SparseCheckout::resolveGitDir(repo);
        assert(git_dir.is_absolute());
        assert(fs::equivalent(git_dir, fs::path(repo) / ".git"));

        std::cout << "✓ Git dir resolution test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running SparseCheckout tests..." << std::endl;

        testPatternFileContent();
        testConfigureRemovesTrackedArtifacts();
        testUntrackedArtifactsAreReported();
        testRepositoryWithoutCommits();
        testLegacyPatternSpelling();
        testResolveGitDirIsAbsolute();

        std::cout << "All SparseCheckout tests passed!" << std::endl;
    }
};

int main() {
    try {
        SparseCheckoutTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
