// =================================================================
// tests/WorktreeListTest.cpp
// =================================================================
// Unit tests for `git worktree list --porcelain` parsing.

#include "Convoy/WorktreeManager.hpp"
#include <cassert>
#include <iostream>
#include <string>

using Convoy::WorktreeManager;

class WorktreeListTest {
public:
    void testRecordsSeparatedByBlankLines() {
        std::cout << "Testing multi-record output..." << std::endl;

        const std::string output =
            "worktree /srv/project.git\n"
            "bare\n"
            "\n"
            "worktree /srv/agents/alpha\n"
            "HEAD 1111111111111111111111111111111111111111\n"
            "branch refs/heads/feature/alpha\n"
            "\n"
            "worktree /srv/agents/beta\n"
            "HEAD 2222222222222222222222222222222222222222\n"
            "detached\n"
            "\n";

        auto worktrees = WorktreeManager::parsePorcelain(output);
        assert(worktrees.size() == 3);

        assert(worktrees[0].path == "/srv/project.git");
        assert(worktrees[0].commit.empty() && worktrees[0].branch.empty());

        assert(worktrees[1].path == "/srv/agents/alpha");
        assert(worktrees[1].branch == "feature/alpha" && "refs/heads/ should be stripped");
        assert(worktrees[1].commit == "1111111111111111111111111111111111111111");

        assert(worktrees[2].branch.empty() && "Detached worktree has no branch");

        std::cout << "✓ Multi-record test passed" << std::endl;
    }

    void testLastRecordWithoutTrailingBlankLine() {
        std::cout << "Testing final record flush..." << std::endl;

        // The trimmed output ends right after the last field
        const std::string output =
            "worktree /repo\n"
            "HEAD abc\n"
            "branch refs/heads/main\n"
            "\n"
            "worktree /repo-wt\n"
            "HEAD def\n"
            "branch refs/heads/topic";

        auto worktrees = WorktreeManager::parsePorcelain(output);
        assert(worktrees.size() == 2);
        assert(worktrees[1].path == "/repo-wt");
        assert(worktrees[1].branch == "topic");

        std::cout << "✓ Final record test passed" << std::endl;
    }

    void testLockedAndPrunableAnnotationsIgnored() {
        std::cout << "Testing extra annotations..." << std::endl;

        const std::string output =
            "worktree /path with spaces/wt\n"
            "HEAD abc\n"
            "branch refs/heads/x\n"
            "locked reason here\n"
            "prunable gitdir file points to non-existent location\n";

        auto worktrees = WorktreeManager::parsePorcelain(output);
        assert(worktrees.size() == 1);
        assert(worktrees[0].path == "/path with spaces/wt");
        assert(worktrees[0].branch == "x");

        std::cout << "✓ Annotation test passed" << std::endl;
    }

    void testEmptyOutput() {
        std::cout << "Testing empty output..." << std::endl;
        assert(WorktreeManager::parsePorcelain("").empty());
        std::cout << "✓ Empty output test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running worktree list parsing unit tests..." << std::endl;

        testRecordsSeparatedByBlankLines();
        testLastRecordWithoutTrailingBlankLine();
        testLockedAndPrunableAnnotationsIgnored();
        testEmptyOutput();

        std::cout << "All worktree list parsing tests passed!" << std::endl;
    }
};

int main() {
    try {
        WorktreeListTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
