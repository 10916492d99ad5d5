// =================================================================
// tests/WorkStateAuditorTest.cpp
// =================================================================
// Integration tests for the work-state audit of a real working copy.

#include "Convoy/WorkStateAuditor.hpp"
#include "TestRepository.hpp"
#include <algorithm>
#include <cassert>
#include <filesystem>
#include <iostream>

using ConvoyTest::OriginFixture;
using ConvoyTest::ScratchDirectory;
using Convoy::WorkStateAuditor;

class WorkStateAuditorTest {
private:
    Convoy::Git cloneOf(const ScratchDirectory& scratch, const OriginFixture& origin) {
        Convoy::Git(scratch.path().string()).run({"clone", "--quiet", origin.origin_path, scratch / "work"});
        Convoy::Git git(scratch / "work");
        ConvoyTest::configureIdentity(git);
        return git;
    }

    static bool contains(const std::vector<std::string>& list, const std::string& item) {
        return std::find(list.begin(), list.end(), item) != list.end();
    }

public:
    void testFreshCloneIsClean() {
        std::cout << "Testing a fresh clone..." << std::endl;

        ScratchDirectory scratch;
        OriginFixture origin(scratch);
        WorkStateAuditor auditor(cloneOf(scratch, origin));

        assert(auditor.status().clean);
        assert(!auditor.hasUncommittedChanges());
        assert(auditor.stashCount() == 0);
        assert(auditor.unpushedCommits() == 0);

        auto report = auditor.checkUncommittedWork();
        assert(report.clean());
        assert(report.summary() == "clean");

        std::cout << "✓ Fresh clone test passed" << std::endl;
    }

    void testWorkingTreeChanges() {
        std::cout << "Testing modified, added, deleted and untracked files..." << std::endl;

        ScratchDirectory scratch;
        OriginFixture origin(scratch, {{"README.md", "readme\n"}, {"old.txt", "old\n"}});
        Convoy::Git git = cloneOf(scratch, origin);

        ConvoyTest::writeFile(scratch / "work/README.md", "changed\n");
        ConvoyTest::writeFile(scratch / "work/staged.txt", "new\n");
        git.add({"staged.txt"});
        git.run({"rm", "--quiet", "old.txt"});
        ConvoyTest::writeFile(scratch / "work/notes.txt", "scratch\n");

        WorkStateAuditor auditor(git);
        auto status = auditor.status();
        assert(!status.clean);
        assert(status.modified.size() == 1 && status.modified[0] == "README.md");
        assert(status.added.size() == 1 && status.added[0] == "staged.txt");
        assert(status.deleted.size() == 1 && status.deleted[0] == "old.txt");
        assert(status.untracked.size() == 1 && status.untracked[0] == "notes.txt");

        auto report = auditor.checkUncommittedWork();
        assert(report.has_uncommitted_changes);
        assert(report.modified_files.size() == 3);
        assert(contains(report.modified_files, "old.txt"));
        assert(report.untracked_files.size() == 1);
        assert(!report.clean());

        std::cout << "✓ Working tree change test passed" << std::endl;
    }

    void testStashesAndUnpushedCommits() {
        std::cout << "Testing stashes and unpushed commits..." << std::endl;

        ScratchDirectory scratch;
        OriginFixture origin(scratch);
        Convoy::Git git = cloneOf(scratch, origin);
        WorkStateAuditor auditor(git);

        ConvoyTest::writeFile(scratch / "work/README.md", "stash me\n");
        git.run({"stash", "push", "--quiet"});
        assert(auditor.status().clean);
        assert(auditor.stashCount() == 1);

        ConvoyTest::commitFile(git, "local.txt", "l\n", "Local only");
        assert(auditor.unpushedCommits() == 1);

        auto report = auditor.checkUncommittedWork();
        assert(!report.has_uncommitted_changes);
        assert(report.stash_count == 1);
        assert(report.unpushed_commits == 1);
        assert(!report.clean());
        assert(!report.cleanExcluding(".syncstate"));

        std::cout << "✓ Stash and unpushed test passed" << std::endl;
    }

    void testBranchWithoutUpstream() {
        std::cout << "Testing branch without upstream..." << std::endl;

        ScratchDirectory scratch;
        OriginFixture origin(scratch);
        Convoy::Git git = cloneOf(scratch, origin);
        git.run({"checkout", "--quiet", "-b", "local-only"});
        ConvoyTest::commitFile(git, "l.txt", "l\n", "Local");

        WorkStateAuditor auditor(git);
        assert(auditor.unpushedCommits() == 0 && "No upstream gets the benefit of the doubt");

        std::cout << "✓ No upstream test passed" << std::endl;
    }

    void testRelaxedAuditIgnoresSyncState() {
        std::cout << "Testing relaxed audit with sync-state drift..." << std::endl;

        ScratchDirectory scratch;
        OriginFixture origin(scratch, {{"README.md", "r\n"}, {".syncstate/queue.json", "[]\n"}});
        Convoy::Git git = cloneOf(scratch, origin);

        ConvoyTest::writeFile(scratch / "work/.syncstate/queue.json", "[1]\n");
        ConvoyTest::writeFile(scratch / "work/.syncstate/lock", "pid\n");

        auto report = WorkStateAuditor(git).checkUncommittedWork();
        assert(!report.clean());
        assert(report.cleanExcluding(".syncstate"));

        ConvoyTest::writeFile(scratch / "work/README.md", "real change\n");
        report = WorkStateAuditor(git).checkUncommittedWork();
        assert(!report.cleanExcluding(".syncstate"));

        std::cout << "✓ Relaxed audit test passed" << std::endl;
    }

    void testIntentToAddRename() {
        std::cout << "Testing a moved file marked intent-to-add..." << std::endl;

        ScratchDirectory scratch;
        OriginFixture origin(scratch, {{"README.md", "r\n"}, {"ab", "contents\n"},
                                       {".syncstate/a", "state\n"}});
        Convoy::Git git = cloneOf(scratch, origin);

        std::filesystem::rename(scratch / "work/ab", scratch / "work/cd");
        git.run({"add", "-N", "cd"});

        WorkStateAuditor auditor(git);
        auto status = auditor.status();
        assert(!status.clean);
        assert(!contains(status.modified, "ab") && !contains(status.untracked, "ab"));
        assert(contains(status.added, "cd") || contains(status.deleted, "ab"));

        git.run({"reset", "--quiet", "--hard"});
        std::filesystem::remove(scratch / "work/cd");
        std::filesystem::rename(scratch / "work/.syncstate/a", scratch / "work/.syncstate/b");
        git.run({"add", "-N", ".syncstate/b"});

        auto report = auditor.checkUncommittedWork();
        assert(report.has_uncommitted_changes);
        assert(report.cleanExcluding(".syncstate") && "Moved sync-state file keeps its full path");

        std::cout << "✓ Intent-to-add rename test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running WorkStateAuditor tests..." << std::endl;

        testFreshCloneIsClean();
        testWorkingTreeChanges();
        testStashesAndUnpushedCommits();
        testBranchWithoutUpstream();
        testRelaxedAuditIgnoresSyncState();
        testIntentToAddRename();

        std::cout << "All WorkStateAuditor tests passed!" << std::endl;
    }
};

int main() {
    try {
        WorkStateAuditorTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
