// =================================================================
// tests/TestRepository.hpp
// =================================================================
// Throwaway git repositories for the component tests.

#pragma once

#include "Convoy/Git.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace ConvoyTest {

namespace fs = std::filesystem;

// A mkdtemp() directory removed when the fixture goes out of scope.
class ScratchDirectory {
public:
    explicit ScratchDirectory(const std::string& prefix = "convoy-test-") {
        std::string pattern = (fs::temp_directory_path() / (prefix + "XXXXXX")).string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (::mkdtemp(buffer.data()) == nullptr) {
            throw std::runtime_error("cannot create scratch directory " + pattern);
        }
        m_path = fs::path(buffer.data());
    }

    ~ScratchDirectory() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const fs::path& path() const { return m_path; }
    std::string operator/(const std::string& child) const { return (m_path / child).string(); }

private:
    fs::path m_path;
};

inline void writeFile(const std::string& path, const std::string& content) {
    fs::path file(path);
    if (file.has_parent_path()) {
        fs::create_directories(file.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot write " + path);
    }
    out << content;
}

inline std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot read " + path);
    }
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// Identity and signing settings so commits work on any machine.
inline void configureIdentity(const Convoy::Git& git) {
    git.configSet("user.name", "Convoy Test");
    git.configSet("user.email", "convoy-test@example.com");
    git.configSet("commit.gpgsign", "false");
}

inline Convoy::Git initRepository(const std::string& path) {
    fs::create_directories(path);
    Convoy::Git git(path);
    git.run({"init", "--initial-branch=main", "."});
    configureIdentity(git);
    return git;
}

inline void commitFile(const Convoy::Git& git, const std::string& relative_path,
                       const std::string& content, const std::string& message) {
    writeFile((fs::path(git.workDir()) / relative_path).string(), content);
    git.add({relative_path});
    git.commit(message);
}

/**
 * @brief A bare "origin" seeded with one commit on main, plus the working
 * clone used to seed it.
 */
struct OriginFixture {
    std::string origin_path;
    std::string seed_path;

    explicit OriginFixture(const ScratchDirectory& scratch,
                           const std::vector<std::pair<std::string, std::string>>& files = {
                               {"README.md", "# project\n"}}) {
        origin_path = scratch / "origin.git";
        seed_path = scratch / "seed";

        Convoy::Git(scratch.path().string()).run({"init", "--bare", "--initial-branch=main", origin_path});
        Convoy::Git seed = initRepository(seed_path);
        for (const auto& file : files) {
            writeFile((fs::path(seed_path) / file.first).string(), file.second);
            seed.add({file.first});
        }
        seed.commit("Initial commit");
        seed.run({"remote", "add", "origin", origin_path});
        seed.run({"push", "-u", "origin", "main"});
    }

    Convoy::Git seed() const { return Convoy::Git(seed_path); }
};

} // namespace ConvoyTest
