// =================================================================
// src/Convoy/Bootstrap.cpp
// =================================================================
// Implementation of the isolated clone protocol.

#include "Convoy/Bootstrap.hpp"
#include "Convoy/Git.hpp"
#include "Convoy/Logger.hpp"
#include "Convoy/SparseCheckout.hpp"
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <vector>
#include <cerrno>
#include <cstdlib>

namespace fs = std::filesystem;

namespace Convoy {

namespace {

// Owns a mkdtemp() directory and removes it on scope exit.
class TempDirectory {
public:
    explicit TempDirectory(const std::string& prefix) {
        std::string pattern = (fs::temp_directory_path() / (prefix + "XXXXXX")).string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (::mkdtemp(buffer.data()) == nullptr) {
            throw std::system_error(errno, std::generic_category(), "creating temp dir");
        }
        m_path = buffer.data();
    }

    ~TempDirectory() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
        if (ec) {
            Logger::getInstance().debug("Bootstrap", "Could not remove temp dir " + m_path, ec.message());
        }
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

// The clone runs inside the temp dir, so relative local paths must be
// anchored to the caller's directory first.
std::string anchorLocalPath(const std::string& location) {
    std::error_code ec;
    if (location.empty() || !fs::exists(location, ec)) {
        return location;
    }
    return fs::absolute(location, ec).lexically_normal().string();
}

} // namespace

Bootstrap::Bootstrap(const std::string& git_binary, const std::string& hooks_dir)
    : m_git_binary(git_binary), m_hooks_dir(hooks_dir) {}

void Bootstrap::clone(const std::string& url, const std::string& dest) const {
    cloneInto(url, dest, "", false);
}

void Bootstrap::cloneWithReference(const std::string& url, const std::string& dest,
                                   const std::string& reference) const {
    cloneInto(url, dest, reference, false);
}

void Bootstrap::cloneBare(const std::string& url, const std::string& dest) const {
    cloneInto(url, dest, "", true);
}

void Bootstrap::cloneBareWithReference(const std::string& url, const std::string& dest,
                                       const std::string& reference) const {
    cloneInto(url, dest, reference, true);
}

void Bootstrap::cloneInto(const std::string& url, const std::string& dest,
                          const std::string& reference, bool bare) const {
    fs::path dest_path = fs::path(dest).lexically_normal();
    if (!dest_path.has_filename()) {
        dest_path = dest_path.parent_path();  // "dest/" names the same directory
    }
    std::error_code ec;
    if (dest_path.has_parent_path()) {
        fs::create_directories(dest_path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("creating destination parent: " + ec.message());
        }
    }

    TempDirectory tmp("convoy-clone-");
    std::string tmp_dest = (fs::path(tmp.path()) / dest_path.filename()).string();

    std::vector<std::string> args = {"clone"};
    if (bare) {
        args.push_back("--bare");
    }
    if (!reference.empty()) {
        args.push_back("--reference-if-able");
        args.push_back(anchorLocalPath(reference));
    }
    args.push_back(anchorLocalPath(url));
    args.push_back(tmp_dest);

    Git git(tmp.path(), m_git_binary);
    git.setEnvironment({{"GIT_CEILING_DIRECTORIES", tmp.path()}});
    git.run(args);

    try {
        moveDirectory(tmp_dest, dest_path.string());
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("moving clone to destination: ") + e.what());
    }

    const std::string final_dest = dest_path.string();
    configureHooksPath(final_dest);
    if (bare) {
        configureRefspec(final_dest);
    } else {
        SparseCheckout::configure(final_dest, m_git_binary);
    }

    Logger::getInstance().info("Bootstrap", "Cloned " + url, std::string(bare ? "bare, " : "") + final_dest);
}

void Bootstrap::relocate(const Migration& migration) const {
    moveDirectory(migration.source_path, migration.target_path);
    configureHooksPath(migration.target_path);
    Logger::getInstance().info("Bootstrap", "Relocated " + migration.name,
                               migration.source_path + " -> " + migration.target_path);
}

void Bootstrap::configureHooksPath(const std::string& repo_path) const {
    std::error_code ec;
    if (!fs::is_directory(fs::path(repo_path) / m_hooks_dir, ec)) {
        return;
    }
    Git(repo_path, m_git_binary).configSet("core.hooksPath", m_hooks_dir);
}

void Bootstrap::configureRefspec(const std::string& repo_path) const {
    fs::path git_dir(repo_path);
    std::error_code ec;
    if (fs::exists(git_dir / ".git", ec)) {
        git_dir /= ".git";
    }

    Git git = Git::withGitDir(git_dir.lexically_normal().string(), "", m_git_binary);
    git.configSet("remote.origin.fetch", "+refs/heads/*:refs/remotes/origin/*");
    git.fetch("origin");
}

void Bootstrap::moveDirectory(const std::string& src, const std::string& dest) {
    std::error_code ec;
    if (fs::exists(dest, ec)) {
        throw std::runtime_error("destination already exists: " + dest);
    }

    fs::rename(src, dest, ec);
    if (!ec) {
        return;
    }
    if (ec != std::errc::cross_device_link) {
        throw std::runtime_error("renaming " + src + " to " + dest + ": " + ec.message());
    }

    // Different filesystems: copy, then remove the source
    copyThenRemove(src, dest);
}

void Bootstrap::copyThenRemove(const std::string& src, const std::string& dest) {
    std::error_code ec;
    fs::copy(src, dest, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    if (ec) {
        // No partial destination may survive a failed copy
        std::error_code cleanup_ec;
        fs::remove_all(dest, cleanup_ec);
        if (cleanup_ec) {
            Logger::getInstance().warning("Bootstrap", "Could not remove partial copy " + dest,
                                          cleanup_ec.message());
        }
        throw std::runtime_error("copying directory: " + ec.message());
    }
    fs::remove_all(src, ec);
    if (ec) {
        throw std::runtime_error("removing source after copy: " + ec.message());
    }
}

} // namespace Convoy
