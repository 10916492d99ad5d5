// =================================================================
// src/Convoy/SysInteraction.cpp
// =================================================================
// Implementation for system-level operations.

#include "Convoy/SysInteraction.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <sys/stat.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

extern char** environ;

namespace Convoy {

namespace {

// Closes a pipe end once and remembers that it did.
void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Reads whatever is available on fd into out. Returns false on EOF.
bool drainFd(int fd, std::string& out) {
    char buffer[4096];
    ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
        out.append(buffer, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

std::vector<std::string> buildEnvironment(const EnvironmentOverrides& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string entry(*e);
        std::string key = entry.substr(0, entry.find('='));
        bool overridden = false;
        for (const auto& [name, value] : overrides) {
            if (name == key) {
                overridden = true;
                break;
            }
        }
        if (!overridden) {
            env.push_back(entry);
        }
    }
    for (const auto& [name, value] : overrides) {
        env.push_back(name + "=" + value);
    }
    return env;
}

} // namespace

std::string SysInteraction::readFile(const std::string& file_path) {
    std::ifstream file_stream(file_path);
    if (!file_stream) {
        throw std::runtime_error("Failed to open file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file_stream.rdbuf();
    return buffer.str();
}

bool SysInteraction::writeFile(const std::string& file_path, const std::string& content) {
    std::ofstream file_stream(file_path);
    if (!file_stream) {
        return false;
    }
    file_stream << content;
    return file_stream.good();
}

bool SysInteraction::fileExists(const std::string& file_path) {
    struct stat buffer;
    return (stat(file_path.c_str(), &buffer) == 0 && S_ISREG(buffer.st_mode));
}

bool SysInteraction::directoryExists(const std::string& dir_path) {
    struct stat buffer;
    return (stat(dir_path.c_str(), &buffer) == 0 && S_ISDIR(buffer.st_mode));
}

bool SysInteraction::createDirectory(const std::string& dir_path) {
    return mkdir(dir_path.c_str(), 0755) == 0;
}

ProcessResult SysInteraction::runProcess(const std::string& command,
                                         const std::vector<std::string>& args,
                                         const std::string& working_dir,
                                         const EnvironmentOverrides& env) {
    // Everything the child needs is prepared before fork().
    std::vector<std::string> argv_storage;
    argv_storage.reserve(args.size() + 1);
    argv_storage.push_back(command);
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage = buildEnvironment(env);
    std::vector<char*> envp;
    for (auto& entry : env_storage) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};  // child reports exec/chdir errno here
    if (::pipe2(stdout_pipe, O_CLOEXEC) < 0 || ::pipe2(stderr_pipe, O_CLOEXEC) < 0 ||
        ::pipe2(status_pipe, O_CLOEXEC) < 0) {
        int saved = errno;
        closeFd(stdout_pipe[0]); closeFd(stdout_pipe[1]);
        closeFd(stderr_pipe[0]); closeFd(stderr_pipe[1]);
        throw std::system_error(saved, std::generic_category(), "creating pipes for " + command);
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        closeFd(stdout_pipe[0]); closeFd(stdout_pipe[1]);
        closeFd(stderr_pipe[0]); closeFd(stderr_pipe[1]);
        closeFd(status_pipe[0]); closeFd(status_pipe[1]);
        throw std::system_error(saved, std::generic_category(), "forking " + command);
    }

    if (pid == 0) {
        // Child process: only async-signal-safe calls from here on.
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::dup2(stderr_pipe[1], STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0) {
            int err = errno;
            (void)!::write(status_pipe[1], &err, sizeof(err));
            ::_exit(127);
        }
        ::execvpe(command.c_str(), argv.data(), envp.data());
        int err = errno;
        (void)!::write(status_pipe[1], &err, sizeof(err));
        ::_exit(127);
    }

    // Parent process
    closeFd(stdout_pipe[1]);
    closeFd(stderr_pipe[1]);
    closeFd(status_pipe[1]);

    int child_errno = 0;
    ssize_t status_read;
    do {
        status_read = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (status_read < 0 && errno == EINTR);
    closeFd(status_pipe[0]);

    ProcessResult result;
    int out_fd = stdout_pipe[0];
    int err_fd = stderr_pipe[0];
    while (out_fd >= 0 || err_fd >= 0) {
        struct pollfd fds[2];
        nfds_t count = 0;
        if (out_fd >= 0) fds[count++] = {out_fd, POLLIN, 0};
        if (err_fd >= 0) fds[count++] = {err_fd, POLLIN, 0};

        if (::poll(fds, count, -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            bool is_stdout = fds[i].fd == out_fd;
            std::string& target = is_stdout ? result.stdout_output : result.stderr_output;
            if (!drainFd(fds[i].fd, target)) {
                closeFd(is_stdout ? out_fd : err_fd);
            }
        }
    }
    closeFd(out_fd);
    closeFd(err_fd);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waiting for " + command);
        }
    }

    if (status_read == static_cast<ssize_t>(sizeof(child_errno))) {
        std::string what = working_dir.empty()
            ? "starting " + command
            : "starting " + command + " in " + working_dir;
        throw std::system_error(child_errno, std::generic_category(), what);
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = -WTERMSIG(status);
    } else {
        result.exit_code = -1;
    }
    return result;
}

} // namespace Convoy
