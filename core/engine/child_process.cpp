#include "engine/child_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandscrape {

void UniqueFd::reset(int fd) {
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
}

Pipe Pipe::create() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
    return Pipe{UniqueFd(fds[0]), UniqueFd(fds[1])};
}

UniqueFd makeMemoryFile(const std::string& name, const std::string& contents) {
    UniqueFd fd(::memfd_create(name.c_str(), MFD_CLOEXEC | MFD_ALLOW_SEALING));
    if (!fd.valid()) {
        throw std::system_error(errno, std::generic_category(), "memfd_create");
    }

    size_t written = 0;
    while (written < contents.size()) {
        ssize_t n = ::write(fd.get(), contents.data() + written, contents.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "write memfd");
        }
        written += static_cast<size_t>(n);
    }

    if (::fcntl(fd.get(), F_ADD_SEALS, F_SEAL_SHRINK | F_SEAL_GROW | F_SEAL_WRITE) != 0) {
        throw std::system_error(errno, std::generic_category(), "seal memfd");
    }
    if (::lseek(fd.get(), 0, SEEK_SET) != 0) {
        throw std::system_error(errno, std::generic_category(), "lseek memfd");
    }
    return fd;
}

std::string ProcessExit::describe() const {
    if (exited) return "exited with code " + std::to_string(exit_code);
    const char* name = ::strsignal(signal);
    return "killed by signal " + std::to_string(signal) +
           (name ? std::string(" (") + name + ")" : std::string());
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(other.pid_), exit_(other.exit_) {
    other.pid_ = -1;
    other.exit_.reset();
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        if (running()) {
            killGroup();
            wait();
        }
        pid_ = other.pid_;
        exit_ = other.exit_;
        other.pid_ = -1;
        other.exit_.reset();
    }
    return *this;
}

ChildProcess::~ChildProcess() {
    if (running()) {
        killGroup();
        wait();
    }
}

ChildProcess ChildProcess::spawn(const std::string& binary,
                                 const std::vector<std::string>& args,
                                 const std::vector<std::string>& env,
                                 const std::vector<FdMapping>& fds) {
    // Everything the child touches is prepared before fork: only
    // async-signal-safe calls are allowed between fork and exec.
    std::vector<char*> c_args;
    c_args.push_back(const_cast<char*>(binary.c_str()));
    for (const auto& arg : args) {
        c_args.push_back(const_cast<char*>(arg.c_str()));
    }
    c_args.push_back(nullptr);

    std::vector<char*> c_env;
    for (const auto& var : env) {
        c_env.push_back(const_cast<char*>(var.c_str()));
    }
    c_env.push_back(nullptr);

    pid_t parent = ::getpid();
    pid_t pid = ::fork();
    if (pid == -1) {
        throw std::system_error(errno, std::generic_category(), "fork");
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::prctl(PR_SET_PDEATHSIG, SIGKILL);
        if (::getppid() != parent) _exit(127);

        for (const auto& m : fds) {
            if (m.parent_fd == m.child_fd) {
                int flags = ::fcntl(m.child_fd, F_GETFD);
                if (flags < 0 || ::fcntl(m.child_fd, F_SETFD, flags & ~FD_CLOEXEC) < 0) _exit(127);
            } else if (::dup2(m.parent_fd, m.child_fd) < 0) {
                _exit(127);
            }
        }

        ::execve(binary.c_str(), c_args.data(), c_env.data());
        _exit(127);
    }

    // Also set from the parent so killGroup() cannot race the child's setpgid.
    ::setpgid(pid, pid);
    return ChildProcess(pid);
}

void ChildProcess::killGroup() {
    if (!running()) return;
    if (::kill(-pid_, SIGKILL) != 0) {
        ::kill(pid_, SIGKILL);
    }
}

namespace {

ProcessExit decodeStatus(int status) {
    ProcessExit e;
    if (WIFEXITED(status)) {
        e.exited = true;
        e.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        e.signal = WTERMSIG(status);
    }
    return e;
}

} // namespace

std::optional<ProcessExit> ChildProcess::poll() {
    if (exit_ || pid_ <= 0) return exit_;
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        exit_ = decodeStatus(status);
        // Stragglers in the group (none expected) go down with the leader.
        ::kill(-pid_, SIGKILL);
    } else if (r < 0 && errno == ECHILD) {
        exit_ = ProcessExit{};
    }
    return exit_;
}

ProcessExit ChildProcess::wait() {
    if (exit_ || pid_ <= 0) return exit_.value_or(ProcessExit{});
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);
    exit_ = (r == pid_) ? decodeStatus(status) : ProcessExit{};
    ::kill(-pid_, SIGKILL);
    return *exit_;
}

} // namespace sandscrape
