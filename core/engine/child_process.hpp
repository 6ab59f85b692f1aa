#pragma once

#include <sys/types.h>
#include <optional>
#include <string>
#include <vector>

namespace sandscrape {

// ─── Unique Fd ────────────────────────────────────────────────
// Owning file descriptor. Closed on destruction.

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) reset(other.release());
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    int release() { int fd = fd_; fd_ = -1; return fd; }
    void reset(int fd = -1);

private:
    int fd_ = -1;
};

/// pipe2(O_CLOEXEC). Throws std::system_error.
struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;

    static Pipe create();
};

/// Sealed in-memory file holding `contents`, positioned at offset 0.
/// Used as the worker's stdin so the host never blocks on a pipe write.
UniqueFd makeMemoryFile(const std::string& name, const std::string& contents);

// ─── Process Exit ─────────────────────────────────────────────

struct ProcessExit {
    bool exited = false;   // normal exit (exit_code valid)
    int exit_code = 0;
    int signal = 0;        // terminating signal when !exited

    std::string describe() const;
};

/// Descriptors wired into the child before exec. Targets are the
/// child's fd numbers (0, 1, 2, 3...). Every other inherited
/// descriptor is close-on-exec.
struct FdMapping {
    int parent_fd;
    int child_fd;
};

// ─── Child Process ────────────────────────────────────────────
// fork + execve without a shell, in its own process group, with
// an explicit environment. The destructor kills the group and reaps
// the child if it is still running, so no exit path leaks a process.

class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;

    /// Throws std::system_error if fork fails. exec failure shows up
    /// as exit code 127.
    static ChildProcess spawn(const std::string& binary,
                              const std::vector<std::string>& args,
                              const std::vector<std::string>& env,
                              const std::vector<FdMapping>& fds);

    pid_t pid() const { return pid_; }
    bool running() const { return pid_ > 0 && !exit_; }

    /// SIGKILL the whole process group.
    void killGroup();

    /// Non-blocking reap. Returns the exit once the child is gone.
    std::optional<ProcessExit> poll();

    /// Blocking reap.
    ProcessExit wait();

private:
    explicit ChildProcess(pid_t pid) : pid_(pid) {}

    pid_t pid_ = -1;
    std::optional<ProcessExit> exit_;
};

} // namespace sandscrape
