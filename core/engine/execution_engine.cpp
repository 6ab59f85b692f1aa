#include "engine/execution_engine.hpp"
#include "engine/child_process.hpp"
#include "engine/utf8.hpp"
#include "policy/prescan.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cmath>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <poll.h>
#include <unistd.h>

namespace sandscrape {

namespace {

constexpr const char* kTruncatedMarker = "\n[sandscrape: output truncated]\n";

// One read end being drained into a bounded buffer.
struct Drain {
    UniqueFd fd;
    std::string data;
    size_t limit;
    bool truncated = false;

    bool open() const { return fd.valid(); }

    // Returns false once the writer side is gone.
    bool readOnce() {
        char buf[65536];
        ssize_t n;
        do {
            n = ::read(fd.get(), buf, sizeof(buf));
        } while (n < 0 && errno == EINTR);
        if (n <= 0) {
            fd.reset();
            return false;
        }
        if (truncated) return true;  // keep draining, keep nothing
        size_t room = data.size() < limit ? limit - data.size() : 0;
        size_t take = static_cast<size_t>(n) < room ? static_cast<size_t>(n) : room;
        if (take < static_cast<size_t>(n)) {
            // Cut before a continuation byte so the kept text stays valid UTF-8.
            while (take > 0 && isUtf8Continuation(static_cast<unsigned char>(buf[take]))) --take;
            truncated = true;
        }
        data.append(buf, take);
        return true;
    }

    // After the child is dead: read whatever is still buffered.
    void drainToEof() {
        while (open() && readOnce()) {}
    }

    // A worker killed mid-write can leave half a character at the end.
    std::string text() const {
        std::string out = data.substr(0, utf8CompleteLength(data));
        return truncated ? out + kTruncatedMarker : out;
    }
};

} // namespace

ExecutionEngine::ExecutionEngine(ExecutionPolicy policy, EngineConfig config)
    : policy_(std::move(policy)), config_(std::move(config)) {
    if (!(config_.timeout_seconds > 0.0) || config_.timeout_seconds > kMaxTimeoutSeconds) {
        throw std::invalid_argument("timeout_seconds must be in (0, " +
                                    std::to_string(static_cast<int>(kMaxTimeoutSeconds)) + "]");
    }
    if (config_.memory_limit_mb > kMaxMemoryLimitMb) {
        throw std::invalid_argument("memory_limit_mb must be at most " +
                                    std::to_string(kMaxMemoryLimitMb));
    }
    if (config_.worker_path.empty()) {
        throw std::invalid_argument("worker_path is required");
    }
    if (::access(config_.worker_path.c_str(), X_OK) != 0) {
        spdlog::warn("[engine] worker '{}' is not executable; executions will fail",
                     config_.worker_path);
    }
}

ExecutionResult ExecutionEngine::execute(const CandidateProgram& program,
                                         const std::string& url) {
    Deadline deadline(config_.timeout_seconds);
    ExecutionResult result;

    PreScanResult scan = PreScanner(policy_).scan(program.source);
    if (!scan.passed) {
        result = ExecutionResult::failure(Outcome::POLICY_VIOLATION, scan.message);
    } else {
        try {
            result = runWorker(program, url, deadline);
        } catch (const std::system_error& e) {
            result = ExecutionResult::failure(
                Outcome::RUNTIME_FAILURE,
                std::string("sandbox unavailable: ") + e.what());
        }
    }

    result.elapsed_seconds = deadline.elapsedSeconds();
    spdlog::info("[engine] attempt {} ({}) -> {} in {:.2f}s",
                 program.attempt, toString(program.origin),
                 toString(result.outcome), result.elapsed_seconds);
    if (!result.ok()) {
        spdlog::debug("[engine] message: {}", result.message);
    }
    return result;
}

ExecutionResult ExecutionEngine::runWorker(const CandidateProgram& program,
                                           const std::string& url,
                                           const Deadline& deadline) {
    WorkerRequest request = WorkerRequest::make(program.source, url, policy_, limits());
    UniqueFd input = makeMemoryFile("sandscrape-request", encodeRequest(request));

    Pipe out = Pipe::create();
    Pipe err = Pipe::create();
    Pipe res = Pipe::create();

    ChildProcess child = ChildProcess::spawn(
        config_.worker_path, {}, workerEnvironment(),
        {{input.get(), 0},
         {out.write_end.get(), 1},
         {err.write_end.get(), 2},
         {res.write_end.get(), kResultFd}});
    spdlog::debug("[engine] worker pid {} started", child.pid());

    // Our copies of the write ends must go, or EOF never arrives.
    input.reset();
    out.write_end.reset();
    err.write_end.reset();
    res.write_end.reset();

    Drain stdout_drain{std::move(out.read_end), {}, config_.max_stdout_bytes};
    Drain stderr_drain{std::move(err.read_end), {}, 64 * 1024};
    Drain result_drain{std::move(res.read_end), {}, 64 * 1024 * 1024};
    Drain* drains[] = {&stdout_drain, &stderr_drain, &result_drain};

    bool timed_out = false;
    while (stdout_drain.open() || stderr_drain.open() || result_drain.open()) {
        pollfd fds[3];
        Drain* owners[3];
        nfds_t n = 0;
        for (Drain* d : drains) {
            if (!d->open()) continue;
            fds[n] = {d->fd.get(), POLLIN, 0};
            owners[n] = d;
            ++n;
        }

        int timeout_ms = deadline.remainingMillis();
        if (timeout_ms == 0) {
            timed_out = true;
            break;
        }
        int ready = ::poll(fds, n, timeout_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "poll");
        }
        for (nfds_t i = 0; i < n; ++i) {
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                owners[i]->readOnce();
            }
        }
    }

    // Pipes are closed; the worker is exiting. Bound the wait anyway.
    while (!timed_out && !child.poll()) {
        if (deadline.expired()) {
            timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }

    if (timed_out) {
        child.killGroup();
        child.wait();
        stdout_drain.drainToEof();
        stderr_drain.drainToEof();
        if (!stderr_drain.data.empty()) {
            spdlog::debug("[engine] worker stderr:\n{}", stderr_drain.data);
        }
        char limit[32];
        std::snprintf(limit, sizeof(limit), "%g", deadline.maxSeconds());
        return ExecutionResult::failure(
            Outcome::TIMEOUT,
            std::string("execution exceeded the ") + limit + "s timeout",
            stdout_drain.text());
    }

    ProcessExit exit = child.wait();
    if (!stderr_drain.data.empty()) {
        spdlog::debug("[engine] worker stderr:\n{}", stderr_drain.data);
    }

    if (result_drain.data.empty()) {
        std::string why = (exit.exited && exit.exit_code == 127)
            ? "could not start sandbox worker '" + config_.worker_path + "'"
            : "sandbox worker " + exit.describe() + " without reporting a result";
        return ExecutionResult::failure(Outcome::RUNTIME_FAILURE, why, stdout_drain.text());
    }

    WorkerResponse response;
    try {
        response = decodeResponse(result_drain.data);
    } catch (const nlohmann::json::exception& e) {
        return ExecutionResult::failure(Outcome::RUNTIME_FAILURE,
            std::string("malformed worker response: ") + e.what(), stdout_drain.text());
    } catch (const std::invalid_argument& e) {
        return ExecutionResult::failure(Outcome::RUNTIME_FAILURE,
            std::string("malformed worker response: ") + e.what(), stdout_drain.text());
    }

    return translate(response, stdout_drain.text());
}

ExecutionResult ExecutionEngine::translate(const WorkerResponse& response,
                                           std::string stdout_text) const {
    if (response.outcome == Outcome::SUCCESS) {
        return ExecutionResult::success(*response.payload, std::move(stdout_text));
    }

    if (response.outcome == Outcome::RUNTIME_FAILURE && response.missing_module) {
        std::string hint = policy_.installHintFor(*response.missing_module);
        ExecutionResult r = ExecutionResult::failure(
            Outcome::RUNTIME_FAILURE,
            "missing module: " + *response.missing_module + "\n\ninstall with:\n" + hint,
            std::move(stdout_text));
        r.install_hint = hint;
        return r;
    }

    ExecutionResult r = ExecutionResult::failure(response.outcome, response.message,
                                                 std::move(stdout_text));
    if (response.outcome == Outcome::MODULE_DENIED) {
        r.denied_module = response.denied_module;
    }
    return r;
}

std::vector<std::string> ExecutionEngine::workerEnvironment() const {
    std::vector<std::string> env = {
        "PATH=/usr/bin:/bin",
        "LANG=C.UTF-8",
        "PYTHONIOENCODING=utf-8",
        "PYTHONDONTWRITEBYTECODE=1",
        "SANDSCRAPE_WORKER_LOG_LEVEL=" + config_.worker_log_level,
    };
    for (const auto& name : config_.passthrough_env) {
        if (const char* value = std::getenv(name.c_str())) {
            env.push_back(name + "=" + value);
        }
    }
    return env;
}

ResourceLimits ExecutionEngine::limits() const {
    // Timeout and memory are range-checked in the constructor; no overflow here.
    ResourceLimits l;
    l.memory_bytes = config_.memory_limit_mb * 1024 * 1024;
    l.max_open_files = config_.max_open_files;
    // CPU backstop a little above the wall clock; the deadline does the real work.
    l.cpu_seconds = static_cast<uint64_t>(std::ceil(config_.timeout_seconds)) + 2;
    return l;
}

} // namespace sandscrape
