// sandscrape_worker: runs exactly one candidate program.
//
// Started by ExecutionEngine with:
//   fd 0  request JSON (sealed memfd)
//   fd 1  capture pipe for what the program prints
//   fd 2  worker diagnostics
//   fd 3  response JSON

#include "engine/worker_protocol.hpp"
#include "sandbox/resource_limits.hpp"
#include "sandbox/sandbox_session.hpp"

#include <pybind11/embed.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <string>
#include <system_error>

#include <unistd.h>

namespace py = pybind11;
using namespace sandscrape;

namespace {

bool writeAll(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

WorkerResponse setupFailure(const std::string& what) {
    WorkerResponse r;
    r.outcome = Outcome::RUNTIME_FAILURE;
    r.message = "sandbox setup failed: " + what;
    return r;
}

[[noreturn]] void finish(const WorkerResponse& response) {
    std::fflush(stdout);
    std::string encoded;
    try {
        encoded = encodeResponse(response);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("[worker] could not encode response: {}", e.what());
        encoded = encodeResponse(setupFailure("could not encode response"));
    }
    int code = writeAll(kResultFd, encoded) ? 0 : 3;
    ::close(kResultFd);
    // No interpreter finalisation: threads the program left behind must
    // not hold the worker open after the result is out.
    std::_Exit(code);
}

} // namespace

int main() {
    // stdout belongs to the candidate program.
    spdlog::set_default_logger(spdlog::stderr_color_st("worker"));
    spdlog::set_level(spdlog::level::warn);
    if (const char* level = std::getenv("SANDSCRAPE_WORKER_LOG_LEVEL")) {
        spdlog::set_level(spdlog::level::from_str(level));
    }

    std::string input((std::istreambuf_iterator<char>(std::cin)),
                      std::istreambuf_iterator<char>());

    WorkerRequest request;
    try {
        request = decodeRequest(input);
    } catch (const nlohmann::json::exception& e) {
        finish(setupFailure(std::string("malformed request: ") + e.what()));
    }

    try {
        applyResourceLimits(request.limits);
    } catch (const std::system_error& e) {
        finish(setupFailure(e.what()));
    }

    py::initialize_interpreter();
    WorkerResponse response;
    try {
        response = SandboxSession(request).run();
    } catch (const py::error_already_set& e) {
        response = setupFailure(e.what());
    } catch (const std::exception& e) {
        response = setupFailure(e.what());
    }
    finish(response);
}
