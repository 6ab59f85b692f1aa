#pragma once

#include "engine/execution_result.hpp"
#include "policy/execution_policy.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sandscrape {

// ─── Worker Protocol ──────────────────────────────────────────
// Host → worker: one JSON request on the worker's stdin, then EOF.
// Worker → host: one JSON response on descriptor kResultFd.
// The worker's stdout (fd 1) carries only what the program prints.

constexpr int kResultFd = 3;

struct ResourceLimits {
    uint64_t memory_bytes = 1024ull * 1024 * 1024;  // RLIMIT_AS
    uint64_t max_open_files = 256;                  // RLIMIT_NOFILE
    uint64_t cpu_seconds = 0;                       // RLIMIT_CPU, 0 = unset
};

struct WorkerRequest {
    std::string source;
    std::string url;
    std::vector<std::string> allowed_modules;
    std::vector<std::string> blocked_symbols;
    std::vector<PreloadedModule> preloaded_modules;
    ResourceLimits limits;

    /// Build the policy view the worker needs. Denied substrings stay
    /// on the host side; the pre-scan has already run.
    static WorkerRequest make(const std::string& source, const std::string& url,
                              const ExecutionPolicy& policy,
                              const ResourceLimits& limits);

    /// Reassemble an ExecutionPolicy from the request (install hints and
    /// denied substrings are empty).
    ExecutionPolicy policy() const;
};

struct WorkerResponse {
    Outcome outcome = Outcome::RUNTIME_FAILURE;
    std::string message;
    std::optional<std::vector<Record>> payload;
    std::optional<std::string> denied_module;
    std::optional<std::string> missing_module;
};

std::string encodeRequest(const WorkerRequest& request);
WorkerRequest decodeRequest(const std::string& text);

std::string encodeResponse(const WorkerResponse& response);

/// Throws nlohmann::json::exception or std::invalid_argument when the
/// text is not a well-formed response.
WorkerResponse decodeResponse(const std::string& text);

} // namespace sandscrape
