#pragma once

#include "engine/deadline.hpp"
#include "engine/execution_result.hpp"
#include "engine/worker_protocol.hpp"
#include "policy/execution_policy.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sandscrape {

constexpr double kMaxTimeoutSeconds = 24 * 60 * 60;
constexpr uint64_t kMaxMemoryLimitMb = 1024 * 1024;  // 1 TiB

/// Engine configuration. Process-wide, fixed at startup.
struct EngineConfig {
    double timeout_seconds = 30.0;         // wall clock for the whole worker run
    std::string worker_path;               // sandscrape_worker binary
    uint64_t memory_limit_mb = 1024;       // RLIMIT_AS for the worker
    uint64_t max_open_files = 256;         // RLIMIT_NOFILE
    size_t max_stdout_bytes = 1 << 20;     // captured stdout is cut beyond this
    std::string worker_log_level = "warn"; // spdlog level inside the worker
    std::vector<std::string> passthrough_env = {
        "PYTHONPATH", "PYTHONHOME", "SSL_CERT_FILE",
        "HTTP_PROXY", "HTTPS_PROXY", "NO_PROXY",
        "http_proxy", "https_proxy", "no_proxy",
    };
};

// ─── Executor ─────────────────────────────────────────────────
// Runs one candidate program against one URL and classifies the
// outcome. Implementations never throw for anything the candidate
// does; every path ends in a well-formed ExecutionResult.

class Executor {
public:
    virtual ~Executor() = default;

    virtual ExecutionResult execute(const CandidateProgram& program,
                                    const std::string& url) = 0;
};

// ─── Execution Engine ─────────────────────────────────────────
// 1. static pre-scan (no process is started on a hit)
// 2. fresh sandscrape_worker per call, own process group, rlimits,
//    sterile environment
// 3. stdout drained from a pipe into memory; host stdout untouched
// 4. wall-clock deadline; on expiry the group is SIGKILLed and the
//    stdout captured so far is kept
// 5. the worker's structured response becomes the ExecutionResult

class ExecutionEngine : public Executor {
public:
    ExecutionEngine(ExecutionPolicy policy, EngineConfig config);

    ExecutionResult execute(const CandidateProgram& program,
                            const std::string& url) override;

    const ExecutionPolicy& policy() const { return policy_; }
    const EngineConfig& config() const { return config_; }

private:
    const ExecutionPolicy policy_;
    const EngineConfig config_;

    ExecutionResult runWorker(const CandidateProgram& program, const std::string& url,
                              const Deadline& deadline);
    ExecutionResult translate(const WorkerResponse& response, std::string stdout_text) const;
    std::vector<std::string> workerEnvironment() const;
    ResourceLimits limits() const;
};

} // namespace sandscrape
