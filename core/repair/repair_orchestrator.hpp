#pragma once

#include "engine/execution_engine.hpp"
#include "repair/attempt_session.hpp"
#include "repair/oracle.hpp"
#include <optional>
#include <string>

namespace sandscrape {

struct OrchestratorConfig {
    int max_attempts = 3;  // fixed bound on executions per session
};

// ─── Repair Orchestrator ──────────────────────────────────────
// Drives an AttemptSession through execute → classify → repair.
// Deterministic given the executor's results and the oracle's
// replies. Every failure kind is retried the same way; the oracle
// gets the specific outcome and message to act on.

class RepairOrchestrator {
public:
    RepairOrchestrator(Executor& executor, CodeGenerationOracle& oracle,
                       OrchestratorConfig config = {});

    /// New session for a freshly generated program.
    AttemptSession begin(const std::string& target, const std::string& goal,
                         const std::string& source) const;

    /// Advance one transition group:
    ///   DRAFTED      → execute → SUCCEEDED | NEEDS_REPAIR | GAVE_UP
    ///   NEEDS_REPAIR → oracle  → DRAFTED (next attempt)
    /// Terminal states are left as they are. If the oracle throws, the
    /// session stays in NEEDS_REPAIR and the exception propagates.
    SessionState step(AttemptSession& session);

    /// Step until SUCCEEDED or GAVE_UP.
    void runToCompletion(AttemptSession& session);

    /// begin() + runToCompletion().
    AttemptSession run(const std::string& target, const std::string& goal,
                       const std::string& source,
                       std::optional<std::string> human_feedback = std::nullopt);

    /// The request step() would send for the session's last result.
    RepairRequest makeRepairRequest(const AttemptSession& session) const;

    const OrchestratorConfig& config() const { return config_; }

private:
    Executor& executor_;
    CodeGenerationOracle& oracle_;
    OrchestratorConfig config_;

    void executeCurrent(AttemptSession& session);
    void repairCurrent(AttemptSession& session);
};

} // namespace sandscrape
