#pragma once

#include "engine/execution_result.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sandscrape {

// ─── Session State ────────────────────────────────────────────
//   DRAFTED ──▶ EXECUTING ──▶ SUCCEEDED                  (terminal)
//                   │──────▶ GAVE_UP                     (terminal)
//                   └──────▶ NEEDS_REPAIR ──▶ REPAIRING ──▶ DRAFTED

enum class SessionState {
    DRAFTED,
    EXECUTING,
    NEEDS_REPAIR,
    REPAIRING,
    SUCCEEDED,
    GAVE_UP
};

const char* toString(SessionState state);

inline bool isTerminal(SessionState state) {
    return state == SessionState::SUCCEEDED || state == SessionState::GAVE_UP;
}

/// One execute cycle: the program and the result it produced.
struct AttemptRecord {
    CandidateProgram program;
    ExecutionResult result;
};

// ─── Attempt Session ──────────────────────────────────────────
// The bounded execute/repair sequence for one goal against one target.
// Owned by the caller, advanced by RepairOrchestrator::step().

class AttemptSession {
public:
    AttemptSession(std::string target, std::string goal, std::string initial_source,
                   int max_attempts);

    const std::string& target() const { return target_; }
    const std::string& goal() const { return goal_; }
    int maxAttempts() const { return max_attempts_; }
    SessionState state() const { return state_; }
    bool finished() const { return isTerminal(state_); }

    /// Program to run next (DRAFTED) or the one just run.
    const CandidateProgram& current() const { return current_; }

    const std::vector<AttemptRecord>& history() const { return history_; }
    size_t attemptsUsed() const { return history_.size(); }

    /// Result of the most recent execution, if any.
    const ExecutionResult* lastResult() const {
        return history_.empty() ? nullptr : &history_.back().result;
    }

    /// Forwarded with every following repair request.
    void setHumanFeedback(std::optional<std::string> feedback) { feedback_ = std::move(feedback); }
    const std::optional<std::string>& humanFeedback() const { return feedback_; }

    /// One JSON object per attempt.
    nlohmann::json historyJson() const;

    /// Write the history as JSON lines.
    void exportHistory(const std::string& path) const;

private:
    friend class RepairOrchestrator;

    void transition(SessionState next);
    void record(ExecutionResult result);
    void redraft(std::string source);

    std::string target_;
    std::string goal_;
    int max_attempts_;
    SessionState state_ = SessionState::DRAFTED;
    CandidateProgram current_;
    std::vector<AttemptRecord> history_;
    std::optional<std::string> feedback_;
};

} // namespace sandscrape
