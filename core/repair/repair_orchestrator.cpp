#include "repair/repair_orchestrator.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace sandscrape {

RepairOrchestrator::RepairOrchestrator(Executor& executor, CodeGenerationOracle& oracle,
                                       OrchestratorConfig config)
    : executor_(executor), oracle_(oracle), config_(config) {
    if (config_.max_attempts < 1) {
        throw std::invalid_argument("max_attempts must be at least 1");
    }
}

AttemptSession RepairOrchestrator::begin(const std::string& target, const std::string& goal,
                                         const std::string& source) const {
    return AttemptSession(target, goal, source, config_.max_attempts);
}

SessionState RepairOrchestrator::step(AttemptSession& session) {
    switch (session.state()) {
        case SessionState::DRAFTED:
            executeCurrent(session);
            break;
        case SessionState::NEEDS_REPAIR:
            repairCurrent(session);
            break;
        case SessionState::EXECUTING:
        case SessionState::REPAIRING:
            // Only observable if a previous step was interrupted mid-call.
            throw std::logic_error(std::string("session stuck in ") +
                                   toString(session.state()));
        case SessionState::SUCCEEDED:
        case SessionState::GAVE_UP:
            break;
    }
    return session.state();
}

void RepairOrchestrator::runToCompletion(AttemptSession& session) {
    while (!session.finished()) {
        step(session);
    }

    const ExecutionResult* last = session.lastResult();
    if (session.state() == SessionState::SUCCEEDED) {
        spdlog::info("[repair] {} succeeded at attempt {} ({} records)",
                     session.target(), session.current().attempt,
                     last && last->payload ? last->payload->size() : 0);
    } else {
        spdlog::warn("[repair] {} gave up after {} attempts; last outcome {}: {}",
                     session.target(), session.attemptsUsed(),
                     last ? toString(last->outcome) : "none",
                     last ? last->message : "");
    }
}

AttemptSession RepairOrchestrator::run(const std::string& target, const std::string& goal,
                                       const std::string& source,
                                       std::optional<std::string> human_feedback) {
    AttemptSession session = begin(target, goal, source);
    session.setHumanFeedback(std::move(human_feedback));
    runToCompletion(session);
    return session;
}

RepairRequest RepairOrchestrator::makeRepairRequest(const AttemptSession& session) const {
    const ExecutionResult* last = session.lastResult();
    if (!last) {
        throw std::logic_error("no execution to repair yet");
    }

    RepairRequest req;
    req.original_source = session.current().source;
    req.target_url = session.target();
    req.goal = session.goal();
    req.last_result = *last;
    req.human_feedback = session.humanFeedback();
    req.attempt = session.current().attempt;
    return req;
}

void RepairOrchestrator::executeCurrent(AttemptSession& session) {
    session.transition(SessionState::EXECUTING);
    const CandidateProgram& program = session.current();
    spdlog::debug("[repair] executing attempt {}/{} against {}",
                  program.attempt, session.maxAttempts(), session.target());

    ExecutionResult executed;
    try {
        executed = executor_.execute(program, session.target());
    } catch (...) {
        session.transition(SessionState::DRAFTED);
        throw;
    }
    session.record(std::move(executed));
    const ExecutionResult& result = *session.lastResult();

    if (result.ok()) {
        session.transition(SessionState::SUCCEEDED);
    } else if (program.attempt < session.maxAttempts()) {
        session.transition(SessionState::NEEDS_REPAIR);
    } else {
        session.transition(SessionState::GAVE_UP);
    }
    spdlog::debug("[repair] attempt {} -> {} ({})", program.attempt,
                  toString(result.outcome), toString(session.state()));
}

void RepairOrchestrator::repairCurrent(AttemptSession& session) {
    RepairRequest request = makeRepairRequest(session);

    session.transition(SessionState::REPAIRING);
    std::string reply;
    try {
        reply = oracle_.repair(request);
    } catch (...) {
        // Leave the session resumable, then let the caller decide.
        session.transition(SessionState::NEEDS_REPAIR);
        throw;
    }

    session.redraft(extractSourceFromReply(reply));
    session.transition(SessionState::DRAFTED);
    spdlog::info("[repair] attempt {} drafted from {} repair",
                 session.current().attempt, toString(request.last_result.outcome));
}

} // namespace sandscrape
