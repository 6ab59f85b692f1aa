#include "repair/attempt_session.hpp"

#include <fstream>
#include <stdexcept>

namespace sandscrape {

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::DRAFTED:      return "Drafted";
        case SessionState::EXECUTING:    return "Executing";
        case SessionState::NEEDS_REPAIR: return "NeedsRepair";
        case SessionState::REPAIRING:    return "Repairing";
        case SessionState::SUCCEEDED:    return "Succeeded";
        case SessionState::GAVE_UP:      return "GaveUp";
    }
    return "GaveUp";
}

AttemptSession::AttemptSession(std::string target, std::string goal,
                               std::string initial_source, int max_attempts)
    : target_(std::move(target)), goal_(std::move(goal)), max_attempts_(max_attempts) {
    if (max_attempts_ < 1) {
        throw std::invalid_argument("max_attempts must be at least 1");
    }
    current_.source = std::move(initial_source);
    current_.attempt = 1;
    current_.origin = CandidateProgram::Origin::GENERATED;
}

void AttemptSession::transition(SessionState next) {
    state_ = next;
}

void AttemptSession::record(ExecutionResult result) {
    history_.push_back({current_, std::move(result)});
}

void AttemptSession::redraft(std::string source) {
    current_.source = std::move(source);
    current_.attempt += 1;
    current_.origin = CandidateProgram::Origin::REPAIRED;
}

nlohmann::json AttemptSession::historyJson() const {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& rec : history_) {
        out.push_back({
            {"target", target_},
            {"goal", goal_},
            {"attempt", rec.program.attempt},
            {"origin", toString(rec.program.origin)},
            {"source", rec.program.source},
            {"result", rec.result.toJson()},
        });
    }
    return out;
}

void AttemptSession::exportHistory(const std::string& path) const {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("cannot open history file: " + path);
    }
    for (const auto& entry : historyJson()) {
        out << entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    }
}

} // namespace sandscrape
