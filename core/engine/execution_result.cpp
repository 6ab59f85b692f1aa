#include "engine/execution_result.hpp"
#include <stdexcept>

namespace sandscrape {

const char* toString(Outcome outcome) {
    switch (outcome) {
        case Outcome::SUCCESS:             return "Success";
        case Outcome::POLICY_VIOLATION:    return "PolicyViolation";
        case Outcome::MISSING_ENTRY_POINT: return "MissingEntryPoint";
        case Outcome::MODULE_DENIED:       return "ModuleDenied";
        case Outcome::RUNTIME_FAILURE:     return "RuntimeFailure";
        case Outcome::TIMEOUT:             return "Timeout";
    }
    return "RuntimeFailure";
}

Outcome outcomeFromString(const std::string& name) {
    static const Outcome all[] = {
        Outcome::SUCCESS, Outcome::POLICY_VIOLATION, Outcome::MISSING_ENTRY_POINT,
        Outcome::MODULE_DENIED, Outcome::RUNTIME_FAILURE, Outcome::TIMEOUT,
    };
    for (Outcome o : all) {
        if (name == toString(o)) return o;
    }
    throw std::invalid_argument("unknown outcome: " + name);
}

const char* toString(CandidateProgram::Origin origin) {
    return origin == CandidateProgram::Origin::GENERATED ? "generated" : "repaired";
}

ExecutionResult ExecutionResult::success(std::vector<Record> records, std::string out) {
    ExecutionResult r;
    r.outcome = Outcome::SUCCESS;
    r.payload = std::move(records);
    r.stdout_text = std::move(out);
    return r;
}

ExecutionResult ExecutionResult::failure(Outcome outcome, std::string message,
                                         std::string out) {
    if (outcome == Outcome::SUCCESS) {
        throw std::invalid_argument("failure() called with Outcome::SUCCESS");
    }
    ExecutionResult r;
    r.outcome = outcome;
    r.message = std::move(message);
    r.stdout_text = std::move(out);
    return r;
}

nlohmann::json ExecutionResult::toJson() const {
    nlohmann::json j;
    j["outcome"] = toString(outcome);
    j["success"] = ok();
    j["stdout"] = stdout_text;
    j["message"] = message;
    j["elapsed_seconds"] = elapsed_seconds;
    j["data"] = payload ? nlohmann::json(*payload) : nlohmann::json(nullptr);
    if (install_hint) j["install_hint"] = *install_hint;
    if (denied_module) j["denied_module"] = *denied_module;
    return j;
}

} // namespace sandscrape
