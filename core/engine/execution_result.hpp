#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sandscrape {

using Record = nlohmann::json;  // always a JSON object

// ─── Outcome ──────────────────────────────────────────────────
// Error taxonomy for one execution. Ordered by how far the
// candidate got:
//   POLICY_VIOLATION     never executed (static pre-scan hit)
//   MODULE_DENIED        partially executed (import guard)
//   MISSING_ENTRY_POINT  evaluated, never invoked
//   TIMEOUT              invoked, exceeded the wall-clock bound
//   RUNTIME_FAILURE      invoked, raised or returned malformed data

enum class Outcome {
    SUCCESS,
    POLICY_VIOLATION,
    MISSING_ENTRY_POINT,
    MODULE_DENIED,
    RUNTIME_FAILURE,
    TIMEOUT
};

const char* toString(Outcome outcome);

/// Inverse of toString. Throws std::invalid_argument on unknown names.
Outcome outcomeFromString(const std::string& name);

// ─── Candidate Program ────────────────────────────────────────

struct CandidateProgram {
    enum class Origin { GENERATED, REPAIRED };

    std::string source;
    int attempt = 1;
    Origin origin = Origin::GENERATED;
};

const char* toString(CandidateProgram::Origin origin);

// ─── Execution Result ─────────────────────────────────────────
// payload is set iff outcome == SUCCESS. stdout is whatever the
// program printed before it finished, failed or was cut off.

struct ExecutionResult {
    Outcome outcome = Outcome::RUNTIME_FAILURE;
    std::optional<std::vector<Record>> payload;
    std::string stdout_text;
    std::string message;
    std::optional<std::string> install_hint;   // missing-dependency variant only
    std::optional<std::string> denied_module;  // MODULE_DENIED only
    double elapsed_seconds = 0.0;

    bool ok() const { return outcome == Outcome::SUCCESS; }

    static ExecutionResult success(std::vector<Record> records, std::string out);
    static ExecutionResult failure(Outcome outcome, std::string message,
                                   std::string out = "");

    nlohmann::json toJson() const;
};

} // namespace sandscrape
