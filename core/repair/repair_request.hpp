#pragma once

#include "engine/execution_result.hpp"
#include <optional>
#include <string>

namespace sandscrape {

/// Everything the code-generation oracle needs to repair a program.
struct RepairRequest {
    std::string original_source;
    std::string target_url;
    std::string goal;
    ExecutionResult last_result;
    std::optional<std::string> human_feedback;
    int attempt = 1;  // attempt that produced last_result
};

/// System prompt for text-generation oracles serving repair requests.
extern const char* const kRepairSystemPrompt;

/// User prompt for a repair request: target, goal, the failing program,
/// the tagged outcome with its message and stdout tail, optional human
/// feedback, and guidance specific to the outcome.
std::string formatRepairPrompt(const RepairRequest& request);

/// Oracles are asked for bare source but often wrap it in a markdown
/// fence. Returns the body of the first ```python fence, else of the
/// first ``` fence, else the trimmed reply.
std::string extractSourceFromReply(const std::string& reply);

} // namespace sandscrape
