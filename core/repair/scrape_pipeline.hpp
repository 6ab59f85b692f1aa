#pragma once

#include "repair/oracle.hpp"
#include "repair/repair_orchestrator.hpp"
#include <optional>
#include <string>

namespace sandscrape {

struct PipelineOptions {
    bool use_vision = true;     // pass the screenshot to the analysis oracle
    bool auto_execute = true;   // run the execute/repair loop after drafting
    std::optional<std::string> human_feedback;
};

struct PipelineReport {
    std::string url;
    std::string goal;
    std::string page_title;
    ExtractionPlan plan;
    GeneratedProgram draft;
    std::optional<AttemptSession> session;  // absent when auto_execute is off

    nlohmann::json toJson() const;
};

/// observe → analyze → generate → execute/repair. Collaborator
/// exceptions propagate; execution failures end up in the session.
class ScrapePipeline {
public:
    ScrapePipeline(PageObserver& observer, AnalysisOracle& analyzer,
                   CodeGenerationOracle& generator, RepairOrchestrator& orchestrator)
        : observer_(observer), analyzer_(analyzer),
          generator_(generator), orchestrator_(orchestrator) {}

    PipelineReport run(const std::string& url, const std::string& goal,
                       const PipelineOptions& options = {});

private:
    PageObserver& observer_;
    AnalysisOracle& analyzer_;
    CodeGenerationOracle& generator_;
    RepairOrchestrator& orchestrator_;
};

} // namespace sandscrape
