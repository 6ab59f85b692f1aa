#include "repair/scrape_pipeline.hpp"

#include <spdlog/spdlog.h>

namespace sandscrape {

PipelineReport ScrapePipeline::run(const std::string& url, const std::string& goal,
                                   const PipelineOptions& options) {
    PipelineReport report;
    report.url = url;
    report.goal = goal;

    PageSnapshot page = observer_.observe(url);
    report.page_title = page.title;
    if (!options.use_vision) page.screenshot_base64.reset();

    report.plan = analyzer_.analyze(goal, page);
    spdlog::info("[pipeline] plan for {}: '{}' ({} selectors, page type {})",
                 url, report.plan.target_description,
                 report.plan.suggested_selectors.size(), report.plan.page_type);

    report.draft = generator_.generate(url, report.plan);
    report.draft.source = extractSourceFromReply(report.draft.source);

    if (options.auto_execute) {
        report.session = orchestrator_.run(url, goal, report.draft.source,
                                           options.human_feedback);
    }
    return report;
}

nlohmann::json PipelineReport::toJson() const {
    nlohmann::json j;
    j["url"] = url;
    j["goal"] = goal;
    j["page_title"] = page_title;
    j["steps"]["analysis"] = {
        {"target", plan.target_description},
        {"selectors", plan.suggested_selectors},
        {"structure", plan.data_structure},
        {"page_type", plan.page_type},
    };
    j["steps"]["generation"] = {
        {"code", draft.source},
        {"imports", draft.imports},
        {"explanation", draft.explanation},
    };
    if (session) {
        const ExecutionResult* last = session->lastResult();
        j["steps"]["execution"] = {
            {"state", toString(session->state())},
            {"attempts", session->attemptsUsed()},
            {"final_code", session->current().source},
            {"result", last ? last->toJson() : nlohmann::json(nullptr)},
            {"history", session->historyJson()},
        };
    }
    return j;
}

} // namespace sandscrape
