#include <gtest/gtest.h>
#include "repair/scrape_pipeline.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace sandscrape;

namespace {

class FakeObserver : public PageObserver {
public:
    PageSnapshot observe(const std::string& url) override {
        visited.push_back(url);
        if (fail) throw std::runtime_error("navigation failed");
        PageSnapshot page;
        page.title = "Example Store";
        page.structural_summary = "<ul class=\"products\"><li>...</li></ul>";
        page.screenshot_base64 = "iVBORw0KGgo=";
        return page;
    }

    std::vector<std::string> visited;
    bool fail = false;
};

class FakeAnalyzer : public AnalysisOracle {
public:
    ExtractionPlan analyze(const std::string& goal, const PageSnapshot& page) override {
        saw_screenshot = page.screenshot_base64.has_value();
        ExtractionPlan plan;
        plan.target_description = goal;
        plan.suggested_selectors = {"ul.products li", "span.price"};
        plan.data_structure = {{"name", "string"}, {"price", "string"}};
        plan.page_type = "list";
        return plan;
    }

    bool saw_screenshot = false;
};

class FakeGenerator : public CodeGenerationOracle {
public:
    GeneratedProgram generate(const std::string& url, const ExtractionPlan& plan) override {
        last_url = url;
        last_plan = plan;
        return {"```python\ndef scrape(url):\n    return []\n```", {"requests", "bs4"},
                "walks the product list"};
    }

    std::string repair(const RepairRequest&) override {
        ++repairs;
        return "def scrape(url):\n    return [{'fixed': True}]\n";
    }

    std::string last_url;
    ExtractionPlan last_plan;
    int repairs = 0;
};

class FakeExecutor : public Executor {
public:
    ExecutionResult execute(const CandidateProgram& program, const std::string&) override {
        programs.push_back(program.source);
        if (program.attempt == 1) {
            return ExecutionResult::failure(Outcome::RUNTIME_FAILURE, "IndexError: list index out of range");
        }
        Record rec = Record::object();
        rec["fixed"] = true;
        return ExecutionResult::success({rec}, "");
    }

    std::vector<std::string> programs;
};

struct PipelineFixture : public ::testing::Test {
    FakeObserver observer;
    FakeAnalyzer analyzer;
    FakeGenerator generator;
    FakeExecutor executor;
    RepairOrchestrator orchestrator{executor, generator};
    ScrapePipeline pipeline{observer, analyzer, generator, orchestrator};
};

} // namespace

TEST_F(PipelineFixture, RunsEveryStage) {
    PipelineReport report = pipeline.run("https://shop.example", "product names and prices");

    EXPECT_EQ(observer.visited, std::vector<std::string>{"https://shop.example"});
    EXPECT_TRUE(analyzer.saw_screenshot);
    EXPECT_EQ(generator.last_url, "https://shop.example");
    EXPECT_EQ(generator.last_plan.page_type, "list");
    EXPECT_EQ(report.page_title, "Example Store");

    // The draft is unwrapped before it runs.
    EXPECT_EQ(report.draft.source, "def scrape(url):\n    return []\n");
    ASSERT_FALSE(executor.programs.empty());
    EXPECT_EQ(executor.programs[0], report.draft.source);

    ASSERT_TRUE(report.session.has_value());
    EXPECT_EQ(report.session->state(), SessionState::SUCCEEDED);
    EXPECT_EQ(report.session->attemptsUsed(), 2u);
    EXPECT_EQ(generator.repairs, 1);
}

TEST_F(PipelineFixture, VisionOffHidesScreenshot) {
    PipelineOptions options;
    options.use_vision = false;
    pipeline.run("https://shop.example", "prices", options);
    EXPECT_FALSE(analyzer.saw_screenshot);
}

TEST_F(PipelineFixture, AutoExecuteOffStopsAfterDraft) {
    PipelineOptions options;
    options.auto_execute = false;
    PipelineReport report = pipeline.run("https://shop.example", "prices", options);
    EXPECT_FALSE(report.session.has_value());
    EXPECT_TRUE(executor.programs.empty());

    nlohmann::json j = report.toJson();
    EXPECT_TRUE(j["steps"].contains("analysis"));
    EXPECT_TRUE(j["steps"].contains("generation"));
    EXPECT_FALSE(j["steps"].contains("execution"));
}

TEST_F(PipelineFixture, ReportJson) {
    PipelineReport report = pipeline.run("https://shop.example", "prices");
    nlohmann::json j = report.toJson();
    EXPECT_EQ(j["url"], "https://shop.example");
    EXPECT_EQ(j["steps"]["analysis"]["selectors"][0], "ul.products li");
    EXPECT_EQ(j["steps"]["generation"]["imports"][1], "bs4");
    EXPECT_EQ(j["steps"]["execution"]["state"], "Succeeded");
    EXPECT_EQ(j["steps"]["execution"]["attempts"], 2);
    EXPECT_EQ(j["steps"]["execution"]["result"]["data"][0]["fixed"], true);
    EXPECT_EQ(j["steps"]["execution"]["history"].size(), 2u);
}

TEST_F(PipelineFixture, ObserverFailurePropagates) {
    observer.fail = true;
    EXPECT_THROW(pipeline.run("https://shop.example", "prices"), std::runtime_error);
    EXPECT_TRUE(executor.programs.empty());
}
