#include <gtest/gtest.h>
#include "repair/attempt_session.hpp"
#include "repair/repair_orchestrator.hpp"
#include "repair/repair_request.hpp"

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sandscrape;

namespace {

ExecutionResult okResult() {
    Record rec = Record::object();
    rec["title"] = "first";
    return ExecutionResult::success({rec}, "");
}

ExecutionResult failResult(const std::string& message = "KeyError: 'price'") {
    return ExecutionResult::failure(Outcome::RUNTIME_FAILURE, message, "partial\n");
}

// Returns scripted results in order, then keeps repeating the last one.
class ScriptedExecutor : public Executor {
public:
    explicit ScriptedExecutor(std::vector<ExecutionResult> script) : script_(std::move(script)) {}

    ExecutionResult execute(const CandidateProgram& program, const std::string& url) override {
        seen.push_back(program);
        urls.push_back(url);
        size_t i = seen.size() - 1;
        return i < script_.size() ? script_[i] : script_.back();
    }

    std::vector<CandidateProgram> seen;
    std::vector<std::string> urls;

private:
    std::vector<ExecutionResult> script_;
};

class ScriptedOracle : public CodeGenerationOracle {
public:
    GeneratedProgram generate(const std::string&, const ExtractionPlan&) override {
        return {"def scrape(url):\n    return []\n", {}, ""};
    }

    std::string repair(const RepairRequest& request) override {
        requests.push_back(request);
        if (throw_on_repair) throw std::runtime_error("oracle unavailable");
        return reply_prefix + std::to_string(requests.size());
    }

    std::vector<RepairRequest> requests;
    std::string reply_prefix = "# repair ";
    bool throw_on_repair = false;
};

} // namespace

// ─── Session ───────────────────────────────────────────────────

TEST(RepairTest, SessionStartsDrafted) {
    AttemptSession session("https://example.com", "titles", "src", 3);
    EXPECT_EQ(session.state(), SessionState::DRAFTED);
    EXPECT_EQ(session.current().attempt, 1);
    EXPECT_EQ(session.current().origin, CandidateProgram::Origin::GENERATED);
    EXPECT_EQ(session.lastResult(), nullptr);
    EXPECT_FALSE(session.finished());
}

TEST(RepairTest, SessionRejectsZeroAttempts) {
    EXPECT_THROW(AttemptSession("u", "g", "s", 0), std::invalid_argument);
    ScriptedExecutor executor({okResult()});
    ScriptedOracle oracle;
    OrchestratorConfig config;
    config.max_attempts = 0;
    EXPECT_THROW({ RepairOrchestrator orchestrator(executor, oracle, config); },
                 std::invalid_argument);
}

TEST(RepairTest, StateNames) {
    EXPECT_STREQ(toString(SessionState::NEEDS_REPAIR), "NeedsRepair");
    EXPECT_STREQ(toString(SessionState::GAVE_UP), "GaveUp");
    EXPECT_TRUE(isTerminal(SessionState::SUCCEEDED));
    EXPECT_FALSE(isTerminal(SessionState::REPAIRING));
}

// ─── Orchestrator ──────────────────────────────────────────────

TEST(RepairTest, SucceedsFirstTryWithoutOracle) {
    ScriptedExecutor executor({okResult()});
    ScriptedOracle oracle;
    RepairOrchestrator orchestrator(executor, oracle);

    AttemptSession session = orchestrator.run("https://example.com", "titles", "src");
    EXPECT_EQ(session.state(), SessionState::SUCCEEDED);
    EXPECT_EQ(session.attemptsUsed(), 1u);
    EXPECT_TRUE(oracle.requests.empty());
    EXPECT_EQ(executor.urls[0], "https://example.com");
}

TEST(RepairTest, SucceedsOnThirdAttempt) {
    ScriptedExecutor executor({failResult(), failResult(), okResult()});
    ScriptedOracle oracle;
    OrchestratorConfig config;
    config.max_attempts = 3;
    RepairOrchestrator orchestrator(executor, oracle, config);

    AttemptSession session = orchestrator.run("https://example.com", "titles", "v1");
    EXPECT_EQ(session.state(), SessionState::SUCCEEDED);
    EXPECT_EQ(session.current().attempt, 3);
    ASSERT_EQ(session.history().size(), 3u);
    EXPECT_EQ(oracle.requests.size(), 2u);

    // Each repair feeds the next execution.
    EXPECT_EQ(executor.seen[0].source, "v1");
    EXPECT_EQ(executor.seen[1].source, "# repair 1");
    EXPECT_EQ(executor.seen[2].source, "# repair 2");
    EXPECT_EQ(executor.seen[1].origin, CandidateProgram::Origin::REPAIRED);

    ASSERT_TRUE(session.lastResult()->payload.has_value());
    EXPECT_EQ((*session.lastResult()->payload)[0]["title"], "first");
}

TEST(RepairTest, GivesUpAfterMaxAttempts) {
    ScriptedExecutor executor({failResult()});
    ScriptedOracle oracle;
    OrchestratorConfig config;
    config.max_attempts = 4;
    RepairOrchestrator orchestrator(executor, oracle, config);

    AttemptSession session = orchestrator.run("u", "g", "v1");
    EXPECT_EQ(session.state(), SessionState::GAVE_UP);
    EXPECT_EQ(executor.seen.size(), 4u);
    // No repair after the last execution.
    EXPECT_EQ(oracle.requests.size(), 3u);
    EXPECT_EQ(session.lastResult()->outcome, Outcome::RUNTIME_FAILURE);
}

TEST(RepairTest, SingleAttemptNeverRepairs) {
    ScriptedExecutor executor({failResult()});
    ScriptedOracle oracle;
    OrchestratorConfig config;
    config.max_attempts = 1;
    RepairOrchestrator orchestrator(executor, oracle, config);

    AttemptSession session = orchestrator.run("u", "g", "v1");
    EXPECT_EQ(session.state(), SessionState::GAVE_UP);
    EXPECT_TRUE(oracle.requests.empty());
}

TEST(RepairTest, AttemptsStrictlyIncrease) {
    ScriptedExecutor executor({failResult()});
    ScriptedOracle oracle;
    OrchestratorConfig config;
    config.max_attempts = 5;
    RepairOrchestrator orchestrator(executor, oracle, config);

    AttemptSession session = orchestrator.run("u", "g", "v1");
    for (size_t i = 0; i < session.history().size(); ++i) {
        EXPECT_EQ(session.history()[i].program.attempt, static_cast<int>(i) + 1);
    }
}

TEST(RepairTest, StepWalksTheStateMachine) {
    ScriptedExecutor executor({failResult(), okResult()});
    ScriptedOracle oracle;
    RepairOrchestrator orchestrator(executor, oracle);

    AttemptSession session = orchestrator.begin("u", "g", "v1");
    EXPECT_EQ(orchestrator.step(session), SessionState::NEEDS_REPAIR);
    EXPECT_EQ(orchestrator.step(session), SessionState::DRAFTED);
    EXPECT_EQ(session.current().attempt, 2);
    EXPECT_EQ(orchestrator.step(session), SessionState::SUCCEEDED);
    // Terminal states stay put.
    EXPECT_EQ(orchestrator.step(session), SessionState::SUCCEEDED);
    EXPECT_EQ(executor.seen.size(), 2u);
}

TEST(RepairTest, RepairRequestCarriesFailureAndFeedback) {
    ScriptedExecutor executor({failResult("ValueError: no rows"), okResult()});
    ScriptedOracle oracle;
    RepairOrchestrator orchestrator(executor, oracle);

    AttemptSession session = orchestrator.run("https://shop.example", "prices", "v1",
                                              std::string("prices are in the sidebar"));
    ASSERT_EQ(oracle.requests.size(), 1u);
    const RepairRequest& req = oracle.requests[0];
    EXPECT_EQ(req.original_source, "v1");
    EXPECT_EQ(req.target_url, "https://shop.example");
    EXPECT_EQ(req.goal, "prices");
    EXPECT_EQ(req.attempt, 1);
    EXPECT_EQ(req.last_result.message, "ValueError: no rows");
    EXPECT_EQ(req.last_result.stdout_text, "partial\n");
    ASSERT_TRUE(req.human_feedback.has_value());
    EXPECT_EQ(*req.human_feedback, "prices are in the sidebar");
    EXPECT_EQ(session.state(), SessionState::SUCCEEDED);
}

TEST(RepairTest, FencedReplyIsUnwrapped) {
    ScriptedExecutor executor({failResult(), okResult()});
    ScriptedOracle oracle;
    oracle.reply_prefix = "Here you go:\n```python\ndef scrape(url):\n    return []\n```\n# ";
    RepairOrchestrator orchestrator(executor, oracle);

    orchestrator.run("u", "g", "v1");
    ASSERT_EQ(executor.seen.size(), 2u);
    EXPECT_EQ(executor.seen[1].source, "def scrape(url):\n    return []\n");
}

TEST(RepairTest, OracleFailureLeavesSessionResumable) {
    ScriptedExecutor executor({failResult(), okResult()});
    ScriptedOracle oracle;
    oracle.throw_on_repair = true;
    RepairOrchestrator orchestrator(executor, oracle);

    AttemptSession session = orchestrator.begin("u", "g", "v1");
    orchestrator.step(session);
    EXPECT_THROW(orchestrator.step(session), std::runtime_error);
    EXPECT_EQ(session.state(), SessionState::NEEDS_REPAIR);
    EXPECT_EQ(session.current().attempt, 1);

    oracle.throw_on_repair = false;
    orchestrator.runToCompletion(session);
    EXPECT_EQ(session.state(), SessionState::SUCCEEDED);
    EXPECT_EQ(session.current().attempt, 2);
}

TEST(RepairTest, ExecutorFailureLeavesSessionDrafted) {
    class FlakyExecutor : public Executor {
    public:
        ExecutionResult execute(const CandidateProgram&, const std::string&) override {
            if (calls++ == 0) throw std::runtime_error("sandbox host unavailable");
            return okResult();
        }
        int calls = 0;
    };

    FlakyExecutor executor;
    ScriptedOracle oracle;
    RepairOrchestrator orchestrator(executor, oracle);

    AttemptSession session = orchestrator.begin("u", "g", "v1");
    EXPECT_THROW(orchestrator.step(session), std::runtime_error);
    EXPECT_EQ(session.state(), SessionState::DRAFTED);
    EXPECT_EQ(session.attemptsUsed(), 0u);
    EXPECT_EQ(session.current().attempt, 1);

    EXPECT_EQ(orchestrator.step(session), SessionState::SUCCEEDED);
    EXPECT_EQ(session.attemptsUsed(), 1u);
    EXPECT_TRUE(oracle.requests.empty());
}

TEST(RepairTest, MakeRepairRequestNeedsAResult) {
    ScriptedExecutor executor({okResult()});
    ScriptedOracle oracle;
    RepairOrchestrator orchestrator(executor, oracle);
    AttemptSession session = orchestrator.begin("u", "g", "v1");
    EXPECT_THROW(orchestrator.makeRepairRequest(session), std::logic_error);
}

// ─── History ───────────────────────────────────────────────────

TEST(RepairTest, HistoryJson) {
    ScriptedExecutor executor({failResult(), okResult()});
    ScriptedOracle oracle;
    RepairOrchestrator orchestrator(executor, oracle);
    AttemptSession session = orchestrator.run("https://example.com", "titles", "v1");

    nlohmann::json history = session.historyJson();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0]["attempt"], 1);
    EXPECT_EQ(history[0]["origin"], "generated");
    EXPECT_EQ(history[0]["result"]["outcome"], "RuntimeFailure");
    EXPECT_EQ(history[1]["origin"], "repaired");
    EXPECT_EQ(history[1]["source"], "# repair 1");
    EXPECT_EQ(history[1]["result"]["success"], true);
}

TEST(RepairTest, ExportHistoryWritesJsonLines) {
    ScriptedExecutor executor({failResult(), okResult()});
    ScriptedOracle oracle;
    RepairOrchestrator orchestrator(executor, oracle);
    AttemptSession session = orchestrator.run("u", "g", "v1");

    std::string path = ::testing::TempDir() + "sandscrape_history.jsonl";
    session.exportHistory(path);

    std::ifstream in(path);
    std::string line;
    int lines = 0;
    while (std::getline(in, line)) {
        nlohmann::json entry = nlohmann::json::parse(line);
        EXPECT_EQ(entry["attempt"], lines + 1);
        ++lines;
    }
    EXPECT_EQ(lines, 2);
    std::remove(path.c_str());

    EXPECT_THROW(session.exportHistory("/nonexistent-dir/history.jsonl"), std::runtime_error);
}

// ─── Repair Prompt ─────────────────────────────────────────────

TEST(RepairPromptTest, IncludesOutcomeAndFeedback) {
    RepairRequest req;
    req.original_source = "def scrape(url):\n    return []";
    req.target_url = "https://example.com";
    req.goal = "article titles";
    req.last_result = ExecutionResult::failure(Outcome::MODULE_DENIED,
                                               "ModuleDenied: module 'sys' is not allowed");
    req.last_result.denied_module = "sys";
    req.human_feedback = "  titles are h2  ";
    req.attempt = 2;

    std::string prompt = formatRepairPrompt(req);
    EXPECT_NE(prompt.find("Target URL: https://example.com"), std::string::npos);
    EXPECT_NE(prompt.find("Goal: article titles"), std::string::npos);
    EXPECT_NE(prompt.find("```python\ndef scrape(url):\n    return []\n```"), std::string::npos);
    EXPECT_NE(prompt.find("Execution result (attempt 2): ModuleDenied"), std::string::npos);
    EXPECT_NE(prompt.find("(sys)"), std::string::npos);
    EXPECT_NE(prompt.find("User feedback: titles are h2\n"), std::string::npos);
}

TEST(RepairPromptTest, StdoutTailIsBounded) {
    RepairRequest req;
    req.original_source = "x";
    req.last_result = ExecutionResult::failure(Outcome::TIMEOUT, "slow",
                                               std::string(5000, 'a') + "END");
    std::string prompt = formatRepairPrompt(req);
    EXPECT_NE(prompt.find("END"), std::string::npos);
    EXPECT_LT(prompt.size(), 3500u);
}

TEST(RepairPromptTest, StdoutTailStartsOnCharacterBoundary) {
    std::string euros;
    for (int i = 0; i < 1000; ++i) euros += "\xe2\x82\xac";  // 3000 bytes
    RepairRequest req;
    req.original_source = "x";
    req.last_result = ExecutionResult::failure(Outcome::RUNTIME_FAILURE, "boom", euros);
    std::string prompt = formatRepairPrompt(req);
    EXPECT_NE(prompt.find("Program output:\n\xe2\x82\xac"), std::string::npos);
    EXPECT_NO_THROW(nlohmann::json(prompt).dump());
}

TEST(RepairPromptTest, BlankFeedbackOmitted) {
    RepairRequest req;
    req.last_result = ExecutionResult::failure(Outcome::RUNTIME_FAILURE, "boom");
    req.human_feedback = "   ";
    EXPECT_EQ(formatRepairPrompt(req).find("User feedback"), std::string::npos);
}

TEST(ExtractSourceTest, PrefersPythonFence) {
    std::string reply = "```\nnot this\n```\n```python\ndef scrape(url):\n    return []\n```";
    EXPECT_EQ(extractSourceFromReply(reply), "def scrape(url):\n    return []\n");
}

TEST(ExtractSourceTest, GenericFence) {
    EXPECT_EQ(extractSourceFromReply("```\nx = 1\n```"), "x = 1\n");
}

TEST(ExtractSourceTest, BareReplyIsTrimmed) {
    EXPECT_EQ(extractSourceFromReply("\n\n  def scrape(url): pass \n"), "def scrape(url): pass");
    EXPECT_EQ(extractSourceFromReply(""), "");
}

TEST(ExtractSourceTest, UnterminatedFenceFallsBack) {
    EXPECT_EQ(extractSourceFromReply("```python\nx = 1"), "```python\nx = 1");
}
