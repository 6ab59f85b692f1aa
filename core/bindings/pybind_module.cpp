// PyBind11 bindings for the sandscrape C++ core.
// Exposes the policy, execution engine, results and the repair loop to
// Python, and lets Python implement the oracles and the page observer.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DSANDSCRAPE_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "config/runtime_config.hpp"
#include "engine/execution_engine.hpp"
#include "engine/execution_result.hpp"
#include "policy/execution_policy.hpp"
#include "policy/prescan.hpp"
#include "repair/attempt_session.hpp"
#include "repair/oracle.hpp"
#include "repair/repair_orchestrator.hpp"
#include "repair/repair_request.hpp"
#include "repair/scrape_pipeline.hpp"

namespace py = pybind11;
using namespace sandscrape;

namespace {

// JSON crosses the boundary as Python objects via the json module.
py::object toPython(const nlohmann::json& j) {
    return py::module_::import("json").attr("loads")(j.dump());
}

nlohmann::json fromPython(py::handle obj) {
    std::string text = py::str(py::module_::import("json").attr("dumps")(obj));
    return nlohmann::json::parse(text);
}

class PyExecutor : public Executor {
public:
    ExecutionResult execute(const CandidateProgram& program, const std::string& url) override {
        PYBIND11_OVERRIDE_PURE(ExecutionResult, Executor, execute, program, url);
    }
};

class PyPageObserver : public PageObserver {
public:
    PageSnapshot observe(const std::string& url) override {
        PYBIND11_OVERRIDE_PURE(PageSnapshot, PageObserver, observe, url);
    }
};

class PyAnalysisOracle : public AnalysisOracle {
public:
    ExtractionPlan analyze(const std::string& goal, const PageSnapshot& page) override {
        PYBIND11_OVERRIDE_PURE(ExtractionPlan, AnalysisOracle, analyze, goal, page);
    }
};

class PyCodeGenerationOracle : public CodeGenerationOracle {
public:
    GeneratedProgram generate(const std::string& url, const ExtractionPlan& plan) override {
        PYBIND11_OVERRIDE_PURE(GeneratedProgram, CodeGenerationOracle, generate, url, plan);
    }
    std::string repair(const RepairRequest& request) override {
        PYBIND11_OVERRIDE_PURE(std::string, CodeGenerationOracle, repair, request);
    }
};

} // namespace

PYBIND11_MODULE(sandscrape_bindings, m) {
    m.doc() = "sandscrape C++ core bindings";

    // ── Policy ──
    py::class_<PreloadedModule>(m, "PreloadedModule")
        .def(py::init<>())
        .def(py::init<std::string, std::string, std::string>(),
             py::arg("binding"), py::arg("module"), py::arg("attribute") = "")
        .def_readwrite("binding", &PreloadedModule::binding)
        .def_readwrite("module", &PreloadedModule::module)
        .def_readwrite("attribute", &PreloadedModule::attribute);

    py::class_<ExecutionPolicy>(m, "ExecutionPolicy")
        .def(py::init<>())
        .def_readwrite("allowed_modules", &ExecutionPolicy::allowed_modules)
        .def_readwrite("blocked_symbols", &ExecutionPolicy::blocked_symbols)
        .def_readwrite("denied_substrings", &ExecutionPolicy::denied_substrings)
        .def_readwrite("preloaded_modules", &ExecutionPolicy::preloaded_modules)
        .def_readwrite("install_hints", &ExecutionPolicy::install_hints)
        .def("is_module_allowed", &ExecutionPolicy::isModuleAllowed)
        .def("is_symbol_blocked", &ExecutionPolicy::isSymbolBlocked)
        .def("install_hint_for", &ExecutionPolicy::installHintFor);

    m.def("make_default_policy", &makeDefaultPolicy);

    py::class_<PreScanResult>(m, "PreScanResult")
        .def_readonly("passed", &PreScanResult::passed)
        .def_readonly("matched", &PreScanResult::matched)
        .def_readonly("message", &PreScanResult::message);

    m.def("prescan", [](const ExecutionPolicy& policy, const std::string& source) {
        return PreScanner(policy).scan(source);
    }, py::arg("policy"), py::arg("source"));

    // ── Results ──
    py::enum_<Outcome>(m, "Outcome")
        .value("SUCCESS", Outcome::SUCCESS)
        .value("POLICY_VIOLATION", Outcome::POLICY_VIOLATION)
        .value("MISSING_ENTRY_POINT", Outcome::MISSING_ENTRY_POINT)
        .value("MODULE_DENIED", Outcome::MODULE_DENIED)
        .value("RUNTIME_FAILURE", Outcome::RUNTIME_FAILURE)
        .value("TIMEOUT", Outcome::TIMEOUT);

    py::class_<CandidateProgram> program(m, "CandidateProgram");
    py::enum_<CandidateProgram::Origin>(program, "Origin")
        .value("GENERATED", CandidateProgram::Origin::GENERATED)
        .value("REPAIRED", CandidateProgram::Origin::REPAIRED);
    program
        .def(py::init<>())
        .def(py::init([](std::string source, int attempt, CandidateProgram::Origin origin) {
            return CandidateProgram{std::move(source), attempt, origin};
        }), py::arg("source"), py::arg("attempt") = 1,
            py::arg("origin") = CandidateProgram::Origin::GENERATED)
        .def_readwrite("source", &CandidateProgram::source)
        .def_readwrite("attempt", &CandidateProgram::attempt)
        .def_readwrite("origin", &CandidateProgram::origin);

    py::class_<ExecutionResult>(m, "ExecutionResult")
        .def(py::init<>())
        .def_static("failure", &ExecutionResult::failure,
                    py::arg("outcome"), py::arg("message"), py::arg("stdout") = "")
        .def_static("success", [](py::list records, std::string out) {
            std::vector<Record> recs;
            for (py::handle r : records) recs.push_back(fromPython(r));
            return ExecutionResult::success(std::move(recs), std::move(out));
        }, py::arg("records"), py::arg("stdout") = "")
        .def_readonly("outcome", &ExecutionResult::outcome)
        .def_readonly("stdout", &ExecutionResult::stdout_text)
        .def_readonly("message", &ExecutionResult::message)
        .def_readonly("install_hint", &ExecutionResult::install_hint)
        .def_readonly("denied_module", &ExecutionResult::denied_module)
        .def_readonly("elapsed_seconds", &ExecutionResult::elapsed_seconds)
        .def_property_readonly("payload", [](const ExecutionResult& r) -> py::object {
            if (!r.payload) return py::none();
            return toPython(nlohmann::json(*r.payload));
        })
        .def("ok", &ExecutionResult::ok)
        .def("to_dict", [](const ExecutionResult& r) { return toPython(r.toJson()); });

    // ── Engine ──
    py::class_<EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def_readwrite("timeout_seconds", &EngineConfig::timeout_seconds)
        .def_readwrite("worker_path", &EngineConfig::worker_path)
        .def_readwrite("memory_limit_mb", &EngineConfig::memory_limit_mb)
        .def_readwrite("max_open_files", &EngineConfig::max_open_files)
        .def_readwrite("max_stdout_bytes", &EngineConfig::max_stdout_bytes)
        .def_readwrite("worker_log_level", &EngineConfig::worker_log_level)
        .def_readwrite("passthrough_env", &EngineConfig::passthrough_env);

    py::class_<Executor, PyExecutor>(m, "Executor")
        .def(py::init<>())
        .def("execute", &Executor::execute, py::arg("program"), py::arg("url"));

    py::class_<ExecutionEngine, Executor>(m, "ExecutionEngine")
        .def(py::init<ExecutionPolicy, EngineConfig>(), py::arg("policy"), py::arg("config"))
        .def("execute", &ExecutionEngine::execute, py::arg("program"), py::arg("url"),
             py::call_guard<py::gil_scoped_release>())
        .def_property_readonly("policy", &ExecutionEngine::policy)
        .def_property_readonly("config", &ExecutionEngine::config);

    // ── Oracles ──
    py::class_<PageSnapshot>(m, "PageSnapshot")
        .def(py::init<>())
        .def_readwrite("title", &PageSnapshot::title)
        .def_readwrite("structural_summary", &PageSnapshot::structural_summary)
        .def_readwrite("screenshot_base64", &PageSnapshot::screenshot_base64);

    py::class_<ExtractionPlan>(m, "ExtractionPlan")
        .def(py::init<>())
        .def_readwrite("target_description", &ExtractionPlan::target_description)
        .def_readwrite("suggested_selectors", &ExtractionPlan::suggested_selectors)
        .def_readwrite("page_type", &ExtractionPlan::page_type)
        .def_property("data_structure",
            [](const ExtractionPlan& p) { return toPython(p.data_structure); },
            [](ExtractionPlan& p, py::object v) { p.data_structure = fromPython(v); });

    py::class_<GeneratedProgram>(m, "GeneratedProgram")
        .def(py::init<>())
        .def_readwrite("source", &GeneratedProgram::source)
        .def_readwrite("imports", &GeneratedProgram::imports)
        .def_readwrite("explanation", &GeneratedProgram::explanation);

    py::class_<RepairRequest>(m, "RepairRequest")
        .def(py::init<>())
        .def_readwrite("original_source", &RepairRequest::original_source)
        .def_readwrite("target_url", &RepairRequest::target_url)
        .def_readwrite("goal", &RepairRequest::goal)
        .def_readwrite("last_result", &RepairRequest::last_result)
        .def_readwrite("human_feedback", &RepairRequest::human_feedback)
        .def_readwrite("attempt", &RepairRequest::attempt);

    m.attr("REPAIR_SYSTEM_PROMPT") = kRepairSystemPrompt;
    m.def("format_repair_prompt", &formatRepairPrompt);
    m.def("extract_source_from_reply", &extractSourceFromReply);

    py::class_<PageObserver, PyPageObserver>(m, "PageObserver")
        .def(py::init<>())
        .def("observe", &PageObserver::observe);

    py::class_<AnalysisOracle, PyAnalysisOracle>(m, "AnalysisOracle")
        .def(py::init<>())
        .def("analyze", &AnalysisOracle::analyze);

    py::class_<CodeGenerationOracle, PyCodeGenerationOracle>(m, "CodeGenerationOracle")
        .def(py::init<>())
        .def("generate", &CodeGenerationOracle::generate)
        .def("repair", &CodeGenerationOracle::repair);

    // ── Repair loop ──
    py::enum_<SessionState>(m, "SessionState")
        .value("DRAFTED", SessionState::DRAFTED)
        .value("EXECUTING", SessionState::EXECUTING)
        .value("NEEDS_REPAIR", SessionState::NEEDS_REPAIR)
        .value("REPAIRING", SessionState::REPAIRING)
        .value("SUCCEEDED", SessionState::SUCCEEDED)
        .value("GAVE_UP", SessionState::GAVE_UP);

    py::class_<AttemptRecord>(m, "AttemptRecord")
        .def_readonly("program", &AttemptRecord::program)
        .def_readonly("result", &AttemptRecord::result);

    py::class_<AttemptSession>(m, "AttemptSession")
        .def_property_readonly("target", &AttemptSession::target)
        .def_property_readonly("goal", &AttemptSession::goal)
        .def_property_readonly("max_attempts", &AttemptSession::maxAttempts)
        .def_property_readonly("state", &AttemptSession::state)
        .def_property_readonly("finished", &AttemptSession::finished)
        .def_property_readonly("current", &AttemptSession::current)
        .def_property_readonly("history", &AttemptSession::history)
        .def_property("human_feedback", &AttemptSession::humanFeedback,
                      &AttemptSession::setHumanFeedback)
        .def("history_dicts", [](const AttemptSession& s) { return toPython(s.historyJson()); })
        .def("export_history", &AttemptSession::exportHistory);

    py::class_<OrchestratorConfig>(m, "OrchestratorConfig")
        .def(py::init<>())
        .def_readwrite("max_attempts", &OrchestratorConfig::max_attempts);

    py::class_<RepairOrchestrator>(m, "RepairOrchestrator")
        .def(py::init<Executor&, CodeGenerationOracle&, OrchestratorConfig>(),
             py::arg("executor"), py::arg("oracle"),
             py::arg("config") = OrchestratorConfig{},
             py::keep_alive<1, 2>(), py::keep_alive<1, 3>())
        .def("begin", &RepairOrchestrator::begin,
             py::arg("target"), py::arg("goal"), py::arg("source"))
        .def("step", &RepairOrchestrator::step)
        .def("run_to_completion", &RepairOrchestrator::runToCompletion)
        .def("run", &RepairOrchestrator::run,
             py::arg("target"), py::arg("goal"), py::arg("source"),
             py::arg("human_feedback") = py::none())
        .def("make_repair_request", &RepairOrchestrator::makeRepairRequest);

    py::class_<PipelineOptions>(m, "PipelineOptions")
        .def(py::init<>())
        .def_readwrite("use_vision", &PipelineOptions::use_vision)
        .def_readwrite("auto_execute", &PipelineOptions::auto_execute)
        .def_readwrite("human_feedback", &PipelineOptions::human_feedback);

    py::class_<PipelineReport>(m, "PipelineReport")
        .def_readonly("page_title", &PipelineReport::page_title)
        .def_readonly("plan", &PipelineReport::plan)
        .def_readonly("draft", &PipelineReport::draft)
        .def_readonly("session", &PipelineReport::session)
        .def("to_dict", [](const PipelineReport& r) { return toPython(r.toJson()); });

    py::class_<ScrapePipeline>(m, "ScrapePipeline")
        .def(py::init<PageObserver&, AnalysisOracle&, CodeGenerationOracle&, RepairOrchestrator&>(),
             py::keep_alive<1, 2>(), py::keep_alive<1, 3>(),
             py::keep_alive<1, 4>(), py::keep_alive<1, 5>())
        .def("run", &ScrapePipeline::run,
             py::arg("url"), py::arg("goal"), py::arg("options") = PipelineOptions{});

    // ── Config ──
    py::class_<RuntimeConfig>(m, "RuntimeConfig")
        .def(py::init<>())
        .def_readwrite("engine", &RuntimeConfig::engine)
        .def_readwrite("orchestrator", &RuntimeConfig::orchestrator)
        .def_readwrite("log_level", &RuntimeConfig::log_level);

    m.def("load_runtime_config", &loadRuntimeConfigFromEnvironment);
    m.def("configure_logging", &configureLogging);
}
