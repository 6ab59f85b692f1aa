#include "sandbox/sandbox_session.hpp"
#include "sandbox/environment_builder.hpp"
#include "sandbox/output_capture.hpp"
#include "sandbox/value_conversion.hpp"
#include "engine/utf8.hpp"

#include <spdlog/spdlog.h>
#include <pybind11/eval.h>

namespace py = pybind11;

namespace sandscrape {

namespace {

std::string bounded(std::string text) {
    if (text.size() > kMaxMessageBytes) {
        truncateUtf8(text, kMaxMessageBytes);
        text += "...";
    }
    return text;
}

WorkerResponse failure(Outcome outcome, std::string message) {
    WorkerResponse r;
    r.outcome = outcome;
    r.message = bounded(std::move(message));
    return r;
}

} // namespace

std::string describeException(py::error_already_set& error) {
    std::string type = py::str(error.type().attr("__name__"));
    std::string text = error.value() ? std::string(py::str(error.value())) : std::string();
    return bounded(text.empty() ? type : type + ": " + text);
}

WorkerResponse SandboxSession::run() {
    EnvironmentBuilder builder(policy_);
    py::dict ns = builder.build();
    py::object denied_type = builder.moduleDeniedType();

    ScopedStdoutCapture capture;
    try {
        py::exec(request_.source, ns);

        if (!ns.contains("scrape") || !PyCallable_Check(ns["scrape"].ptr())) {
            return failure(Outcome::MISSING_ENTRY_POINT,
                           "source does not define a callable scrape(url)");
        }

        py::object returned = ns["scrape"](request_.url);

        WorkerResponse ok;
        ok.outcome = Outcome::SUCCESS;
        ok.payload = toRecords(returned);
        return ok;
    } catch (py::error_already_set& e) {
        return classify(e, denied_type, builder.lastDeniedModule().value_or(""));
    } catch (const RecordShapeError& e) {
        return failure(Outcome::RUNTIME_FAILURE, std::string("TypeError: ") + e.what());
    }
}

WorkerResponse SandboxSession::classify(py::error_already_set& error,
                                        const py::object& denied_type,
                                        const std::string& denied_name) const {
    if (error.matches(denied_type)) {
        std::string module = denied_name;
        if (module.empty()) module = py::str(error.value());
        WorkerResponse r = failure(Outcome::MODULE_DENIED,
            "ModuleDenied: module '" + module + "' is not allowed by the sandbox policy");
        r.denied_module = module;
        return r;
    }

    if (error.matches(PyExc_ModuleNotFoundError)) {
        py::object name = error.value().attr("name");
        if (!name.is_none()) {
            WorkerResponse r = failure(Outcome::RUNTIME_FAILURE, describeException(error));
            r.missing_module = name.cast<std::string>();
            return r;
        }
    }

    return failure(Outcome::RUNTIME_FAILURE, describeException(error));
}

} // namespace sandscrape
