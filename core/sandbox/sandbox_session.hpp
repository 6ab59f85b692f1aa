#pragma once

#include "engine/worker_protocol.hpp"
#include <pybind11/pybind11.h>
#include <string>

namespace sandscrape {

constexpr size_t kMaxMessageBytes = 2000;

/// Worker-side execution of one request, steps 2-10 of the engine
/// algorithm: build a fresh namespace, evaluate the source, look up
/// scrape, call it with stdout captured, classify the outcome.
/// Requires an initialised interpreter. Never throws for anything the
/// candidate program does.
class SandboxSession {
public:
    explicit SandboxSession(const WorkerRequest& request)
        : request_(request), policy_(request.policy()) {}

    WorkerResponse run();

private:
    const WorkerRequest& request_;
    ExecutionPolicy policy_;

    WorkerResponse classify(pybind11::error_already_set& error,
                            const pybind11::object& denied_type,
                            const std::string& denied_name) const;
};

/// "Type: message", bounded to kMaxMessageBytes. No traceback.
std::string describeException(pybind11::error_already_set& error);

} // namespace sandscrape
