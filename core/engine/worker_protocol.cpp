#include "engine/worker_protocol.hpp"
#include <stdexcept>

namespace sandscrape {

using nlohmann::json;

WorkerRequest WorkerRequest::make(const std::string& source, const std::string& url,
                                  const ExecutionPolicy& policy,
                                  const ResourceLimits& limits) {
    WorkerRequest req;
    req.source = source;
    req.url = url;
    req.allowed_modules.assign(policy.allowed_modules.begin(), policy.allowed_modules.end());
    req.blocked_symbols.assign(policy.blocked_symbols.begin(), policy.blocked_symbols.end());
    req.preloaded_modules = policy.preloaded_modules;
    req.limits = limits;
    return req;
}

ExecutionPolicy WorkerRequest::policy() const {
    ExecutionPolicy p;
    p.allowed_modules.insert(allowed_modules.begin(), allowed_modules.end());
    p.blocked_symbols.insert(blocked_symbols.begin(), blocked_symbols.end());
    p.preloaded_modules = preloaded_modules;
    return p;
}

std::string encodeRequest(const WorkerRequest& request) {
    json preloads = json::array();
    for (const auto& m : request.preloaded_modules) {
        preloads.push_back({{"binding", m.binding},
                            {"module", m.module},
                            {"attribute", m.attribute}});
    }

    json j;
    j["source"] = request.source;
    j["url"] = request.url;
    j["policy"] = {
        {"allowed_modules", request.allowed_modules},
        {"blocked_symbols", request.blocked_symbols},
        {"preloaded_modules", preloads},
    };
    j["limits"] = {
        {"memory_bytes", request.limits.memory_bytes},
        {"max_open_files", request.limits.max_open_files},
        {"cpu_seconds", request.limits.cpu_seconds},
    };
    return j.dump();
}

WorkerRequest decodeRequest(const std::string& text) {
    json j = json::parse(text);

    WorkerRequest req;
    req.source = j.at("source").get<std::string>();
    req.url = j.at("url").get<std::string>();

    const json& policy = j.at("policy");
    req.allowed_modules = policy.at("allowed_modules").get<std::vector<std::string>>();
    req.blocked_symbols = policy.at("blocked_symbols").get<std::vector<std::string>>();
    for (const auto& m : policy.at("preloaded_modules")) {
        req.preloaded_modules.push_back({m.at("binding").get<std::string>(),
                                         m.at("module").get<std::string>(),
                                         m.value("attribute", std::string())});
    }

    if (j.contains("limits")) {
        const json& limits = j["limits"];
        req.limits.memory_bytes = limits.value("memory_bytes", req.limits.memory_bytes);
        req.limits.max_open_files = limits.value("max_open_files", req.limits.max_open_files);
        req.limits.cpu_seconds = limits.value("cpu_seconds", req.limits.cpu_seconds);
    }
    return req;
}

std::string encodeResponse(const WorkerResponse& response) {
    json j;
    j["outcome"] = toString(response.outcome);
    j["message"] = response.message;
    if (response.payload) j["payload"] = *response.payload;
    if (response.denied_module) j["denied_module"] = *response.denied_module;
    if (response.missing_module) j["missing_module"] = *response.missing_module;
    // Program-supplied text; never let a stray byte cost the whole response.
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

WorkerResponse decodeResponse(const std::string& text) {
    json j = json::parse(text);

    WorkerResponse resp;
    resp.outcome = outcomeFromString(j.at("outcome").get<std::string>());
    resp.message = j.value("message", std::string());

    if (j.contains("payload")) {
        const json& payload = j["payload"];
        if (!payload.is_array()) {
            throw std::invalid_argument("payload is not an array");
        }
        std::vector<Record> records;
        for (const auto& rec : payload) {
            if (!rec.is_object()) {
                throw std::invalid_argument("payload record is not an object");
            }
            records.push_back(rec);
        }
        resp.payload = std::move(records);
    }
    if (j.contains("denied_module")) {
        resp.denied_module = j["denied_module"].get<std::string>();
    }
    if (j.contains("missing_module")) {
        resp.missing_module = j["missing_module"].get<std::string>();
    }

    // Keep the payload/outcome invariant even against a confused worker.
    if ((resp.outcome == Outcome::SUCCESS) != resp.payload.has_value()) {
        throw std::invalid_argument("payload present iff outcome is Success");
    }
    return resp;
}

} // namespace sandscrape
