#include "config/runtime_config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <limits>
#include <stdexcept>

namespace sandscrape {

namespace {

const char* const kKnownVariables[] = {
    "SANDSCRAPE_TIMEOUT_SECONDS", "SANDSCRAPE_MAX_ATTEMPTS", "SANDSCRAPE_WORKER_PATH",
    "SANDSCRAPE_MEMORY_LIMIT_MB", "SANDSCRAPE_MAX_STDOUT_BYTES", "SANDSCRAPE_LOG_LEVEL",
};

[[noreturn]] void bad(const std::string& name, const std::string& value, const char* expected) {
    throw std::invalid_argument(name + "='" + value + "': expected " + expected);
}

double parsePositiveDouble(const std::string& name, const std::string& value, double max) {
    std::string expected = "a positive number <= " + std::to_string(static_cast<long long>(max));
    size_t used = 0;
    double d = 0.0;
    try {
        d = std::stod(value, &used);
    } catch (const std::exception&) {
        bad(name, value, expected.c_str());
    }
    // Rejects nan and inf too.
    if (used != value.size() || !(d > 0.0) || !(d <= max)) bad(name, value, expected.c_str());
    return d;
}

long long parseInteger(const std::string& name, const std::string& value,
                       long long min, long long max) {
    std::string expected = "an integer in [" + std::to_string(min) + ", " +
                           std::to_string(max) + "]";
    size_t used = 0;
    long long n = 0;
    try {
        n = std::stoll(value, &used);
    } catch (const std::exception&) {
        bad(name, value, expected.c_str());
    }
    if (used != value.size() || n < min || n > max) bad(name, value, expected.c_str());
    return n;
}

} // namespace

RuntimeConfig loadRuntimeConfig(const std::map<std::string, std::string>& env) {
    RuntimeConfig cfg;
    cfg.engine.worker_path = defaultWorkerPath();

    auto get = [&env](const char* name) -> const std::string* {
        auto it = env.find(name);
        return it == env.end() ? nullptr : &it->second;
    };

    if (auto v = get("SANDSCRAPE_TIMEOUT_SECONDS")) {
        cfg.engine.timeout_seconds =
            parsePositiveDouble("SANDSCRAPE_TIMEOUT_SECONDS", *v, kMaxTimeoutSeconds);
    }
    if (auto v = get("SANDSCRAPE_MAX_ATTEMPTS")) {
        cfg.orchestrator.max_attempts =
            static_cast<int>(parseInteger("SANDSCRAPE_MAX_ATTEMPTS", *v, 1, 100));
    }
    if (auto v = get("SANDSCRAPE_WORKER_PATH")) {
        if (v->empty()) bad("SANDSCRAPE_WORKER_PATH", *v, "a path");
        cfg.engine.worker_path = *v;
    }
    if (auto v = get("SANDSCRAPE_MEMORY_LIMIT_MB")) {
        cfg.engine.memory_limit_mb =
            static_cast<uint64_t>(parseInteger("SANDSCRAPE_MEMORY_LIMIT_MB", *v, 64,
                                               static_cast<long long>(kMaxMemoryLimitMb)));
    }
    if (auto v = get("SANDSCRAPE_MAX_STDOUT_BYTES")) {
        cfg.engine.max_stdout_bytes =
            static_cast<size_t>(parseInteger("SANDSCRAPE_MAX_STDOUT_BYTES", *v, 1,
                                             std::numeric_limits<long long>::max()));
    }
    if (auto v = get("SANDSCRAPE_LOG_LEVEL")) {
        // from_str maps unknown names to "off"; only accept the spelled-out ones.
        if (*v != "off" && spdlog::level::from_str(*v) == spdlog::level::off) {
            bad("SANDSCRAPE_LOG_LEVEL", *v, "trace|debug|info|warn|error|critical|off");
        }
        cfg.log_level = *v;
        cfg.engine.worker_log_level = *v;
    }
    return cfg;
}

RuntimeConfig loadRuntimeConfigFromEnvironment() {
    std::map<std::string, std::string> env;
    for (const char* name : kKnownVariables) {
        if (const char* value = std::getenv(name)) env[name] = value;
    }
    return loadRuntimeConfig(env);
}

std::string defaultWorkerPath() {
    std::error_code ec;
    std::filesystem::path self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) return "sandscrape_worker";
    return (self.parent_path() / "sandscrape_worker").string();
}

void configureLogging(const std::string& level) {
    spdlog::set_level(spdlog::level::from_str(level));
}

} // namespace sandscrape
