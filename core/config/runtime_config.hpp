#pragma once

#include "engine/execution_engine.hpp"
#include "repair/repair_orchestrator.hpp"
#include <map>
#include <string>

namespace sandscrape {

/// Process-wide settings, read once at startup.
struct RuntimeConfig {
    EngineConfig engine;
    OrchestratorConfig orchestrator;
    std::string log_level = "info";
};

/// Overlay SANDSCRAPE_* variables from `env` onto the defaults:
///   SANDSCRAPE_TIMEOUT_SECONDS    finite number in (0, kMaxTimeoutSeconds]
///   SANDSCRAPE_MAX_ATTEMPTS       integer in [1, 100]
///   SANDSCRAPE_WORKER_PATH        path to sandscrape_worker
///   SANDSCRAPE_MEMORY_LIMIT_MB    integer in [64, kMaxMemoryLimitMb]
///   SANDSCRAPE_MAX_STDOUT_BYTES   integer >= 1
///   SANDSCRAPE_LOG_LEVEL          trace|debug|info|warn|error|critical|off,
///                                 applied to the host and the worker
/// Throws std::invalid_argument naming the variable on a bad value.
RuntimeConfig loadRuntimeConfig(const std::map<std::string, std::string>& env);

/// loadRuntimeConfig over the real process environment.
RuntimeConfig loadRuntimeConfigFromEnvironment();

/// sandscrape_worker next to the running executable.
std::string defaultWorkerPath();

/// Apply the level to spdlog's default logger.
void configureLogging(const std::string& level);

} // namespace sandscrape
