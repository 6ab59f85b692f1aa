#pragma once

#include "engine/worker_protocol.hpp"

namespace sandscrape {

/// Applied by the worker to itself before the interpreter starts:
/// RLIMIT_AS, RLIMIT_NOFILE, RLIMIT_CPU (when set), RLIMIT_CORE = 0,
/// and PR_SET_NO_NEW_PRIVS. Throws std::system_error.
void applyResourceLimits(const ResourceLimits& limits);

} // namespace sandscrape
