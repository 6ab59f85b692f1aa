#include "sandbox/resource_limits.hpp"

#include <cerrno>
#include <string>
#include <system_error>

#include <sys/prctl.h>
#include <sys/resource.h>

namespace sandscrape {

namespace {

void setLimit(int resource, rlim_t value, const char* name) {
    rlimit current{};
    if (::getrlimit(resource, &current) != 0) {
        throw std::system_error(errno, std::generic_category(),
                                std::string("getrlimit ") + name);
    }
    // Only ever tighten; an unprivileged worker cannot raise a hard limit.
    if (current.rlim_max != RLIM_INFINITY && value > current.rlim_max) {
        value = current.rlim_max;
    }
    rlimit lim{value, value};
    if (::setrlimit(resource, &lim) != 0) {
        throw std::system_error(errno, std::generic_category(),
                                std::string("setrlimit ") + name);
    }
}

} // namespace

void applyResourceLimits(const ResourceLimits& limits) {
    if (::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        throw std::system_error(errno, std::generic_category(), "PR_SET_NO_NEW_PRIVS");
    }

    setLimit(RLIMIT_CORE, 0, "RLIMIT_CORE");
    if (limits.memory_bytes > 0) {
        setLimit(RLIMIT_AS, static_cast<rlim_t>(limits.memory_bytes), "RLIMIT_AS");
    }
    if (limits.max_open_files > 0) {
        setLimit(RLIMIT_NOFILE, static_cast<rlim_t>(limits.max_open_files), "RLIMIT_NOFILE");
    }
    if (limits.cpu_seconds > 0) {
        setLimit(RLIMIT_CPU, static_cast<rlim_t>(limits.cpu_seconds), "RLIMIT_CPU");
    }
}

} // namespace sandscrape
