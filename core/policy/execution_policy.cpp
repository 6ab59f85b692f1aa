#include "policy/execution_policy.hpp"

namespace sandscrape {

bool ExecutionPolicy::isModuleAllowed(const std::string& name) const {
    if (name.empty() || name.front() == '.') return false;

    // Walk "a", "a.b", "a.b.c" and accept the first allowlisted prefix.
    size_t pos = 0;
    while (true) {
        size_t dot = name.find('.', pos);
        std::string prefix = name.substr(0, dot);
        if (allowed_modules.count(prefix)) return true;
        if (dot == std::string::npos) break;
        pos = dot + 1;
    }
    return false;
}

std::string ExecutionPolicy::installHintFor(const std::string& module) const {
    auto it = install_hints.find(module);
    if (it != install_hints.end()) return it->second;

    // Hints are keyed on top-level packages.
    std::string top = module.substr(0, module.find('.'));
    it = install_hints.find(top);
    if (it != install_hints.end()) return it->second;

    return "uv add " + top;
}

ExecutionPolicy makeDefaultPolicy() {
    ExecutionPolicy policy;

    policy.allowed_modules = {
        "requests", "bs4", "json", "re", "datetime", "time",
        "typing", "collections", "urllib", "urllib.parse",
        "urllib.request", "urllib.error", "math", "random",
    };

    // __import__ is blocked here and replaced by the import guard.
    policy.blocked_symbols = {
        "exec", "eval", "compile", "open", "input", "__import__",
        "globals", "locals", "getattr", "setattr", "delattr",
        "breakpoint", "vars", "exit", "quit",
    };

    policy.denied_substrings = {
        "os.", "subprocess", "socket", "eval(", "exec(",
    };

    policy.preloaded_modules = {
        {"requests", "requests", ""},
        {"BeautifulSoup", "bs4", "BeautifulSoup"},
        {"json", "json", ""},
        {"re", "re", ""},
        {"datetime", "datetime", "datetime"},
    };

    policy.install_hints = {
        {"bs4", "uv add beautifulsoup4"},
        {"beautifulsoup4", "uv add beautifulsoup4"},
        {"requests", "uv add requests"},
        {"lxml", "uv add lxml"},
    };

    return policy;
}

} // namespace sandscrape
