#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

namespace sandscrape {

// ─── Preloaded Module ─────────────────────────────────────────
// A module bound directly into the sandbox namespace so candidate
// programs can use it without going through the import guard.
// `attribute` empty: bind the module itself. Otherwise bind
// module.attribute (e.g. BeautifulSoup from bs4).

struct PreloadedModule {
    std::string binding;
    std::string module;
    std::string attribute;
};

// ─── Execution Policy ─────────────────────────────────────────
// Immutable allow/deny rules. Built once at startup and handed to
// every execution by const reference.

struct ExecutionPolicy {
    std::set<std::string> allowed_modules;    // exact names and dotted prefixes
    std::set<std::string> blocked_symbols;    // builtins removed from the namespace
    std::set<std::string> denied_substrings;  // static textual red flags
    std::vector<PreloadedModule> preloaded_modules;
    std::map<std::string, std::string> install_hints;  // module -> install command

    /// True iff `name` or one of its dotted prefixes is allowlisted.
    /// "urllib" allows "urllib.parse"; "urllib.parse" does not allow "urllib".
    bool isModuleAllowed(const std::string& name) const;

    /// True iff the builtin is stripped from the sandbox namespace.
    bool isSymbolBlocked(const std::string& name) const {
        return blocked_symbols.count(name) > 0;
    }

    /// Install command for a missing module. Falls back to "uv add <name>".
    std::string installHintFor(const std::string& module) const;
};

/// The policy the scraper pipeline ships with.
ExecutionPolicy makeDefaultPolicy();

} // namespace sandscrape
