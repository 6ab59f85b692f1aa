#pragma once

#include "policy/execution_policy.hpp"
#include <pybind11/pybind11.h>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace sandscrape {

/// Raised by the import guard. Surfaces in Python as
/// sandscrape_guard.ModuleDenied, an ImportError subclass.
class ModuleDeniedError : public std::runtime_error {
public:
    explicit ModuleDeniedError(const std::string& module)
        : std::runtime_error("Module '" + module + "' is not allowed in the sandbox"),
          module_(module) {}

    const std::string& module() const { return module_; }

private:
    std::string module_;
};

// ─── Environment Builder ──────────────────────────────────────
// Builds the namespace a candidate program runs in:
//   - __builtins__: copy of builtins minus the policy's blocked symbols
//   - __import__:   guard checking every import against the allowlist
//   - preloaded modules bound by name, bypassing the guard
// Must run with the embedded interpreter initialised and the GIL held.

class EnvironmentBuilder {
public:
    explicit EnvironmentBuilder(const ExecutionPolicy& policy);

    /// A fresh namespace. Never reuse one across executions.
    pybind11::dict build();

    /// Python type of the guard's exception.
    pybind11::object moduleDeniedType() const { return denied_type_; }

    /// Most recent module the guard refused, if any.
    std::optional<std::string> lastDeniedModule() const { return state_->last_denied; }

private:
    struct GuardState {
        std::optional<std::string> last_denied;
    };

    const ExecutionPolicy& policy_;
    std::shared_ptr<GuardState> state_;
    pybind11::object denied_type_;

    pybind11::dict restrictedBuiltins() const;
    pybind11::object importGuard() const;
    void preload(pybind11::dict& ns) const;
};

} // namespace sandscrape
