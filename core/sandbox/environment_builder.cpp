#include "sandbox/environment_builder.hpp"

#include <pybind11/embed.h>
#include <spdlog/spdlog.h>

namespace py = pybind11;

PYBIND11_EMBEDDED_MODULE(sandscrape_guard, m) {
    m.doc() = "Import guard support for the sandscrape worker";
    py::register_exception<sandscrape::ModuleDeniedError>(m, "ModuleDenied", PyExc_ImportError);
}

namespace sandscrape {

EnvironmentBuilder::EnvironmentBuilder(const ExecutionPolicy& policy)
    : policy_(policy), state_(std::make_shared<GuardState>()) {
    denied_type_ = py::module_::import("sandscrape_guard").attr("ModuleDenied");
}

py::dict EnvironmentBuilder::build() {
    py::dict ns;
    ns["__builtins__"] = restrictedBuiltins();
    ns["__name__"] = "__main__";
    preload(ns);
    return ns;
}

py::dict EnvironmentBuilder::restrictedBuiltins() const {
    py::dict original = py::module_::import("builtins").attr("__dict__");
    py::dict restricted;
    size_t blocked = 0;

    for (auto item : original) {
        std::string name = py::str(item.first);
        if (policy_.isSymbolBlocked(name)) {
            ++blocked;
            continue;
        }
        restricted[item.first] = item.second;
    }

    restricted["__import__"] = importGuard();
    spdlog::debug("[worker] builtins: {} kept, {} blocked", restricted.size(), blocked);
    return restricted;
}

py::object EnvironmentBuilder::importGuard() const {
    py::object real_import = py::module_::import("builtins").attr("__import__");
    ExecutionPolicy policy = policy_;
    std::shared_ptr<GuardState> state = state_;

    auto guard = [policy, state, real_import](const std::string& name, py::object globals,
                                              py::object locals, py::object fromlist,
                                              int level) -> py::object {
        // Relative imports have no package to be relative to.
        std::string requested = level > 0 ? std::string(level, '.') + name : name;
        if (level > 0 || !policy.isModuleAllowed(name)) {
            state->last_denied = requested;
            throw ModuleDeniedError(requested);
        }
        return real_import(name, globals, locals, fromlist, level);
    };

    return py::cpp_function(guard,
                            py::arg("name"),
                            py::arg("globals") = py::none(),
                            py::arg("locals") = py::none(),
                            py::arg("fromlist") = py::tuple(),
                            py::arg("level") = 0);
}

void EnvironmentBuilder::preload(py::dict& ns) const {
    for (const auto& m : policy_.preloaded_modules) {
        try {
            py::module_ mod = py::module_::import(m.module.c_str());
            ns[m.binding.c_str()] = m.attribute.empty() ? py::object(mod)
                                                        : mod.attr(m.attribute.c_str());
        } catch (const py::error_already_set& e) {
            // Absent on this host: the program only fails if it uses it.
            spdlog::debug("[worker] preload '{}' skipped: {}", m.binding, e.what());
        }
    }
}

} // namespace sandscrape
