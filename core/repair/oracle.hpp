#pragma once

#include "repair/repair_request.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sandscrape {

// ─── External collaborators ───────────────────────────────────
// Black boxes reached over the network (browser automation, hosted
// text-generation models). Only their contracts live here; the
// Python bindings let a Python layer implement them.

/// What the page observer extracts from a loaded URL.
struct PageSnapshot {
    std::string title;
    std::string structural_summary;            // simplified document structure
    std::optional<std::string> screenshot_base64;
};

/// Analysis oracle output: how to extract what the user asked for.
struct ExtractionPlan {
    std::string target_description;
    std::vector<std::string> suggested_selectors;
    nlohmann::json data_structure = nlohmann::json::object();
    std::string page_type;  // list, table, article, ...
};

/// Code-generation oracle output for a first draft.
struct GeneratedProgram {
    std::string source;
    std::vector<std::string> imports;
    std::string explanation;
};

class PageObserver {
public:
    virtual ~PageObserver() = default;
    virtual PageSnapshot observe(const std::string& url) = 0;
};

class AnalysisOracle {
public:
    virtual ~AnalysisOracle() = default;

    /// `page.screenshot_base64` is cleared by the caller when vision is off.
    virtual ExtractionPlan analyze(const std::string& goal, const PageSnapshot& page) = 0;
};

class CodeGenerationOracle {
public:
    virtual ~CodeGenerationOracle() = default;

    /// First draft from an extraction plan.
    virtual GeneratedProgram generate(const std::string& url, const ExtractionPlan& plan) = 0;

    /// Replacement source for a failed program. Reply is source text only;
    /// a markdown fence around it is tolerated.
    virtual std::string repair(const RepairRequest& request) = 0;
};

} // namespace sandscrape
