#include "repair/repair_request.hpp"
#include "engine/utf8.hpp"
#include <sstream>

namespace sandscrape {

const char* const kRepairSystemPrompt =
    "You are an expert in Python web scraping. A generated scraper failed or "
    "returned no data when run in a restricted sandbox. Diagnose the problem and "
    "return the corrected program.\n"
    "Rules:\n"
    "1. Keep the scrape(url) function; it must return a list of dicts.\n"
    "2. Fix CSS selectors or extraction logic when data is missing.\n"
    "3. Output only the complete corrected program, no explanation.\n"
    "4. Use requests and BeautifulSoup; do not use os, sys, subprocess, socket, "
    "eval or exec.";

namespace {

constexpr size_t kStdoutTail = 2000;

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

std::string guidanceFor(const ExecutionResult& result) {
    switch (result.outcome) {
        case Outcome::SUCCESS:
            return "The program ran but the data was not what was wanted. Re-check "
                   "the selectors against the page structure; try different "
                   "distinguishing features.";
        case Outcome::POLICY_VIOLATION:
            return "The source was rejected before running because it contains a "
                   "denied token. Remove that token everywhere, including comments "
                   "and string literals.";
        case Outcome::MODULE_DENIED:
            return "The program imported a module the sandbox does not allow (" +
                   result.denied_module.value_or("unknown") +
                   "). Use only requests, bs4, json, re, datetime, time, typing, "
                   "collections, urllib, math and random.";
        case Outcome::MISSING_ENTRY_POINT:
            return "The program does not define a top-level function scrape(url). "
                   "Define it; it must return a list of dicts.";
        case Outcome::TIMEOUT:
            return "The program did not finish in time. Make fewer requests, pass a "
                   "timeout to every network call and avoid unbounded loops.";
        case Outcome::RUNTIME_FAILURE:
            if (result.install_hint) {
                return "A module the program imports is not installed on the host "
                       "(" + *result.install_hint + "). Prefer modules that are "
                       "available, or fall back gracefully.";
            }
            return "The program raised an error or returned data of the wrong "
                   "shape. Fix the error reported above.";
    }
    return "";
}

} // namespace

std::string formatRepairPrompt(const RepairRequest& request) {
    const ExecutionResult& r = request.last_result;
    std::ostringstream out;

    out << "Target URL: " << request.target_url << "\n";
    out << "Goal: " << request.goal << "\n\n";

    out << "Original program:\n```python\n" << request.original_source;
    if (request.original_source.empty() || request.original_source.back() != '\n') out << "\n";
    out << "```\n\n";

    out << "Execution result (attempt " << request.attempt << "): "
        << toString(r.outcome) << "\n";
    if (!r.message.empty()) out << "Message: " << r.message << "\n";
    if (r.payload) out << "Records returned: " << r.payload->size() << "\n";
    if (!r.stdout_text.empty()) {
        size_t start = r.stdout_text.size() > kStdoutTail
            ? r.stdout_text.size() - kStdoutTail : 0;
        while (start < r.stdout_text.size() &&
               isUtf8Continuation(static_cast<unsigned char>(r.stdout_text[start]))) {
            ++start;
        }
        std::string tail = r.stdout_text.substr(start);
        out << "Program output:\n" << tail;
        if (tail.empty() || tail.back() != '\n') out << "\n";
    }

    if (request.human_feedback && !trim(*request.human_feedback).empty()) {
        out << "\nUser feedback: " << trim(*request.human_feedback) << "\n";
    }

    out << "\nPlease fix the program. " << guidanceFor(r) << "\n";
    return out.str();
}

std::string extractSourceFromReply(const std::string& reply) {
    auto fenced = [&reply](const std::string& opener) -> std::optional<std::string> {
        size_t start = reply.find(opener);
        if (start == std::string::npos) return std::nullopt;
        size_t body = reply.find('\n', start + opener.size());
        if (body == std::string::npos) return std::nullopt;
        size_t end = reply.find("```", body + 1);
        if (end == std::string::npos) return std::nullopt;
        return trim(reply.substr(body + 1, end - body - 1)) + "\n";
    };

    if (auto code = fenced("```python")) return *code;
    if (auto code = fenced("```")) return *code;
    return trim(reply);
}

} // namespace sandscrape
