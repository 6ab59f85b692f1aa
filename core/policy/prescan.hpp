#pragma once

#include "policy/execution_policy.hpp"
#include <string>
#include <vector>

namespace sandscrape {

/// Result of the static pre-scan over candidate source.
struct PreScanResult {
    bool passed = true;
    std::string matched;   // first denied substring found, empty when passed
    std::string message;
};

/// Static Pre-Scanner: literal, case-sensitive substring match against
/// the policy's denied substrings. Runs before any code is executed.
///
/// This is a hint, not a boundary. It rejects legitimate code that
/// happens to contain a token ("photos." contains "os.") and misses
/// equivalent constructs spelled differently. Containment is the
/// worker process.
class PreScanner {
public:
    explicit PreScanner(const ExecutionPolicy& policy) : policy_(policy) {}

    /// Scan `source`. Substrings are tried in sorted order so the
    /// reported match is deterministic.
    PreScanResult scan(const std::string& source) const;

    /// Every denied substring present in `source`.
    std::vector<std::string> findAll(const std::string& source) const;

private:
    const ExecutionPolicy& policy_;
};

} // namespace sandscrape
