#include "policy/prescan.hpp"

namespace sandscrape {

PreScanResult PreScanner::scan(const std::string& source) const {
    for (const auto& token : policy_.denied_substrings) {
        if (token.empty()) continue;
        if (source.find(token) != std::string::npos) {
            return {false, token, "denied token in source: '" + token + "'"};
        }
    }
    return {true, "", ""};
}

std::vector<std::string> PreScanner::findAll(const std::string& source) const {
    std::vector<std::string> hits;
    for (const auto& token : policy_.denied_substrings) {
        if (!token.empty() && source.find(token) != std::string::npos) {
            hits.push_back(token);
        }
    }
    return hits;
}

} // namespace sandscrape
