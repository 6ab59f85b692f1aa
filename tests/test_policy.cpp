#include <gtest/gtest.h>
#include "policy/execution_policy.hpp"
#include "policy/prescan.hpp"

using namespace sandscrape;

// ─── Module Allowlist ──────────────────────────────────────────

TEST(PolicyTest, DefaultPolicyAllowsScrapingModules) {
    ExecutionPolicy policy = makeDefaultPolicy();
    EXPECT_TRUE(policy.isModuleAllowed("requests"));
    EXPECT_TRUE(policy.isModuleAllowed("bs4"));
    EXPECT_TRUE(policy.isModuleAllowed("json"));
    EXPECT_TRUE(policy.isModuleAllowed("urllib.parse"));
    EXPECT_FALSE(policy.isModuleAllowed("os"));
    EXPECT_FALSE(policy.isModuleAllowed("subprocess"));
    EXPECT_FALSE(policy.isModuleAllowed("sys"));
}

TEST(PolicyTest, PrefixAllowsSubmodules) {
    ExecutionPolicy policy;
    policy.allowed_modules = {"bs4"};
    EXPECT_TRUE(policy.isModuleAllowed("bs4.element"));
    EXPECT_TRUE(policy.isModuleAllowed("bs4.builder._htmlparser"));
    // A shared spelling is not a shared package.
    EXPECT_FALSE(policy.isModuleAllowed("bs4extra"));
}

TEST(PolicyTest, SubmoduleDoesNotAllowParent) {
    ExecutionPolicy policy;
    policy.allowed_modules = {"urllib.parse"};
    EXPECT_TRUE(policy.isModuleAllowed("urllib.parse"));
    EXPECT_FALSE(policy.isModuleAllowed("urllib"));
    EXPECT_FALSE(policy.isModuleAllowed("urllib.request"));
}

TEST(PolicyTest, EmptyAndRelativeNamesDenied) {
    ExecutionPolicy policy = makeDefaultPolicy();
    EXPECT_FALSE(policy.isModuleAllowed(""));
    EXPECT_FALSE(policy.isModuleAllowed(".json"));
}

TEST(PolicyTest, BlockedSymbols) {
    ExecutionPolicy policy = makeDefaultPolicy();
    EXPECT_TRUE(policy.isSymbolBlocked("eval"));
    EXPECT_TRUE(policy.isSymbolBlocked("open"));
    EXPECT_TRUE(policy.isSymbolBlocked("__import__"));
    EXPECT_FALSE(policy.isSymbolBlocked("print"));
    EXPECT_FALSE(policy.isSymbolBlocked("len"));
}

// ─── Install Hints ─────────────────────────────────────────────

TEST(PolicyTest, InstallHintUsesDistributionName) {
    ExecutionPolicy policy = makeDefaultPolicy();
    EXPECT_EQ(policy.installHintFor("bs4"), "uv add beautifulsoup4");
    EXPECT_EQ(policy.installHintFor("requests"), "uv add requests");
}

TEST(PolicyTest, InstallHintFallsBackToTopLevelPackage) {
    ExecutionPolicy policy = makeDefaultPolicy();
    EXPECT_EQ(policy.installHintFor("lxml.etree"), "uv add lxml");
    EXPECT_EQ(policy.installHintFor("pandas"), "uv add pandas");
    EXPECT_EQ(policy.installHintFor("pandas.io.json"), "uv add pandas");
}

// ─── Static Pre-Scan ───────────────────────────────────────────

TEST(PreScanTest, CleanSourcePasses) {
    ExecutionPolicy policy = makeDefaultPolicy();
    PreScanner scanner(policy);
    PreScanResult r = scanner.scan("def scrape(url):\n    return [{'ok': True}]\n");
    EXPECT_TRUE(r.passed);
    EXPECT_TRUE(r.matched.empty());
    EXPECT_TRUE(r.message.empty());
}

TEST(PreScanTest, DeniedTokenIsReported) {
    ExecutionPolicy policy = makeDefaultPolicy();
    PreScanner scanner(policy);
    PreScanResult r = scanner.scan("import subprocess\nsubprocess.run(['ls'])\n");
    EXPECT_FALSE(r.passed);
    EXPECT_EQ(r.matched, "subprocess");
    EXPECT_NE(r.message.find("subprocess"), std::string::npos);
}

TEST(PreScanTest, TokensInCommentsAndStringsCount) {
    ExecutionPolicy policy = makeDefaultPolicy();
    PreScanner scanner(policy);
    EXPECT_FALSE(scanner.scan("# never call eval(x)\n").passed);
    EXPECT_FALSE(scanner.scan("s = 'socket'\n").passed);
}

TEST(PreScanTest, FalsePositiveOnSubstring) {
    // "photos." contains "os."; the scan is literal.
    ExecutionPolicy policy = makeDefaultPolicy();
    PreScanResult r = PreScanner(policy).scan("photos.append(1)\n");
    EXPECT_FALSE(r.passed);
    EXPECT_EQ(r.matched, "os.");
}

TEST(PreScanTest, CaseSensitive) {
    ExecutionPolicy policy = makeDefaultPolicy();
    EXPECT_TRUE(PreScanner(policy).scan("SUBPROCESS = 1\n").passed);
}

TEST(PreScanTest, FirstMatchIsDeterministic) {
    ExecutionPolicy policy = makeDefaultPolicy();
    PreScanner scanner(policy);
    std::string source = "socket\nsubprocess\neval(1)\n";
    // Sorted order: "eval(" < "socket" < "subprocess".
    EXPECT_EQ(scanner.scan(source).matched, "eval(");
    std::vector<std::string> all = scanner.findAll(source);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0], "eval(");
    EXPECT_EQ(all[1], "socket");
    EXPECT_EQ(all[2], "subprocess");
}

TEST(PreScanTest, EmptyPolicyNeverMatches) {
    ExecutionPolicy policy;
    EXPECT_TRUE(PreScanner(policy).scan("exec('anything')").passed);
}
