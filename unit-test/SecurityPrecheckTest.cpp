#include "gtest/gtest.h"
#include "sandbox/language.hpp"
#include "sandbox/security.hpp"

using namespace std;
using namespace sandbox;

class SecurityPrecheckTest : public ::testing::Test {
protected:
    language_registry registry;
    security_precheck precheck{50000, 10};
};

TEST_F(SecurityPrecheckTest, CleanSource) {
    auto violations = precheck.check(R"(
a, b = map(int, input().split())
print(a + b)
)", registry.lookup("python"));
    EXPECT_TRUE(violations.empty());
}

TEST_F(SecurityPrecheckTest, DisallowedImport) {
    auto violations = precheck.check("import os\nprint(os.getcwd())", registry.lookup("python"));
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0].policy, security_policy::DISALLOWED_PATTERN);
    EXPECT_EQ(violations[0].message(), R"(disallowed-pattern: Potentially unsafe code detected: import\s+os)");
}

TEST_F(SecurityPrecheckTest, CaseInsensitive) {
    auto violations = precheck.check("IMPORT   SUBPROCESS", registry.lookup("python"));
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0].detail, R"(Potentially unsafe code detected: import\s+subprocess)");
}

TEST_F(SecurityPrecheckTest, PatternsArePerLanguage) {
    // System.exit 只在 Java 中被禁止
    EXPECT_TRUE(precheck.check("print('System.exit')", registry.lookup("python")).empty());
    EXPECT_EQ(precheck.check("class Main { void f() { System.exit(0); } }", registry.lookup("java")).size(), 1u);
    EXPECT_EQ(precheck.check("#include <cstdlib>\nint main() {}", registry.lookup("cpp")).size(), 1u);
    EXPECT_EQ(precheck.check("const cp = require('child_process');", registry.lookup("js")).size(), 1u);
}

TEST_F(SecurityPrecheckTest, SourceTooLarge) {
    security_precheck small(16, 10);
    auto violations = small.check("print('hello, world')", registry.lookup("python"));
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0].policy, security_policy::SOURCE_TOO_LARGE);
    EXPECT_EQ(violations[0].detail, "Code too long (21 bytes, limit 16) - potential resource abuse");
}

TEST_F(SecurityPrecheckTest, TooManyLoops) {
    string source;
    for (int i = 0; i < 11; ++i) source += "for i in range(1): pass\n";
    auto violations = precheck.check(source, registry.lookup("python"));
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0].policy, security_policy::TOO_MANY_LOOPS);
    EXPECT_EQ(violations[0].message(), "too-many-loops: Too many loops detected (11, limit 10) - potential infinite loop risk");
}

TEST_F(SecurityPrecheckTest, LoopKeywordsAreWholeWords) {
    string source;
    for (int i = 0; i < 20; ++i) source += "format_for_while = 1\n";
    EXPECT_TRUE(precheck.check(source, registry.lookup("python")).empty());

    string ten;
    for (int i = 0; i < 10; ++i) ten += "while False: pass\n";
    EXPECT_TRUE(precheck.check(ten, registry.lookup("python")).empty());
}

TEST_F(SecurityPrecheckTest, ReportsEveryViolation) {
    security_precheck strict(10, 0);
    auto violations = strict.check("import os\nimport sys\nfor x in []: pass", registry.lookup("python"));
    ASSERT_EQ(violations.size(), 4u);
    EXPECT_EQ(violations[0].policy, security_policy::DISALLOWED_PATTERN);
    EXPECT_EQ(violations[1].policy, security_policy::DISALLOWED_PATTERN);
    EXPECT_EQ(violations[2].policy, security_policy::SOURCE_TOO_LARGE);
    EXPECT_EQ(violations[3].policy, security_policy::TOO_MANY_LOOPS);
}

TEST_F(SecurityPrecheckTest, Deterministic) {
    string source = "import os\n" + string(60000, '#');
    auto &profile = registry.lookup("python");
    EXPECT_EQ(precheck.check(source, profile), precheck.check(source, profile));
}

TEST_F(SecurityPrecheckTest, LongWhitespaceRun) {
    auto violations = precheck.check("import" + string(40000, ' ') + "x", registry.lookup("python"));
    EXPECT_TRUE(violations.empty());

    violations = precheck.check("import" + string(40000, ' ') + "os", registry.lookup("python"));
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0].policy, security_policy::DISALLOWED_PATTERN);

    violations = precheck.check("require(" + string(200000, '\n') + "'fs')", registry.lookup("javascript"));
    ASSERT_EQ(violations.size(), 2u);
    EXPECT_EQ(violations[0].policy, security_policy::DISALLOWED_PATTERN);
    EXPECT_EQ(violations[1].policy, security_policy::SOURCE_TOO_LARGE);
}
