#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/compiler.hpp"
#include "test/environment.hpp"
#include "test/mock_process_runner.hpp"

using namespace std;
using namespace std::filesystem;
using namespace sandbox;
using namespace testing;

class CompilerTest : public ::testing::Test {
protected:
    language_registry registry;
    engine_config config = test::make_test_config("compiler");
    workspace_manager manager{config.workspace_root};
    NiceMock<mock::process_runner> runner;

    static language_profile custom_compiled(const vector<string> &compile_command) {
        language_profile profile = make_profile(language::CPP);
        profile.strategy = compiled{compile_command, {"{executable}"}};
        return profile;
    }
};

TEST_F(CompilerTest, CompileRequest) {
    compiler builder(runner, 7);
    auto &profile = registry.lookup("cpp");
    workspace ws = manager.acquire(profile, "int main() {}");

    process_request captured;
    execution_result fake;
    fake.success = true;
    fake.exit_code = 0;
    fake.execution_time_ms = 42;
    EXPECT_CALL(runner, run(_)).WillOnce(DoAll(SaveArg<0>(&captured), Return(fake)));

    auto result = builder.compile(ws, profile);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.compile_time_ms, 42);
    EXPECT_EQ(captured.timeout_seconds, 7);
    EXPECT_EQ(captured.working_directory.string(), ws.dir().string());
    EXPECT_EQ(captured.command, (vector<string>{"g++", "-o", ws.executable_file().string(), ws.source_file().string(), "-std=c++17"}));
}

TEST_F(CompilerTest, InterpretedLanguageHasNoCompileStep) {
    compiler builder(runner, 30);
    auto &profile = registry.lookup("python");
    workspace ws = manager.acquire(profile, "print(1)");
    EXPECT_CALL(runner, run(_)).Times(0);
    EXPECT_THROW(builder.compile(ws, profile), invalid_argument);
}

TEST_F(CompilerTest, CompileSuccess) {
    if (!test::has_command("g++")) GTEST_SKIP() << "g++ is not available";

    compiler builder(runner, 30);
    auto &profile = registry.lookup("cpp");
    workspace ws = manager.acquire(profile, R"(
#include <iostream>
int main() { std::cout << "hello" << std::endl; })");

    auto result = builder.compile(ws, profile);
    EXPECT_TRUE(result.success) << result.diagnostics();
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_GT(result.compile_time_ms, 0);
    EXPECT_TRUE(is_regular_file(ws.executable_file()));
}

TEST_F(CompilerTest, CompileError) {
    if (!test::has_command("g++")) GTEST_SKIP() << "g++ is not available";

    compiler builder(runner, 30);
    auto &profile = registry.lookup("cpp");
    workspace ws = manager.acquire(profile, "int main() { return undeclared_name; }");

    auto result = builder.compile(ws, profile);
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.spawn_failed);
    EXPECT_NE(result.exit_code, 0);
    EXPECT_THAT(result.diagnostics(), HasSubstr("undeclared_name"));
    EXPECT_FALSE(exists(ws.executable_file()));
}

TEST_F(CompilerTest, CompilerNotFound) {
    compiler builder(runner, 30);
    auto profile = custom_compiled({"/nonexistent/cc", "{file}"});
    workspace ws = manager.acquire(profile, "int main() {}");

    auto result = builder.compile(ws, profile);
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.spawn_failed);
}

TEST_F(CompilerTest, CompileTimeLimit) {
    compiler builder(runner, 1);
    auto profile = custom_compiled({"sleep", "5"});
    workspace ws = manager.acquire(profile, "int main() {}");

    auto result = builder.compile(ws, profile);
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.timeout);
    EXPECT_FALSE(result.spawn_failed);
    EXPECT_THAT(result.diagnostics(), HasSubstr("Compilation timed out after 1s"));
    EXPECT_LT(result.compile_time_ms, 3000);
}
