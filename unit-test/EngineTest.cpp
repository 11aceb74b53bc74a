#include <atomic>
#include <thread>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/engine.hpp"
#include "test/environment.hpp"
#include "test/mock_process_runner.hpp"

using namespace std;
using namespace sandbox;
using namespace testing;
using namespace nlohmann;

TEST(EngineTest, ListSupportedLanguages) {
    execution_engine engine(test::make_test_config("engine_languages"));
    json j = engine.list_supported_languages();
    ASSERT_EQ(j.size(), 4u);
    EXPECT_EQ(j[0], json::parse(R"({"language": "python", "name": "Python 3", "extension": ".py", "timeout": 10, "compiled": false})"));
    EXPECT_EQ(j[3]["language"], "cpp");
    EXPECT_EQ(j[3]["compiled"], true);
}

TEST(EngineTest, InvalidConfig) {
    auto config = test::make_test_config("engine_invalid");
    config.sample_interval = 0;
    EXPECT_THROW(execution_engine engine(config), invalid_argument);
}

TEST(EngineTest, SubmissionFromJson) {
    auto submission = json::parse(R"json({"code": "print(1)", "language": "py", "test_inputs": ["3 4", "5 6"], "timeout_seconds": 2})json").get<code_submission>();
    EXPECT_EQ(submission.code, "print(1)");
    EXPECT_EQ(submission.language, "py");
    EXPECT_EQ(submission.input.value_or(""), "3 4");
    EXPECT_EQ(submission.timeout_seconds.value_or(0), 2);
    EXPECT_FALSE(submission.memory_limit_mb);

    submission = json::parse(R"({"code": "", "language": "cpp", "input": "direct", "test_inputs": ["ignored"], "memory_limit_mb": null})").get<code_submission>();
    EXPECT_EQ(submission.input.value_or(""), "direct");
    EXPECT_FALSE(submission.memory_limit_mb);

    json j = submission;
    EXPECT_EQ(j["language"], "cpp");
    EXPECT_EQ(j["input"], "direct");
    EXPECT_TRUE(j["timeout_seconds"].is_null());
    EXPECT_TRUE(j["memory_limit_mb"].is_null());
    EXPECT_EQ(j.count("test_inputs"), 0u);

    EXPECT_THROW(json::parse(R"({"language": "cpp"})").get<code_submission>(), json::exception);
}

TEST(EngineTest, ResultToJson) {
    auto result = execution_result::failure(error_kind::SECURITY_REJECTED, "security check failed: x", "Security check failed");
    json j = result;
    EXPECT_EQ(j["success"], false);
    EXPECT_EQ(j["return_code"], -1);
    EXPECT_EQ(j["stderr"], "Security check failed");
    EXPECT_EQ(j["error"], "security check failed: x");
    EXPECT_EQ(j["error_kind"], "security_rejected");
    EXPECT_EQ(j["execution_time_ms"], 0);
    EXPECT_EQ(j["memory_usage_mb"], 0.0);
    EXPECT_EQ(j["timeout"], false);

    execution_result ok;
    ok.success = true;
    ok.exit_code = 0;
    ok.stdout = "7\n";
    ok.peak_memory_mb = 9.87654;
    j = ok;
    EXPECT_TRUE(j["error"].is_null());
    EXPECT_EQ(j["error_kind"], "none");
    EXPECT_DOUBLE_EQ(j["memory_usage_mb"].get<double>(), 9.88);
    EXPECT_EQ(j.get<execution_result>().stdout, "7\n");
}

TEST(EngineTest, TestResultToJson) {
    test_result r;
    r.test.name = "case";
    r.test.input = "1";
    r.result.success = true;
    r.passed = true;
    json j = r;
    EXPECT_EQ(j["test_case"]["name"], "case");
    EXPECT_TRUE(j["test_case"]["expected_output"].is_null());
    EXPECT_TRUE(j["output_match"].is_null());
    EXPECT_EQ(j["passed"], true);
    EXPECT_EQ(j["result"]["success"], true);

    auto testcase = json::parse(R"({"name": "n", "input": "i", "expected_output": "o"})").get<test_case>();
    EXPECT_EQ(testcase.expected_output.value_or(""), "o");
    EXPECT_FALSE(testcase.description);
}

TEST(EngineTest, AdmissionLimit) {
    auto config = test::make_test_config("engine_admission");
    config.max_concurrent_executions = 2;
    auto runner = make_unique<NiceMock<mock::process_runner>>();
    auto &mock_runner = *runner;

    atomic<int> running(0), peak(0);
    ON_CALL(mock_runner, run(_)).WillByDefault(Invoke([&](const process_request &) {
        int now = ++running;
        int observed = peak.load();
        while (now > observed && !peak.compare_exchange_weak(observed, now)) {}
        this_thread::sleep_for(100ms);
        --running;
        execution_result result;
        result.success = true;
        result.exit_code = 0;
        return result;
    }));

    execution_engine engine(config, move(runner));
    code_submission submission;
    submission.code = "print(1)";
    submission.language = "python";

    vector<thread> threads;
    atomic<int> succeeded(0);
    for (int i = 0; i < 6; ++i)
        threads.emplace_back([&] {
            if (engine.execute(submission).success) ++succeeded;
        });
    for (auto &th : threads) th.join();

    EXPECT_EQ(succeeded.load(), 6);
    EXPECT_LE(peak.load(), 2);
    EXPECT_GE(peak.load(), 1);
    EXPECT_EQ(test::count_files(config.workspace_root), 0);
}

TEST(EngineTest, ConcurrentExecutions) {
    if (!test::has_command("python3")) GTEST_SKIP() << "python3 is not available";

    execution_engine engine(test::make_test_config("engine_concurrent"));
    vector<thread> threads;
    vector<execution_result> results(6);
    for (int i = 0; i < 6; ++i)
        threads.emplace_back([&, i] {
            code_submission submission;
            submission.code = "print(int(input()) * 2)";
            submission.language = "python";
            submission.input = to_string(i);
            results[i] = engine.execute(submission);
        });
    for (auto &th : threads) th.join();

    for (int i = 0; i < 6; ++i) {
        EXPECT_TRUE(results[i].success) << results[i].stderr;
        EXPECT_EQ(results[i].stdout, to_string(i * 2) + "\n");
    }
    EXPECT_EQ(test::count_files(engine.get_config().workspace_root), 0);
}

TEST(EngineTest, RunTests) {
    if (!test::has_command("python3")) GTEST_SKIP() << "python3 is not available";

    execution_engine engine(test::make_test_config("engine_tests"));
    test_case one;
    one.name = "one";
    one.input = "hello";
    one.expected_output = "hello";
    auto results = engine.run_tests("print(input())", "python", {one, one}, 5);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].passed);
    EXPECT_TRUE(results[1].passed);
}
