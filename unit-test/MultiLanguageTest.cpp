#include <boost/algorithm/string/trim.hpp>
#include "gtest/gtest.h"
#include "sandbox/engine.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace sandbox;

class MultiLanguageTest : public ::testing::Test {
protected:
    static unique_ptr<execution_engine> engine;

    static void SetUpTestCase() {
        engine = make_unique<execution_engine>(test::make_test_config("multi_language"));
    }

    static void TearDownTestCase() {
        engine.reset();
    }

    // 程序应当把 stdin 原样输出到 stdout
    void check_echo(const string &lang, const string &source) {
        code_submission submission;
        submission.language = lang;
        submission.code = source;
        submission.input = "hello world";
        // JVM 启动时的常驻内存比较大
        submission.memory_limit_mb = 512;

        auto result = engine->execute(submission);
        EXPECT_TRUE(result.success) << result.error.value_or("") << endl
                                    << result.stderr;
        EXPECT_EQ(boost::algorithm::trim_copy(result.stdout), "hello world");
        EXPECT_FALSE(result.timeout);
        EXPECT_EQ(test::count_files(engine->get_config().workspace_root), 0);
    }
};

unique_ptr<execution_engine> MultiLanguageTest::engine;

TEST_F(MultiLanguageTest, CppTest) {
    if (!test::has_command("g++")) GTEST_SKIP() << "g++ is not available";
    check_echo("cpp", R"(
#include <iostream>
#include <string>
int main() {
    std::string line;
    std::getline(std::cin, line);
    std::cout << line << std::endl;
})");
}

TEST_F(MultiLanguageTest, Python3Test) {
    if (!test::has_command("python3")) GTEST_SKIP() << "python3 is not available";
    check_echo("python", R"(print(input()))");
}

TEST_F(MultiLanguageTest, JavaTest) {
    if (!test::has_command("java")) GTEST_SKIP() << "java is not available";
    check_echo("java", R"(
import java.util.Scanner;

public class Main {
    public static void main(String[] args) {
        Scanner scanner = new Scanner(System.in);
        System.out.println(scanner.nextLine());
    }
})");
}

TEST_F(MultiLanguageTest, JavaScriptTest) {
    if (!test::has_command("node")) GTEST_SKIP() << "node is not available";
    check_echo("js", R"(
let data = '';
process.stdin.on('data', chunk => data += chunk);
process.stdin.on('end', () => console.log(data));
)");
}
