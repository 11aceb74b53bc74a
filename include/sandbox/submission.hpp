#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "sandbox/result.hpp"

/**
 * 这个头文件包含执行请求
 * 包含：
 * 1. code_submission 类（表示一次执行请求）
 * 2. test_case 类（表示一个测试点）
 * 3. test_result 类（表示一个测试点的执行结果）
 */
namespace sandbox {

/**
 * @brief 表示一次执行请求
 * 每个请求构造一次，之后不再修改
 */
struct code_submission {
    /**
     * @brief 用户提交的源代码
     */
    std::string code;

    /**
     * @brief 语言名称或者别名，比如 python、py、cpp
     */
    std::string language;

    /**
     * @brief 喂给程序 stdin 的输入，为空时程序的 stdin 立即遇到 EOF
     */
    std::optional<std::string> input;

    /**
     * @brief 运行时间限制（秒），为空时使用语言的默认时间限制
     */
    std::optional<int> timeout_seconds;

    /**
     * @brief 内存限制（MB），为空时使用配置中的默认内存限制
     */
    std::optional<int> memory_limit_mb;
};

/**
 * @brief 表示一个测试点：一组输入和可选的期望输出
 */
struct test_case {
    std::string name;

    std::string input;

    /**
     * @brief 期望输出，为空时不比较输出
     */
    std::optional<std::string> expected_output;

    std::optional<std::string> description;
};

/**
 * @brief 一个测试点的执行结果
 */
struct test_result {
    test_case test;

    execution_result result;

    /**
     * @brief 去除首尾空白后的 stdout 是否与期望输出一致
     * 只有在测试点提供了期望输出时才会计算
     */
    std::optional<bool> output_match;

    /**
     * @brief 程序执行成功，且输出与期望一致（或者没有期望输出）
     */
    bool passed = false;
};

/**
 * @brief 比较程序输出与期望输出，忽略首尾空白字符
 */
bool output_matches(const std::string &actual, const std::string &expected);

/**
 * @brief 读取执行请求
 * 输入可以通过 input 指定，也可以通过 test_inputs 数组指定（取第一个元素）
 */
void from_json(const nlohmann::json &j, code_submission &submission);
void to_json(nlohmann::json &j, const code_submission &submission);

void from_json(const nlohmann::json &j, test_case &testcase);
void to_json(nlohmann::json &j, const test_case &testcase);

void to_json(nlohmann::json &j, const test_result &result);

}  // namespace sandbox
