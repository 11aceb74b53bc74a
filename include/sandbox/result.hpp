#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "sandbox/status.hpp"

namespace sandbox {

/**
 * @brief 一次执行的结果
 * 每一次执行尝试都会产生一个执行结果，包括没有启动任何进程的执行（比如没有通过安全检查），
 * 此时所有的时间和内存字段均为 0。
 */
struct execution_result {
    /**
     * @brief 程序是否正常结束且返回值为 0
     */
    bool success = false;

    std::string stdout;

    std::string stderr;

    /**
     * @brief 程序的返回值
     * 被信号终止时为 128 + 信号编号；超时、内存超限、无法启动时为 -1
     */
    int exit_code = -1;

    /**
     * @brief 运行阶段的时钟时间（毫秒），不包括编译时间
     */
    long execution_time_ms = 0;

    /**
     * @brief 编译阶段的时钟时间（毫秒），没有编译步骤时为 0
     */
    long compile_time_ms = 0;

    /**
     * @brief 内存监控观察到的最大常驻内存（MB）
     */
    double peak_memory_mb = 0;

    /**
     * @brief 程序是否因为超时被终止
     */
    bool timeout = false;

    /**
     * @brief stdout 或 stderr 是否因为超出输出限制被截断
     */
    bool output_truncated = false;

    error_kind kind = error_kind::NONE;

    /**
     * @brief 失败原因的描述，成功时为空
     */
    std::optional<std::string> error;

    /**
     * @brief 构造一个没有启动进程的失败结果
     * @param kind 失败类型
     * @param error 失败原因
     * @param stderr_text 展示给用户的错误输出
     */
    static execution_result failure(error_kind kind, const std::string &error, const std::string &stderr_text = "");
};

/**
 * @brief 编译的结果
 */
struct compile_result {
    bool success = false;

    std::string stdout;

    std::string stderr;

    int exit_code = -1;

    long compile_time_ms = 0;

    /**
     * @brief 编译是否因为超出编译时间上限被终止
     */
    bool timeout = false;

    /**
     * @brief 编译器是否无法启动（比如编译器不存在），这属于平台错误而不是编译错误
     */
    bool spawn_failed = false;

    /**
     * @brief 编译器的诊断信息，优先使用 stderr
     */
    std::string diagnostics() const;
};

void to_json(nlohmann::json &j, const execution_result &result);
void from_json(const nlohmann::json &j, execution_result &result);

}  // namespace sandbox
