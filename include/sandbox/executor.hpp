#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "config.hpp"
#include "sandbox/compiler.hpp"
#include "sandbox/language.hpp"
#include "sandbox/process.hpp"
#include "sandbox/result.hpp"
#include "sandbox/security.hpp"
#include "sandbox/submission.hpp"
#include "sandbox/workspace.hpp"

namespace sandbox {

/**
 * @brief 已经准备好运行的程序
 * 持有工作区，析构时删除源代码和编译产物。
 */
struct prepared_program {
    const language_profile *profile = nullptr;

    workspace ws;

    /**
     * @brief 展开占位符后的运行命令
     */
    std::vector<std::string> run_command;

    /**
     * @brief 编译耗时（毫秒），解释型语言为 0
     */
    long compile_time_ms = 0;
};

/**
 * @brief 执行一次提交的完整流程
 *
 * 一次执行的状态转移如下：
 * Created -> SecurityCheckFailed
 * Created -> Compiling -> CompileFailed
 * Created -> Compiling/Skipped -> Running -> Completed | TimedOut | MemoryExceeded | RuntimeError
 * 所有的终止状态最后都会删除工作区。
 *
 * 所有组件以引用注入，生命周期必须长于 execution_orchestrator。
 */
struct execution_orchestrator {
    execution_orchestrator(const engine_config &config,
                           const language_registry &registry,
                           const security_precheck &precheck,
                           workspace_manager &workspaces,
                           process_runner &runner,
                           compiler &builder);

    /**
     * @brief 执行一次提交
     * 语言不存在、安全检查失败、编译失败、运行失败以及内部错误都表示为执行结果，不会抛出异常。
     * 返回前工作区已经被删除。
     */
    execution_result execute(const code_submission &submission) noexcept;

    /**
     * @brief 查找语言、安全检查、创建工作区并编译
     * @return 准备好运行的程序，或者准备失败时的执行结果
     * @throw std::filesystem::filesystem_error, std::system_error 无法创建工作区
     */
    std::variant<prepared_program, execution_result> prepare(const std::string &code, const std::string &language);

    /**
     * @brief 运行一个已经准备好的程序
     * 可以对同一个程序调用多次，每次使用不同的输入。
     */
    execution_result run(const prepared_program &program, const std::string &input, int timeout_seconds, int memory_limit_mb);

    /**
     * @brief 提交未指定时间限制时使用语言的默认时间限制
     */
    int resolve_timeout(const language_profile &profile, const std::optional<int> &timeout_seconds) const;

    /**
     * @brief 提交未指定内存限制或者内存限制不为正数时使用配置中的默认内存限制
     */
    int resolve_memory_limit(const std::optional<int> &memory_limit_mb) const;

private:
    const engine_config &config;
    const language_registry &registry;
    const security_precheck &precheck;
    workspace_manager &workspaces;
    process_runner &runner;
    compiler &builder;
};

/**
 * @brief 将内部错误转换为执行结果
 * 转换过程中内存不足时返回 out_of_memory_failure()
 */
execution_result internal_failure(const std::exception &ex) noexcept;

/**
 * @brief 内存不足时的执行结果，构造过程不分配内存
 */
execution_result out_of_memory_failure() noexcept;

}  // namespace sandbox
