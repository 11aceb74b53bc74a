#pragma once

#include "sandbox/language.hpp"
#include "sandbox/process.hpp"
#include "sandbox/result.hpp"
#include "sandbox/workspace.hpp"

namespace sandbox {

/**
 * @brief 编译工作区中的源代码
 * 编译器进程同样通过 process_runner 启动，因此也受内存监控和输出限制约束，
 * 但时间限制使用独立的 compile_time_limit 而不是用户的运行时间限制。
 */
struct compiler {
    /**
     * @param runner 用来启动编译器进程的运行器，生命周期必须长于 compiler
     * @param compile_time_limit 编译时间上限（秒）
     */
    compiler(process_runner &runner, int compile_time_limit);

    /**
     * @brief 编译源代码，产物写入 ws.executable_file()
     * 编译器的工作路径为工作区文件夹。
     * @param ws 已经写入源代码的工作区
     * @param profile 源代码的语言，必须是编译型语言
     * @return 编译结果，编译失败不会抛出异常
     * @throw std::invalid_argument profile 不是编译型语言
     */
    compile_result compile(const workspace &ws, const language_profile &profile);

private:
    process_runner &runner;
    int compile_time_limit;
};

}  // namespace sandbox
