#pragma once

#include <sys/types.h>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "sandbox/result.hpp"

namespace sandbox {

/**
 * @brief 表示一次进程运行请求
 */
struct process_request {
    /**
     * @brief 程序路径 (command[0]) 和参数，程序路径会在 PATH 中查找
     */
    std::vector<std::string> command;

    /**
     * @brief 写入程序 stdin 的数据，写完后关闭 stdin
     */
    std::string stdin_data;

    /**
     * @brief 时钟时间限制（秒）
     */
    int timeout_seconds = 10;

    /**
     * @brief 常驻内存限制（MB），小于等于 0 时只采样不限制
     */
    int memory_limit_mb = 0;

    /**
     * @brief 程序的工作路径，为空时继承当前进程的工作路径
     */
    std::filesystem::path working_directory;
};

/**
 * @brief 运行进程并监控资源
 * 这是整个执行引擎中唯一会阻塞等待进程的地方，等待时间总是受 timeout_seconds 限制。
 */
struct process_runner {
    virtual ~process_runner() = default;

    /**
     * @brief 运行程序直到结束、超时或者内存超限
     * 所有的失败情况都保存在返回值中，实现不允许抛出异常
     * @param request 运行请求
     * @return 规范化后的执行结果
     */
    virtual execution_result run(const process_request &request) = 0;
};

/**
 * @brief 基于 fork/exec 的进程运行器
 *
 * 每次运行有且仅有两个并发的活动：
 * 1. 调用线程：向子进程写入 stdin、读取 stdout/stderr，并等待子进程结束，等待时间受时间限制约束
 * 2. 内存监控线程：每隔 sample_interval 读取一次 /proc/<pid>/status 中的 VmRSS，记录峰值，
 *    超出内存限制时立即杀死子进程组
 *
 * 子进程结束、超时、内存超限三个事件中最先发生的事件决定执行结果。无论哪个事件先发生，
 * 运行器都会停止内存监控线程，杀死子进程组中残留的进程，并回收子进程，不会留下僵尸进程。
 *
 * 注意：构造运行器会使当前进程忽略 SIGPIPE，子进程提前关闭 stdin 时写入会返回 EPIPE 而不是终止引擎。
 */
struct posix_process_runner : public process_runner {
    /**
     * @param sample_interval 内存监控的采样间隔
     * @param output_limit stdout、stderr 各自最多保留的字节数
     */
    posix_process_runner(std::chrono::milliseconds sample_interval, std::size_t output_limit);

    execution_result run(const process_request &request) override;

private:
    std::chrono::milliseconds sample_interval;
    std::size_t output_limit;

    execution_result run_impl(const process_request &request);
};

/**
 * @brief 读取进程当前的常驻内存
 * @param pid 进程 id
 * @return 常驻内存（KB），进程不存在或者已经结束（僵尸进程）时返回 -1
 */
long sample_resident_memory(pid_t pid);

}  // namespace sandbox
