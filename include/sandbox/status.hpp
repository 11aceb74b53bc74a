#pragma once

#include <string>

namespace sandbox {

/**
 * @brief 表示一次执行的失败类型
 * 所有的失败类型都作为数据保存在执行结果中返回给调用者，执行引擎不会因为这些失败抛出异常。
 * 调用者可以据此区分"用户程序有问题"（SECURITY_REJECTED、COMPILE_ERROR、RUNTIME_TIMEOUT、
 * MEMORY_LIMIT_EXCEEDED、NON_ZERO_EXIT）和"平台自身出错"（PROCESS_SPAWN_ERROR）。
 */
enum class error_kind {
    /**
     * @brief 程序正常运行结束且返回值为 0
     */
    NONE = 0,

    /**
     * @brief 请求的语言不在语言表中
     */
    UNSUPPORTED_LANGUAGE = 1,

    /**
     * @brief 源代码没有通过安全检查，没有启动任何进程
     */
    SECURITY_REJECTED = 2,

    /**
     * @brief 编译失败或编译超时，运行阶段被跳过
     */
    COMPILE_ERROR = 3,

    /**
     * @brief 程序运行时间超出限制，已被强制终止
     */
    RUNTIME_TIMEOUT = 4,

    /**
     * @brief 内存监控发现程序的常驻内存超出限制，已被强制终止
     */
    MEMORY_LIMIT_EXCEEDED = 5,

    /**
     * @brief 无法启动进程（fork/pipe/exec 失败），或者引擎内部错误
     */
    PROCESS_SPAWN_ERROR = 6,

    /**
     * @brief 程序运行结束，但返回值不为 0 或者因为信号崩溃
     * 这不是平台错误，而是程序自身的失败
     */
    NON_ZERO_EXIT = 7
};

/**
 * @brief 获得失败类型的可读名称，比如 "Memory Limit Exceeded"
 */
const char *get_display_message(error_kind kind);

/**
 * @brief 获得失败类型在 JSON 中的标识，比如 "memory_limit_exceeded"
 */
const char *get_identifier(error_kind kind);

/**
 * @brief 根据 JSON 中的标识获得失败类型
 * @throw std::invalid_argument 标识不存在
 */
error_kind parse_error_kind(const std::string &identifier);

}  // namespace sandbox
