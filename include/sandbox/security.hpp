#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "sandbox/language.hpp"

namespace sandbox {

/**
 * @brief 安全检查的规则
 */
enum class security_policy {
    DISALLOWED_PATTERN,  // 源代码中出现了语言配置禁止的模式
    SOURCE_TOO_LARGE,    // 源代码过长
    TOO_MANY_LOOPS       // 循环关键字过多
};

/**
 * @brief 获得规则的名称，比如 "disallowed-pattern"
 */
const char *get_policy_name(security_policy policy);

/**
 * @brief 一条违反安全规则的记录
 */
struct violation {
    security_policy policy;

    /**
     * @brief 可读的描述，对于 DISALLOWED_PATTERN 包含被匹配的模式
     */
    std::string detail;

    /**
     * @brief 形如 "disallowed-pattern: Potentially unsafe code detected: import\s+os"
     */
    std::string message() const;

    bool operator==(const violation &other) const;
};

/**
 * @brief 在启动任何进程前对源代码进行的静态检查
 * 这只是基于模式匹配的启发式检查，并不是真正的隔离：没有使用命名空间、seccomp、cgroup 或者低权限用户，
 * 用户程序运行时拥有与执行引擎相同的权限。
 *
 * 检查是确定性的、无状态的：相同的源代码和语言总是得到相同的违规列表。
 */
struct security_precheck {
    /**
     * @param max_source_size 源代码的最大字节数
     * @param max_loop_count 允许出现的 for/while 关键字数量上限
     */
    security_precheck(std::size_t max_source_size, int max_loop_count);

    /**
     * @brief 检查源代码
     * 依次检查：
     * 1. 语言配置中的每一个禁止模式（忽略大小写）
     * 2. 源代码长度
     * 3. for/while 关键字的数量
     * @param source 源代码
     * @param profile 源代码的语言配置
     * @return 所有违反的规则，为空表示通过检查
     * @throw boost::regex_error 语言配置中存在不合法的正则表达式
     */
    std::vector<violation> check(const std::string &source, const language_profile &profile) const;

private:
    std::size_t max_source_size;
    int max_loop_count;
};

}  // namespace sandbox
