#pragma once

#include <map>
#include <string>
#include <variant>
#include <vector>

/**
 * 这个头文件包含语言表
 * 包含：
 * 1. language 枚举（所有支持的语言，集合是封闭的）
 * 2. language_profile 类（一个语言的扩展名、编译运行命令模板、默认时限、禁止出现的代码模式）
 * 3. language_registry 类（启动时构造一次的只读语言表）
 *
 * 命令模板中可以使用以下占位符：
 * {file}       源代码文件的绝对路径
 * {executable} 编译产物的绝对路径
 */
namespace sandbox {

/**
 * @brief 支持的语言
 * 新增语言时需要同时修改 make_profile，编译器会检查 switch 是否覆盖了所有的语言
 */
enum class language {
    PYTHON,
    JAVASCRIPT,
    JAVA,
    CPP
};

/**
 * @brief 解释执行的语言：直接运行源代码文件
 */
struct interpreted {
    /**
     * @brief 运行命令模板，比如 ["python3", "-u", "{file}"]
     */
    std::vector<std::string> run_command;
};

/**
 * @brief 编译执行的语言：先编译出可执行文件，再运行可执行文件
 */
struct compiled {
    /**
     * @brief 编译命令模板，比如 ["g++", "-o", "{executable}", "{file}", "-std=c++17"]
     */
    std::vector<std::string> compile_command;

    /**
     * @brief 运行命令模板，比如 ["{executable}"]
     */
    std::vector<std::string> run_command;
};

/**
 * @brief 语言的构建方式
 */
using build_strategy = std::variant<interpreted, compiled>;

/**
 * @brief 一个语言的全部配置
 */
struct language_profile {
    language id;

    /**
     * @brief 语言的规范名称，同时也是语言表的主键，比如 python
     */
    std::string key;

    /**
     * @brief 语言表也接受的别名，比如 py、python3
     */
    std::vector<std::string> aliases;

    /**
     * @brief 展示给用户的名称，比如 Python 3
     */
    std::string name;

    /**
     * @brief 源代码文件的扩展名，包括点号，比如 .py
     */
    std::string extension;

    build_strategy strategy;

    /**
     * @brief 提交未指定时间限制时使用的时间限制（秒）
     */
    int timeout;

    /**
     * @brief 源代码和程序输出的编码
     */
    std::string encoding;

    /**
     * @brief 禁止出现在源代码中的模式（ECMAScript 正则表达式，忽略大小写匹配）
     */
    std::vector<std::string> disallowed_patterns;

    /**
     * @brief 是否需要编译步骤
     */
    bool is_compiled() const;
};

/**
 * @brief 对外展示的语言摘要
 */
struct language_summary {
    std::string language;
    std::string name;
    std::string extension;
    int timeout;
    bool compiled;
};

/**
 * @brief 构造指定语言的内置配置
 */
language_profile make_profile(language id);

/**
 * @brief 展开命令模板中的占位符
 * @param command_template 命令模板，每个元素是一个参数
 * @param placeholders 占位符名（不含花括号）到替换值的映射
 * @return 展开后的命令
 */
std::vector<std::string> expand_command(const std::vector<std::string> &command_template,
                                        const std::map<std::string, std::string> &placeholders);

/**
 * @brief 只读的语言表
 * 启动时构造一次，以 const 引用注入到需要的组件中。所有的成员函数都没有副作用，可以并发调用。
 */
struct language_registry {
    /**
     * @brief 使用所有的内置语言构造语言表
     */
    language_registry();

    /**
     * @brief 使用给定的语言配置构造语言表
     * @throw std::invalid_argument 存在重复的主键或别名
     */
    explicit language_registry(std::vector<language_profile> profiles);

    /**
     * @brief 根据语言名称（或别名，不区分大小写）查找语言配置
     * @throw unsupported_language 语言不存在
     */
    const language_profile &lookup(const std::string &key) const;

    /**
     * @brief 根据语言名称查找语言配置
     * @return 语言配置，不存在时返回 nullptr
     */
    const language_profile *find(const std::string &key) const;

    /**
     * @brief 按照语言表的顺序列出所有语言的摘要
     */
    std::vector<language_summary> summaries() const;

    const std::vector<language_profile> &profiles() const;

private:
    std::vector<language_profile> table;

    // 规范化（小写）后的主键和别名到 table 下标的映射
    std::map<std::string, std::size_t> index;
};

}  // namespace sandbox
