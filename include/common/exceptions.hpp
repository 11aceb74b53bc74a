#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace sandbox {

struct sandbox_exception : std::exception {
    explicit sandbox_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const sandbox_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示执行引擎的内部错误
 * 一般是引擎自身的缺陷或者宿主机环境问题（比如临时目录不可写），
 * 与用户提交的程序本身无关
 */
struct internal_error : public sandbox_exception {
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示请求了语言表中不存在的语言
 */
struct unsupported_language : public sandbox_exception {
    /**
     * @brief 请求的语言名称（未经规范化）
     */
    const std::string language;

    explicit unsupported_language(const std::string &language);
};

}  // namespace sandbox
