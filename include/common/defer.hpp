#pragma once

#include <functional>

#define SANDBOX_DEFER_1(x, y) x##y
#define SANDBOX_DEFER_2(x, y) SANDBOX_DEFER_1(x, y)
#define SANDBOX_DEFER_0(x) SANDBOX_DEFER_2(x, __COUNTER__)
#define defer auto SANDBOX_DEFER_0(_defered_option) = sandbox::scoped_guard() + [&]

namespace sandbox {

/**
 * @brief 在作用域结束时执行回调
 * 配合 defer 宏使用，保证无论函数从哪个分支返回（包括抛出异常）都会执行清理代码：
 * @code{.cpp}
 *     int fd = open(...);
 *     defer { close(fd); };
 * @endcode
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace sandbox
