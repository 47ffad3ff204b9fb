#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)

/**
 * @brief 在当前作用域结束时执行一段代码
 * 用于保证临时目录、容器等资源在任何退出路径（包括异常）下都会被回收。
 * @code{.cpp}
 *     fs::create_directories(dir);
 *     defer { fs::remove_all(dir, ec); };
 * @endcode
 */
#define defer auto DEFER_0(_defered_option) = coderun::scoped_guard() + [&]

namespace coderun {

struct scoped_guard {
    std::function<void()> f;

    scoped_guard();
    explicit scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other) noexcept;
    scoped_guard(const scoped_guard &) = delete;

    /**
     * @brief 执行回收函数
     * 析构函数中不能抛出异常，因此回收函数抛出的异常会被记录到日志中
     */
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace coderun
