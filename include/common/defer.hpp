#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = ::funcjudge::scoped_guard() + [&]

namespace funcjudge {

/**
 * @brief 作用域结束时执行回调，用于关闭文件描述符、回收子进程等清理工作
 * 通过 defer { ... }; 语法使用
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace funcjudge
