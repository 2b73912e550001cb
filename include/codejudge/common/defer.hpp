#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = codejudge::scoped_guard() + [&]

namespace codejudge {

/**
 * @brief 作用域结束时执行回调
 * 一般通过 defer 宏使用，保证关闭文件描述符、杀死进程组、删除目录在任何退出路径上都会执行
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace codejudge
