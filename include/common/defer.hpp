#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = ::grader::scoped_guard() + [&]

namespace grader {

/**
 * @brief 作用域结束时执行回调
 * 配合 defer 宏使用，用于清理沙箱目录、归还并发配额等
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other) noexcept;
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;

    /**
     * @brief 取消回调，析构时不再执行
     */
    void dismiss();
};

}  // namespace grader
