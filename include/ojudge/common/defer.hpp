#pragma once

#include <functional>

#define OJUDGE_DEFER_1(x, y) x##y
#define OJUDGE_DEFER_2(x, y) OJUDGE_DEFER_1(x, y)
#define OJUDGE_DEFER_0(x) OJUDGE_DEFER_2(x, __COUNTER__)
#define defer auto OJUDGE_DEFER_0(_defered_option) = ojudge::scoped_guard() + [&]

namespace ojudge {

/**
 * @brief 在离开作用域时执行 f
 * 配合 defer 宏使用：defer { close(fd); };
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace ojudge
