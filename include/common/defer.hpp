#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)

/**
 * @brief 在当前作用域结束时执行代码块
 * defer { curl_easy_cleanup(curl); };
 */
#define defer auto DEFER_0(_deferred_action) = ::arbiter::scoped_guard() + [&]

namespace arbiter {

struct scoped_guard {
    std::function<void()> action;

    scoped_guard();
    explicit scoped_guard(const std::function<void()> &action);
    scoped_guard(scoped_guard &&other) noexcept;
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &action) const;
};

}  // namespace arbiter
