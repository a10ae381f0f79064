#pragma once

#include <utility>

#define CPJUDGE_DEFER_1(x, y) x##y
#define CPJUDGE_DEFER_2(x, y) CPJUDGE_DEFER_1(x, y)
#define CPJUDGE_DEFER_0(x) CPJUDGE_DEFER_2(x, __COUNTER__)

/**
 * 在作用域结束时执行一段代码，按声明的逆序执行：
 * int fd = open(...);
 * defer { close(fd); };
 */
#define defer auto CPJUDGE_DEFER_0(_deferred_) = cpjudge::scoped_guard_tag() + [&]()

namespace cpjudge {

template <typename F>
struct scoped_guard {
    explicit scoped_guard(F f) : f(std::move(f)) {}
    scoped_guard(const scoped_guard &) = delete;
    scoped_guard &operator=(const scoped_guard &) = delete;
    ~scoped_guard() { f(); }

private:
    F f;
};

struct scoped_guard_tag {};

template <typename F>
scoped_guard<F> operator+(scoped_guard_tag, F f) {
    return scoped_guard<F>(std::move(f));
}

}  // namespace cpjudge
