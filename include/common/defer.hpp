#pragma once

#include <utility>

namespace grader {

/**
 * @brief 作用域结束时执行给定函数
 * 用法：defer { cleanup(); };
 */
template <typename F>
struct deferred_action {
    explicit deferred_action(F &&f) : f(std::move(f)) {}
    deferred_action(const deferred_action &) = delete;
    deferred_action &operator=(const deferred_action &) = delete;

    ~deferred_action() {
        f();
    }

private:
    F f;
};

struct defer_helper {
    template <typename F>
    deferred_action<F> operator+(F &&f) {
        return deferred_action<F>(std::forward<F>(f));
    }
};

}  // namespace grader

#define GRADER_DEFER_CONCAT_IMPL(a, b) a##b
#define GRADER_DEFER_CONCAT(a, b) GRADER_DEFER_CONCAT_IMPL(a, b)
#define defer auto GRADER_DEFER_CONCAT(_defer_, __LINE__) = ::grader::defer_helper() + [&]()
