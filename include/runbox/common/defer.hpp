#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)

/**
 * @brief Runs the following block when leaving the enclosing scope,
 * whether normally or by an exception.
 *
 *     defer { close(fd); };
 */
#define defer auto DEFER_0(_deferred_guard) = runbox::scoped_guard() + [&]

namespace runbox {

struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace runbox
