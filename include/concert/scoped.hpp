#pragma once

#include "interrupt_mask.hpp"

#include <type_traits>
#include <utility>

namespace concert {

namespace detail {

//! Calls the given functor (masked) when going out of scope
template <typename F>
class scope_exit {
public:
    explicit scope_exit(F& f)
        : fun_(f) {}
    ~scope_exit() {
        interrupt_mask mask;
        fun_();
    }

    scope_exit(const scope_exit&) = delete;
    scope_exit& operator=(const scope_exit&) = delete;

private:
    F& fun_;
};

} // namespace detail

inline namespace v1 {

/**
 * @brief      Executes `body`, and then `cleanup`, no matter how `body` exits.
 *
 * @param      body     The work to be done
 * @param      cleanup  The cleanup work; must not throw
 *
 * @return     The value returned by `body`
 *
 * The cleanup runs with interruptions masked, so it is executed completely even if the task is
 * cancelled (a cancelled task gets to the cleanup by unwinding from `body`).
 */
template <typename Body, typename Cleanup>
auto finally(Body&& body, Cleanup&& cleanup) -> decltype(body()) {
    detail::scope_exit<std::remove_reference_t<Cleanup>> guard{cleanup};
    return body();
}

/**
 * @brief      Acquires a resource, uses it, and releases it on every exit path.
 *
 * @param      acquire  Functor that acquires the resource and returns it
 * @param      release  Functor that releases the resource; takes the resource; must not throw
 * @param      body     Functor that uses the resource; takes the resource
 *
 * @return     The value returned by `body`
 *
 * Acquire and release run with interruptions masked; once the acquire completed, the release is
 * guaranteed to be executed, including when the task is cancelled while executing `body`.
 */
template <typename Acquire, typename Release, typename Body>
auto bracket(Acquire&& acquire, Release&& release, Body&& body)
        -> decltype(body(std::declval<decltype(acquire())&>())) {
    auto resource = [&] {
        interrupt_mask mask;
        return acquire();
    }();
    auto do_release = [&] { release(resource); };
    detail::scope_exit<decltype(do_release)> guard{do_release};
    return body(resource);
}

/**
 * @brief      Like bracket(), but for actions that don't produce/need a resource.
 *
 * @param      acquire  The action that takes the resource (e.g., increments a counter)
 * @param      release  The action that gives back the resource; must not throw
 * @param      body     The work to be done in between
 */
template <typename Acquire, typename Release, typename Body>
auto bracket_(Acquire&& acquire, Release&& release, Body&& body) -> decltype(body()) {
    {
        interrupt_mask mask;
        acquire();
    }
    detail::scope_exit<std::remove_reference_t<Release>> guard{release};
    return body();
}

} // namespace v1
} // namespace concert
