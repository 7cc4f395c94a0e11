#pragma once

#include "detail/conc_nodes.hpp"
#include "task_handle.hpp"

#include <functional>
#include <memory>
#include <tuple>
#include <type_traits>
#include <utility>

namespace concert {

inline namespace v1 {
template <typename T>
class conc;
} // namespace v1

namespace detail {
//! Gives access to the nodes of conc values
struct conc_access {
    template <typename T>
    static const node_ptr<T>& node(const conc<T>& c) {
        return c.node_;
    }
    template <typename T>
    static conc<T> make(node_ptr<T> node) {
        return conc<T>{std::move(node)};
    }
};
} // namespace detail

inline namespace v1 {

/**
 * @brief      Description of a computation made of concurrently executing tasks.
 *
 * A conc value is a tree whose leaves are units of work, and whose inner nodes combine the outcomes
 * of their children in one of two ways:
 *  - AND-combination (conc_zip(), then(), before(), conc_all()): the children run concurrently and
 *    all need to succeed; the first failure (in time) cancels everything else and is reported.
 *  - OR-combination (conc_race(), `operator|`, conc_any()): the children race; the first one to
 *    succeed wins, and the others are cancelled. Failing children are just eliminated from the
 *    race; the race fails only if all its children fail.
 *
 * Besides leaves, a tree can contain pure values (available without spawning anything) and the
 * empty alternative, which always fails and is the identity element of the OR-combination.
 *
 * A conc value is immutable and holds no running state; it only describes the computation. It is
 * cheap to copy, as the copies share the same tree. The computation is performed by run_conc(); each
 * call spawns its own tasks, and no task outlives the call.
 *
 * @see run_conc(), make_conc(), conc_pure(), conc_empty()
 */
template <typename T>
class conc {
public:
    using value_type = T;

private:
    detail::node_ptr<T> node_;

    explicit conc(detail::node_ptr<T> node)
        : node_(std::move(node)) {}

    friend detail::conc_access;
};

/**
 * @brief      Creates a leaf: a unit of work that will be executed in its own task.
 *
 * @param      f     The work to be executed; must be copyable, and may throw
 *
 * @return     A conc value with a single leaf
 *
 * Each evaluation of the returned tree executes `f` on a newly spawned task. If `f` returns `void`,
 * the leaf produces a @ref unit value.
 */
template <typename F>
conc<detail::lifted_result_t<F>> make_conc(F&& f) {
    using res_t = detail::lifted_result_t<F>;
    std::function<res_t()> fun = [f = std::decay_t<F>(std::forward<F>(f))]() mutable {
        return detail::invoke_lifted(f);
    };
    return detail::conc_access::make<res_t>(
            std::make_shared<detail::leaf_node<res_t>>(std::move(fun)));
}

//! Creates a tree with a pure value; evaluating it doesn't spawn anything.
template <typename T>
conc<std::decay_t<T>> conc_pure(T&& val) {
    using val_t = std::decay_t<T>;
    return detail::conc_access::make<val_t>(
            std::make_shared<detail::pure_node<val_t>>(std::forward<T>(val)));
}

/**
 * @brief      Creates the empty alternative.
 *
 * Evaluating it fails with @ref empty_with_no_alternative. In a race, it's the identity element:
 * `x | conc_empty<T>()` behaves like `x`.
 */
template <typename T>
conc<T> conc_empty() {
    return detail::conc_access::make<T>(std::make_shared<detail::empty_node<T>>());
}

/**
 * @brief      AND-combination of two trees.
 *
 * @param      left     The first tree
 * @param      right    The second tree
 * @param      combine  Function that combines the results of the two trees
 *
 * @return     The combined tree
 *
 * The two trees are evaluated concurrently; the result is `combine(left_result, right_result)`.
 * If any of the two fails, the other one is cancelled (waiting for its cleanup) and the failure is
 * reported. If both fail, the one that failed first is reported.
 */
template <typename A, typename B, typename F>
auto conc_zip(const conc<A>& left, const conc<B>& right, F&& combine)
        -> conc<std::invoke_result_t<std::decay_t<F>&, A, B>> {
    using res_t = std::invoke_result_t<std::decay_t<F>&, A, B>;
    std::function<res_t(A, B)> fun = std::forward<F>(combine);
    return detail::conc_access::make<res_t>(std::make_shared<detail::zip_node<res_t, A, B>>(
            detail::conc_access::node(left), detail::conc_access::node(right), std::move(fun)));
}

/**
 * @brief      OR-combination of two trees.
 *
 * The two trees are evaluated concurrently; the first one to produce a value wins, and the other
 * one is cancelled (waiting for its cleanup). A failing tree doesn't end the race; the race fails
 * only if both trees fail. In that case, the first real failure is reported; the
 * @ref empty_with_no_alternative failure is reported only if no real failure happened.
 *
 * If the left tree produces a value right away (e.g., a pure value), the right tree is not started.
 */
template <typename T>
conc<T> conc_race(const conc<T>& left, const conc<T>& right) {
    return detail::conc_access::make<T>(std::make_shared<detail::race_node<T>>(
            detail::conc_access::node(left), detail::conc_access::node(right)));
}

//! Same as conc_race()
template <typename T>
conc<T> operator|(const conc<T>& left, const conc<T>& right) {
    return conc_race(left, right);
}

//! Applies a function on the result of a tree. Doesn't spawn any new task.
template <typename A, typename F>
auto conc_map(const conc<A>& c, F&& f) -> conc<std::invoke_result_t<std::decay_t<F>&, A>> {
    return conc_zip(c, conc_pure(unit{}),
            [f = std::decay_t<F>(std::forward<F>(f))](A a, unit) mutable { return f(std::move(a)); });
}

//! AND-combination that keeps only the result of the right tree
template <typename A, typename B>
conc<B> then(const conc<A>& left, const conc<B>& right) {
    return conc_zip(left, right, [](A, B b) { return b; });
}

//! AND-combination that keeps only the result of the left tree
template <typename A, typename B>
conc<A> before(const conc<A>& left, const conc<B>& right) {
    return conc_zip(left, right, [](A a, B) { return a; });
}

/**
 * @brief      AND-combination of multiple trees, producing a tuple.
 *
 * The trees are nested to the right: `conc_all(a, b, c)` is equivalent to zipping `a` with the zip of
 * `b` and `c`. The AND-combination is associative, so the nesting doesn't change the outcome.
 */
template <typename T>
conc<std::tuple<T>> conc_all(const conc<T>& c) {
    return conc_map(c, [](T val) { return std::tuple<T>{std::move(val)}; });
}
template <typename T, typename... Ts>
conc<std::tuple<T, Ts...>> conc_all(const conc<T>& c, const conc<Ts>&... rest) {
    return conc_zip(c, conc_all(rest...), [](T val, std::tuple<Ts...> others) {
        return std::tuple_cat(std::tuple<T>{std::move(val)}, std::move(others));
    });
}

//! OR-combination of multiple trees, nested to the right.
template <typename T>
conc<T> conc_any(const conc<T>& c) {
    return c;
}
template <typename T, typename... Ts>
conc<T> conc_any(const conc<T>& c, const conc<Ts>&... rest) {
    return conc_race(c, conc_any(rest...));
}

} // namespace v1
} // namespace concert
