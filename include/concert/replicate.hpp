#pragma once

#include "conc.hpp"
#include "run_conc.hpp"

#include <iterator>
#include <utility>
#include <variant>
#include <vector>

namespace concert {

inline namespace v1 {

/**
 * @brief      Executes the given work `n` times, concurrently, discarding the results.
 *
 * @param      n     The number of times to execute the work
 * @param      f     The work to be executed
 *
 * Each execution of `f` happens on its own task; no two executions share a task (so they can rely
 * on per-task identity). The call returns after all the executions completed. If one of them fails,
 * all the others are cancelled and the first failure is rethrown.
 *
 * For `n <= 0` this does nothing, and spawns no task.
 */
template <typename F>
void replicate_concurrently_(int n, F&& f) {
    CONCERT_PROFILING_FUNCTION();
    CONCERT_PROFILING_SET_TEXT_FMT(32, "n=%d", n);
    auto leaf = make_conc([&f] { static_cast<void>(f()); });
    conc<unit> tree = conc_pure(unit{});
    if (n > 0) {
        tree = leaf;
        for (int i = 1; i < n; i++)
            tree = then(leaf, tree);
    }
    run_conc(tree);
}

/**
 * @brief      Executes the given work `n` times, concurrently, collecting the results.
 *
 * @return     The results of the executions, in order; empty if `n <= 0`
 *
 * @see replicate_concurrently_()
 */
template <typename F>
std::vector<detail::lifted_result_t<F>> replicate_concurrently(int n, F&& f) {
    using res_t = detail::lifted_result_t<F>;
    auto leaf = make_conc([&f] { return detail::invoke_lifted(f); });
    conc<std::vector<res_t>> tree = conc_pure(std::vector<res_t>{});
    for (int i = 0; i < n; i++)
        tree = conc_zip(leaf, tree, [](res_t val, std::vector<res_t> rest) {
            rest.insert(rest.begin(), std::move(val));
            return rest;
        });
    return run_conc(tree);
}

/**
 * @brief      Calls `f` for each element of the range, concurrently; discards the results.
 *
 * Each call is made on its own task. Returns when all the calls completed. The first failure
 * cancels the other calls and is rethrown.
 */
template <typename Range, typename F>
void for_concurrently_(const Range& range, F&& f) {
    conc<unit> tree = conc_pure(unit{});
    for (auto it = std::rbegin(range); it != std::rend(range); ++it) {
        const auto& elem = *it;
        tree = then(make_conc([&f, &elem] { static_cast<void>(f(elem)); }), tree);
    }
    run_conc(tree);
}

/**
 * @brief      Calls `f` for each element of the range, concurrently, collecting the results.
 *
 * @return     The results of the calls, in the order of the range
 */
template <typename Range, typename F>
auto map_concurrently(const Range& range, F&& f)
        -> std::vector<detail::lift_void_t<decltype(f(*std::begin(range)))>> {
    using res_t = detail::lift_void_t<decltype(f(*std::begin(range)))>;
    conc<std::vector<res_t>> tree = conc_pure(std::vector<res_t>{});
    for (auto it = std::rbegin(range); it != std::rend(range); ++it) {
        const auto& elem = *it;
        auto leaf = make_conc([&f, &elem] {
            auto call = [&] { return f(elem); };
            return detail::invoke_lifted(call);
        });
        tree = conc_zip(leaf, tree, [](res_t val, std::vector<res_t> rest) {
            rest.insert(rest.begin(), std::move(val));
            return rest;
        });
    }
    return run_conc(tree);
}

/**
 * @brief      Runs two functions concurrently, returning the result of the first one to succeed.
 *
 * @return     A variant holding at index 0 the result of `f`, or at index 1 the result of `g`
 *
 * The loser is cancelled. A failing function doesn't end the race; this fails only if both
 * functions fail (reporting the first failure).
 */
template <typename F, typename G>
std::variant<detail::lifted_result_t<F>, detail::lifted_result_t<G>> race(F&& f, G&& g) {
    using res_t = std::variant<detail::lifted_result_t<F>, detail::lifted_result_t<G>>;
    auto left = conc_map(make_conc(std::forward<F>(f)),
            [](detail::lifted_result_t<F> val) { return res_t{std::in_place_index<0>, std::move(val)}; });
    auto right = conc_map(make_conc(std::forward<G>(g)),
            [](detail::lifted_result_t<G> val) { return res_t{std::in_place_index<1>, std::move(val)}; });
    return run_conc(left | right);
}

/**
 * @brief      Runs two functions concurrently, returning both results.
 *
 * If one of the functions fails, the other one is cancelled and the failure is rethrown.
 */
template <typename F, typename G>
std::pair<detail::lifted_result_t<F>, detail::lifted_result_t<G>> concurrently(F&& f, G&& g) {
    using res_t = std::pair<detail::lifted_result_t<F>, detail::lifted_result_t<G>>;
    return run_conc(conc_zip(make_conc(std::forward<F>(f)), make_conc(std::forward<G>(g)),
            [](detail::lifted_result_t<F> a, detail::lifted_result_t<G> b) {
                return res_t{std::move(a), std::move(b)};
            }));
}

} // namespace v1
} // namespace concert
