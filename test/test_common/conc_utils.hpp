#pragma once

#include <concert/conc.hpp>
#include <concert/run_conc.hpp>
#include <concert/scoped.hpp>
#include <concert/this_task.hpp>

#include "task_utils.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

//! The kinds of trees used to check that the way we nest the combinators doesn't matter
enum class operand_kind {
    pure,    //!< A pure value
    leaf,    //!< A leaf that produces a value after a short sleep
    failing, //!< A leaf that throws my_exc
    empty,   //!< The empty alternative
};

inline operand_kind to_operand_kind(std::uint8_t x) { return static_cast<operand_kind>(x % 4); }

//! Creates a tree of the given kind. The leaves keep `live` up to date with the number of running
//! leaves, so that we can check that nothing is left running.
inline concert::conc<int> make_operand(operand_kind kind, int val, std::atomic<int>& live) {
    switch (kind) {
    case operand_kind::pure:
        return concert::conc_pure(val);
    case operand_kind::leaf:
        return concert::make_conc([val, &live] {
            return concert::bracket_([&live] { live++; }, [&live] { live--; },
                    [val] {
                        concert::this_task::sleep_for(1ms);
                        return val;
                    });
        });
    case operand_kind::failing:
        return concert::make_conc([&live]() -> int {
            return concert::bracket_([&live] { live++; }, [&live] { live--; },
                    []() -> int { throw my_exc{}; });
        });
    case operand_kind::empty:
    default:
        return concert::conc_empty<int>();
    }
}

//! The outcome of evaluating a tree
template <typename T>
struct conc_outcome {
    std::optional<T> value_;
    //! "my_exc" or "empty" if the evaluation failed
    std::string error_;
};

//! Evaluates the tree and records its outcome. Unexpected exceptions are propagated.
template <typename T>
conc_outcome<T> outcome_of(const concert::conc<T>& c) {
    conc_outcome<T> res;
    try {
        res.value_.emplace(concert::run_conc(c));
    } catch (const my_exc&) {
        res.error_ = "my_exc";
    } catch (const concert::empty_with_no_alternative&) {
        res.error_ = "empty";
    }
    return res;
}
