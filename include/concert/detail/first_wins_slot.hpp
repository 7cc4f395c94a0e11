#pragma once

#include <optional>
#include <utility>

namespace concert {
namespace detail {

/**
 * @brief      A cell that can be set only once; the first writer wins.
 *
 * Used to pick the outcome of concurrent branches based on the order in which they complete, and
 * never based on their position in the tree. All the writes after the first one are ignored.
 *
 * Not thread-safe. The completions are serialized by the coordinator of run_conc(), so "first"
 * means first in the order in which the coordinator processes the events.
 */
template <typename T>
class first_wins_slot {
public:
    //! Tries to set the value; returns true if this call set the value, false if it was already set
    bool try_set(T val) {
        if (value_)
            return false;
        value_.emplace(std::move(val));
        return true;
    }

    //! Checks whether the value was already set
    bool is_set() const { return value_.has_value(); }

    //! Returns the stored value; the slot must be set
    const T& get() const { return *value_; }

private:
    std::optional<T> value_;
};

} // namespace detail
} // namespace concert
