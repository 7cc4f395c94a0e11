#pragma once

#include "detail/task_context.hpp"

#include <condition_variable>
#include <mutex>
#include <utility>

namespace concert {

inline namespace v1 {

/**
 * @brief      A value shared between tasks, that tasks can wait on.
 *
 * All the operations are atomic with respect to each other. A task can block until the value
 * satisfies a given predicate; this wait is an interruption point, so a blocked task can be
 * cancelled.
 *
 * This can be used to hand off values between tasks (e.g., with `sync_var<std::optional<T>>`), or
 * to keep shared counters that other tasks wait on.
 */
template <typename T>
class sync_var {
public:
    explicit sync_var(T init = T{})
        : value_(std::move(init)) {}

    sync_var(const sync_var&) = delete;
    sync_var& operator=(const sync_var&) = delete;

    //! Returns a copy of the current value
    T get() const {
        std::lock_guard<std::mutex> lock{mutex_};
        return value_;
    }

    //! Sets a new value, waking up the tasks that wait on this
    void set(T val) {
        {
            std::lock_guard<std::mutex> lock{mutex_};
            value_ = std::move(val);
        }
        cv_.notify_all();
    }

    /**
     * @brief      Atomically modifies the value.
     *
     * @param      f     Functor that receives a reference to the value and modifies it
     *
     * @return     The value after the modification
     */
    template <typename F>
    T modify(F&& f) {
        T res = [&] {
            std::lock_guard<std::mutex> lock{mutex_};
            f(value_);
            return value_;
        }();
        cv_.notify_all();
        return res;
    }

    /**
     * @brief      Blocks until the value satisfies the given predicate.
     *
     * @param      pred  Predicate called with the value; called with the internal lock held
     *
     * @return     The value that satisfied the predicate
     *
     * Interruption point.
     */
    template <typename Pred>
    T wait_until(Pred&& pred) {
        return detail::interruptible_wait(
                mutex_, cv_, [&] { return pred(value_); }, [this] { return value_; });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    T value_;
};

} // namespace v1
} // namespace concert
