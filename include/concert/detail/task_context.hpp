#pragma once

#include "../task_cancelled.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>

namespace concert {

inline namespace v1 {
//! Identifier of a task; 0 is used for threads not started by concert
using task_id = std::uint64_t;
} // namespace v1

namespace detail {

/**
 * @brief      The interruption state of a task.
 *
 * Each task spawned by concert has one of these. Threads that were not started by concert get a
 * thread-local instance, so that masking and the interruptible primitives behave the same way
 * everywhere (such a thread cannot be cancelled, though).
 *
 * The cancellation flag can be set from any thread. The masking depth is only touched by the thread
 * that owns the context.
 *
 * Blocking primitives register a *waker* while they block; a cancellation request calls the waker so
 * that the blocked thread re-checks its condition and notices the cancellation.
 */
struct task_context {
    explicit task_context(task_id id)
        : id_(id) {}

    task_context(const task_context&) = delete;
    task_context& operator=(const task_context&) = delete;

    //! The identity of the task
    const task_id id_;
    //! Set when somebody wants the task to stop
    std::atomic<bool> cancel_requested_{false};
    //! Number of active interrupt_mask objects on the owning thread
    int mask_depth_{0};

    //! Protects waker_
    std::mutex waker_mutex_;
    //! The function that wakes up the blocking wait in progress, if any
    const std::function<void()>* waker_{nullptr};

    //! Used by this_task::sleep_for & co.
    std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;

    //! True if the owning thread should throw task_cancelled at the next interruption point
    bool should_interrupt() const {
        return mask_depth_ == 0 && cancel_requested_.load(std::memory_order_acquire);
    }

    //! Sets the cancellation flag and wakes up the task if it's blocked
    void request_cancel();
};

//! Returns the context of the current thread
task_context& current_context();

//! Sets the context of the current thread; called when a task starts and ends executing
void set_current_context(task_context* ctx);

//! Registers a waker in a task context for the duration of a blocking wait.
//! Must not be constructed/destroyed while holding the mutex that the waker locks.
class wait_registration {
public:
    wait_registration(task_context& ctx, const std::function<void()>& waker);
    ~wait_registration();

    wait_registration(const wait_registration&) = delete;
    wait_registration& operator=(const wait_registration&) = delete;

private:
    task_context& ctx_;
};

/**
 * @brief      Blocks until the predicate is true, then calls `on_ready` under the lock.
 *
 * @param      m         The mutex protecting the state checked by `pred`; must not be held
 * @param      cv        The condition variable notified when the state changes
 * @param      pred      The condition to wait for
 * @param      on_ready  Called with `m` locked, once `pred` is satisfied; its result is returned
 *
 * This is an interruption point: if the current task is cancelled while waiting (and interruptions
 * are not masked), this throws @ref task_cancelled. If the condition is already satisfied, this
 * returns without throwing, even if the task is cancelled.
 */
template <typename Pred, typename F>
auto interruptible_wait(std::mutex& m, std::condition_variable& cv, Pred pred, F on_ready)
        -> decltype(on_ready()) {
    task_context& ctx = current_context();
    const std::function<void()> waker = [&m, &cv] {
        std::lock_guard<std::mutex> lock{m};
        cv.notify_all();
    };
    wait_registration registration{ctx, waker};
    {
        std::unique_lock<std::mutex> lock{m};
        cv.wait(lock, [&] { return pred() || ctx.should_interrupt(); });
        if (pred())
            return on_ready();
    }
    throw task_cancelled();
}

/**
 * @brief      Same as interruptible_wait(), but gives up at the given deadline.
 *
 * @return     True if the predicate was satisfied; false if we reached the deadline
 */
template <typename Clock, typename Duration, typename Pred>
bool interruptible_wait_until(std::mutex& m, std::condition_variable& cv,
        const std::chrono::time_point<Clock, Duration>& deadline, Pred pred) {
    task_context& ctx = current_context();
    const std::function<void()> waker = [&m, &cv] {
        std::lock_guard<std::mutex> lock{m};
        cv.notify_all();
    };
    wait_registration registration{ctx, waker};
    {
        std::unique_lock<std::mutex> lock{m};
        cv.wait_until(lock, deadline, [&] { return pred() || ctx.should_interrupt(); });
        if (pred())
            return true;
        if (!ctx.should_interrupt())
            return false;
    }
    throw task_cancelled();
}

} // namespace detail
} // namespace concert
