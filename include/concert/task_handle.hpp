#pragma once

#include "detail/task_context.hpp"
#include "profiling.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>

namespace concert {

inline namespace v1 {

//! The value produced by the actions that don't return anything.
struct unit {
    bool operator==(unit) const { return true; }
    bool operator!=(unit) const { return false; }
};

/**
 * A function type that is compatible with a task notification.
 *
 * This function takes no arguments and returns nothing.
 */
using task_function = std::function<void()>;

//! The observable state of a task
enum class task_status {
    running,   //!< The task was started, and didn't finish yet
    finished,  //!< The task completed successfully
    failed,    //!< The task terminated with an exception
    cancelled, //!< The task was cancelled and stopped
};

} // namespace v1

namespace detail {

//! The data of a task, shared between the task handle and the thread executing the task.
struct task_core : std::enable_shared_from_this<task_core> {
    explicit task_core(task_id id)
        : ctx_(id) {}

    //! The cancellation/masking state of the task
    task_context ctx_;
    //! The current state of the task, for observation purposes
    std::atomic<task_status> status_{task_status::running};
    //! The exception the task terminated with; written before `done_` is set
    std::exception_ptr error_;

    std::mutex done_mutex_;
    std::condition_variable done_cv_;
    //! Set to true after the task terminated, with all its cleanup code executed
    bool done_{false};

    //! Called on the thread of the task, after the task is done
    task_function on_done_;
};

//! A task_core that can also store the value produced by the task
template <typename R>
struct task_state : task_core {
    using task_core::task_core;

    std::optional<R> value_;
};

//! Transforms `void` into `unit`, to keep all the results as proper values
template <typename R>
struct lift_void {
    using type = R;
};
template <>
struct lift_void<void> {
    using type = unit;
};

template <typename R>
using lift_void_t = typename lift_void<R>::type;

//! The type produced by calling `F` in a task
template <typename F>
using lifted_result_t = lift_void_t<std::invoke_result_t<std::decay_t<F>&>>;

//! Calls the given functor; if it returns void, returns unit
template <typename F>
lifted_result_t<F> invoke_lifted(F& f) {
    if constexpr (std::is_void_v<std::invoke_result_t<F&>>) {
        f();
        return unit{};
    } else
        return f();
}

//! Allocates the identity of a new task
task_id next_task_id();

//! Starts the thread that executes `body` as the given task
std::thread start_task_thread(std::shared_ptr<task_core> core, task_function body);

//! Waits until the task is done. Interruption point if `interruptible` is true.
void wait_task_done(task_core& core, bool interruptible);

//! Waits until the task is done or until the deadline is reached. Interruption point.
//! Returns true if the task is done.
bool wait_task_done_until(task_core& core, std::chrono::steady_clock::time_point deadline);

//! Rethrows the exception of the task, if the task terminated with an exception
void rethrow_task_error(const task_core& core);

//! Used by spawn() to create task handles
struct task_handle_access;

} // namespace detail

inline namespace v1 {

/**
 * @brief      Observer for the state of a task.
 *
 * This doesn't own the task and cannot influence its execution. It can be kept after the task
 * finished, to check how it ended. Intended for diagnostics and testing, not for control decisions.
 *
 * @see this_task::monitor(), task_handle::monitor()
 */
class task_monitor {
public:
    //! Creates an empty monitor, that doesn't observe any task
    task_monitor() = default;

    //! Checks if this observes a task
    explicit operator bool() const { return static_cast<bool>(core_); }

    //! The identity of the observed task; 0 for an empty monitor
    task_id id() const { return core_ ? core_->ctx_.id_ : 0; }

    //! The state of the observed task; an empty monitor reports `running`
    task_status status() const {
        return core_ ? core_->status_.load(std::memory_order_acquire) : task_status::running;
    }

private:
    std::shared_ptr<const detail::task_core> core_;

    explicit task_monitor(std::shared_ptr<const detail::task_core> core)
        : core_(std::move(core)) {}

    template <typename R>
    friend class task_handle;
    friend task_monitor current_task_monitor();
};

//! Returns the monitor for the task running on the current thread. Same as this_task::monitor().
task_monitor current_task_monitor();

/**
 * @brief      Owner of a task: an independently executing unit of work, producing a value of type R.
 *
 * Each task runs on its own thread, so tasks can block (waiting on other tasks, sleeping, waiting
 * on synchronization primitives) without preventing other tasks from making progress.
 *
 * The handle is the only way of waiting for the task and of getting its result. It has move-only
 * semantics. The handle never lets the task outlive it: destroying the handle of a task that is
 * still running cancels the task and waits for it to stop.
 *
 * Cancellation is cooperative: the task receives a @ref task_cancelled exception at its next
 * interruption point (if not masked); this unwinds the stack of the task, running its cleanup code.
 * @ref cancel() returns only after all that cleanup code was executed.
 *
 * @see spawn(), this_task, interrupt_mask
 */
template <typename R>
class task_handle {
public:
    using value_type = R;

    //! Creates an empty handle, not associated with any task
    task_handle() = default;

    //! Destructor. Cancels the task if it's still running, and waits for it to stop.
    ~task_handle() { reset(); }

    task_handle(task_handle&&) noexcept = default;
    task_handle& operator=(task_handle&& other) noexcept {
        if (this != &other) {
            reset();
            state_ = std::move(other.state_);
            thread_ = std::move(other.thread_);
        }
        return *this;
    }

    task_handle(const task_handle&) = delete;
    task_handle& operator=(const task_handle&) = delete;

    //! Checks if the handle is associated with a task
    explicit operator bool() const { return static_cast<bool>(state_); }

    //! The identity of the task
    task_id id() const { return state_ ? state_->ctx_.id_ : 0; }

    //! The current state of the task; for diagnostics only
    task_status status() const {
        return state_ ? state_->status_.load(std::memory_order_acquire) : task_status::running;
    }

    //! Returns an observer of the task, that can outlive this handle
    task_monitor monitor() const { return task_monitor{state_}; }

    /**
     * @brief      Waits for the task to finish and returns its result.
     *
     * @return     The value produced by the task
     *
     * If the task terminated with an exception, this rethrows that exception. If the task was
     * cancelled this throws @ref task_cancelled.
     *
     * This is an interruption point for the calling task. The value is moved out of the task, so
     * this can be called only once.
     */
    R join() {
        CONCERT_PROFILING_FUNCTION();
        detail::wait_task_done(*state_, true);
        if (thread_.joinable())
            thread_.join();
        detail::rethrow_task_error(*state_);
        return std::move(*state_->value_);
    }

    /**
     * @brief      Waits for the task to finish, for at most the given duration.
     *
     * @return     True if the task is finished, false if the time elapsed
     *
     * Interruption point. Doesn't consume the result of the task.
     */
    template <typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& rel_time) {
        auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::duration_cast<std::chrono::steady_clock::duration>(rel_time);
        return detail::wait_task_done_until(*state_, deadline);
    }

    /**
     * @brief      Asks the task to stop, without waiting for it.
     *
     * The task will get a @ref task_cancelled exception at its next (unmasked) interruption point.
     * Does nothing if the task already finished.
     *
     * @see cancel()
     */
    void request_cancel() {
        if (state_)
            state_->ctx_.request_cancel();
    }

    /**
     * @brief      Cancels the task and waits for it to stop.
     *
     * This returns after the task stopped and all its cleanup code has been executed. The waiting is
     * not interruptible: a cancel operation cannot be abandoned half-way. Does nothing (except
     * releasing the thread) if the task already finished.
     */
    void cancel() {
        if (!state_)
            return;
        CONCERT_PROFILING_SCOPE_C(CONCERT_PROFILING_COLOR_RED);
        CONCERT_PROFILING_SET_TEXT_FMT(32, "id=%llu", static_cast<unsigned long long>(id()));
        state_->ctx_.request_cancel();
        detail::wait_task_done(*state_, false);
        if (thread_.joinable())
            thread_.join();
    }

private:
    std::shared_ptr<detail::task_state<R>> state_;
    std::thread thread_;

    task_handle(std::shared_ptr<detail::task_state<R>> state, std::thread th)
        : state_(std::move(state))
        , thread_(std::move(th)) {}

    void reset() {
        if (thread_.joinable())
            cancel();
    }

    friend detail::task_handle_access;
};

} // namespace v1

namespace detail {
struct task_handle_access {
    template <typename R>
    static task_handle<R> make(std::shared_ptr<task_state<R>> state, std::thread th) {
        return task_handle<R>{std::move(state), std::move(th)};
    }
};
} // namespace detail

inline namespace v1 {

/**
 * @brief      Starts a new task executing the given functor.
 *
 * @param      f        The work to be executed by the task
 * @param      on_done  Optional; called on the task thread right after the task ended
 *
 * @return     The handle of the new task
 *
 * The task starts with a fresh state: not cancelled, with interruptions unmasked, no matter what
 * the masking state of the caller is. This way, a task spawned from a masked region can still be
 * cancelled.
 *
 * If the functor returns `void`, the task produces a @ref unit value.
 *
 * The `on_done` notification is called whatever the outcome of the task; it must not throw.
 */
template <typename F>
task_handle<detail::lifted_result_t<F>> spawn(F&& f, task_function on_done = {}) {
    using res_t = detail::lifted_result_t<F>;
    auto state = std::make_shared<detail::task_state<res_t>>(detail::next_task_id());
    state->on_done_ = std::move(on_done);
    auto* st = state.get();
    auto body = [st, fun = std::decay_t<F>(std::forward<F>(f))]() mutable {
        st->value_.emplace(detail::invoke_lifted(fun));
    };
    std::thread th = detail::start_task_thread(state, std::move(body));
    return detail::task_handle_access::make(std::move(state), std::move(th));
}

//! The number of tasks spawned so far in this process; diagnostic
std::uint64_t spawned_tasks_count();

} // namespace v1

namespace this_task {

//! Returns the monitor for the current task; empty if not called from a task spawned by concert.
inline task_monitor monitor() { return current_task_monitor(); }

} // namespace this_task
} // namespace concert
