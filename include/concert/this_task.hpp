#pragma once

#include "detail/task_context.hpp"

#include <chrono>

namespace concert {

inline namespace v1 {

//! The state of interruption delivery for the current task
enum class masking_state {
    unmasked, //!< Cancellation requests are delivered at the interruption points
    masked,   //!< Cancellation requests are deferred until the mask is lifted
};

} // namespace v1

/**
 * @brief      Functions that operate on the task running on the current thread.
 *
 * The functions here are the *interruption points* of concert: a cancelled task gets a
 * @ref task_cancelled exception from one of them. Code that runs a long time without calling any of
 * them cannot be cancelled before it finishes.
 */
namespace this_task {

//! Returns the identifier of the current task; 0 if not called from a task spawned by concert.
task_id get_id();

//! Checks if somebody asked the current task to stop; does not throw.
bool is_cancel_requested();

/**
 * @brief      Interruption point.
 *
 * Throws @ref task_cancelled if the current task is cancelled and the interruptions are not
 * masked. Long computations should call this from time to time.
 */
void check_cancel();

//! Returns whether the cancellation requests are currently delivered to this task.
masking_state get_masking_state();

/**
 * @brief      Blocks the current task until the given time point is reached.
 *
 * @param      abs_time  The point in time at which the task resumes
 *
 * Interruption point; a cancelled task will stop sleeping and get a @ref task_cancelled exception.
 */
template <typename Clock, typename Duration>
void sleep_until(const std::chrono::time_point<Clock, Duration>& abs_time) {
    auto& ctx = detail::current_context();
    detail::interruptible_wait_until(ctx.sleep_mutex_, ctx.sleep_cv_, abs_time, [] { return false; });
}

//! Blocks the current task for the given duration. Interruption point.
template <typename Rep, typename Period>
void sleep_for(const std::chrono::duration<Rep, Period>& rel_time) {
    sleep_until(std::chrono::steady_clock::now() + rel_time);
}

/**
 * @brief      Blocks the current task until it's cancelled.
 *
 * This never returns normally; it always ends with a @ref task_cancelled exception. If the
 * interruptions are masked, this blocks forever.
 */
[[noreturn]] void sleep_forever();

} // namespace this_task
} // namespace concert
