#pragma once

#include <stdexcept>

namespace concert {

inline namespace v1 {

/**
 * @brief      Exception that indicates that a task is cancelled
 *
 * This is thrown at the interruption points of a task after somebody requested the cancellation
 * of the task (and interruptions are not masked). It unwinds the stack of the task, running all
 * the destructors and cleanup code on the way.
 *
 * Joining a task that was cancelled also throws this exception.
 *
 * @see this_task::check_cancel(), interrupt_mask
 */
struct task_cancelled : std::runtime_error {
    task_cancelled() noexcept
        : std::runtime_error("task cancelled") {}
};

} // namespace v1

} // namespace concert
