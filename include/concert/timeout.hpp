#pragma once

#include "task_handle.hpp"
#include "profiling.hpp"

#include <chrono>
#include <optional>

namespace concert {

inline namespace v1 {

/**
 * @brief      Executes the given work with a time bound.
 *
 * @param      rel_time  The maximum time allowed for the work
 * @param      f         The work to be executed
 *
 * @return     The result of the work, or an empty optional if the time elapsed
 *
 * The work is executed in a new task. If it doesn't finish in the given time, the task is cancelled,
 * and we wait for it to stop (and for its cleanup code to be executed) before returning an empty
 * optional. A partial result is never returned.
 *
 * Exceptions thrown by the work are propagated to the caller.
 *
 * This is an interruption point. If the calling task is cancelled while waiting, the work is
 * cancelled too, before the caller gets the @ref task_cancelled exception.
 */
template <typename Rep, typename Period, typename F>
std::optional<detail::lifted_result_t<F>> timeout(
        const std::chrono::duration<Rep, Period>& rel_time, F&& f) {
    CONCERT_PROFILING_FUNCTION();
    auto handle = spawn(std::forward<F>(f));
    if (!handle.wait_for(rel_time)) {
        CONCERT_PROFILING_MESSAGE("timeout expired");
        handle.cancel();
        return std::nullopt;
    }
    return handle.join();
}

} // namespace v1
} // namespace concert
