#pragma once

#include "detail/task_context.hpp"

namespace concert {

inline namespace v1 {

/**
 * @brief      Scoped guard that masks the delivery of cancellation requests.
 *
 * While an object of this type is alive, the current task does not throw @ref task_cancelled at
 * interruption points; blocking calls wait for their condition as if nobody had asked the task to
 * stop. Once the last mask is gone, a pending cancellation is delivered at the next interruption
 * point.
 *
 * Masks can be nested. They only affect the current thread; tasks spawned while a mask is active
 * start unmasked.
 *
 * Cleanup code that needs to block (e.g., to release a resource) should run masked, so that it
 * runs to completion even if the task is being cancelled.
 */
class interrupt_mask {
public:
    interrupt_mask()
        : ctx_(detail::current_context()) {
        ctx_.mask_depth_++;
    }
    ~interrupt_mask() { ctx_.mask_depth_--; }

    interrupt_mask(const interrupt_mask&) = delete;
    interrupt_mask& operator=(const interrupt_mask&) = delete;

private:
    detail::task_context& ctx_;
};

} // namespace v1
} // namespace concert
