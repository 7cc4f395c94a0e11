#include "concert/this_task.hpp"
#include "concert/profiling.hpp"

namespace concert {
namespace detail {

//! TLS pointer to the context of the task running on this thread.
//! This will be set and reset at each task execution.
thread_local task_context* g_current_context{nullptr};

//! Context used by threads that were not started by concert.
thread_local task_context g_thread_context{0};

task_context& current_context() {
    task_context* ctx = g_current_context;
    return ctx ? *ctx : g_thread_context;
}

void set_current_context(task_context* ctx) { g_current_context = ctx; }

void task_context::request_cancel() {
    CONCERT_PROFILING_FUNCTION();
    cancel_requested_.store(true, std::memory_order_release);
    // If the task is blocked, wake it up so that it sees the flag
    std::lock_guard<std::mutex> lock{waker_mutex_};
    if (waker_)
        (*waker_)();
}

wait_registration::wait_registration(task_context& ctx, const std::function<void()>& waker)
    : ctx_(ctx) {
    std::lock_guard<std::mutex> lock{ctx_.waker_mutex_};
    ctx_.waker_ = &waker;
}

wait_registration::~wait_registration() {
    std::lock_guard<std::mutex> lock{ctx_.waker_mutex_};
    ctx_.waker_ = nullptr;
}

} // namespace detail

namespace this_task {

task_id get_id() { return detail::current_context().id_; }

bool is_cancel_requested() {
    return detail::current_context().cancel_requested_.load(std::memory_order_acquire);
}

void check_cancel() {
    if (detail::current_context().should_interrupt())
        throw task_cancelled();
}

masking_state get_masking_state() {
    return detail::current_context().mask_depth_ > 0 ? masking_state::masked
                                                     : masking_state::unmasked;
}

void sleep_forever() {
    CONCERT_PROFILING_SCOPE_C(CONCERT_PROFILING_COLOR_SILVER);
    auto& ctx = detail::current_context();
    detail::interruptible_wait(ctx.sleep_mutex_, ctx.sleep_cv_, [] { return false; }, [] {});
    // interruptible_wait can only get out by throwing
    throw task_cancelled();
}

} // namespace this_task
} // namespace concert
