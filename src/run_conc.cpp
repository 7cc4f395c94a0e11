#include "concert/detail/conc_runner.hpp"
#include "concert/profiling.hpp"

namespace concert {
namespace detail {

task_function conc_runner::make_notifier(task_function handler) {
    return [this, handler = std::move(handler)]() { post(handler); };
}

void conc_runner::post(task_function ev) {
    {
        std::lock_guard<std::mutex> lock{mutex_};
        events_.push_back(std::move(ev));
    }
    cv_.notify_one();
}

void conc_runner::process_next() {
    task_function ev = interruptible_wait(
            mutex_, cv_, [this] { return !events_.empty(); },
            [this] {
                task_function res = std::move(events_.front());
                events_.pop_front();
                return res;
            });
    CONCERT_PROFILING_SCOPE_N("conc event");
    ev();
}

void conc_runner::retire(branch* b) {
    if (!b)
        return;
    b->request_cancel();
    retired_.push_back(b);
}

void conc_runner::drain() {
    if (retired_.empty())
        return;
    CONCERT_PROFILING_SCOPE_NC("drain", CONCERT_PROFILING_COLOR_SILVER);
    while (!retired_.empty()) {
        branch* b = retired_.back();
        retired_.pop_back();
        b->await_stopped();
    }
}

void run_scope::teardown() {
    CONCERT_PROFILING_FUNCTION();
    cancel_branch(root_);
    root_.reset();
}

} // namespace detail
} // namespace concert
