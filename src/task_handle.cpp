#include "concert/task_handle.hpp"
#include "concert/init.hpp"
#include "concert/detail/library_data.hpp"
#include "concert/profiling.hpp"

namespace concert {
namespace detail {

//! The identity of the last task spawned
static std::atomic<task_id> g_last_task_id{0};

//! TLS pointer to the task running on the current thread
thread_local task_core* g_current_core{nullptr};

#if CONCERT_ENABLE_PROFILING
//! The number of tasks that are currently executing
static std::atomic<int> g_num_live_tasks{0};
#endif

//! Called when a task starts executing
static void on_task_started() {
#if CONCERT_ENABLE_PROFILING
    int val = g_num_live_tasks++;
    CONCERT_PROFILING_PLOT("# concert live tasks", int64_t(val + 1));
#endif
}

//! Called when a task finished executing
static void on_task_finished() {
#if CONCERT_ENABLE_PROFILING
    int val = g_num_live_tasks--;
    CONCERT_PROFILING_PLOT("# concert live tasks", int64_t(val - 1));
#endif
}

//! The body of the thread of a task
static void run_task(const std::shared_ptr<task_core>& core, task_function& body) {
    CONCERT_PROFILING_SETTHREADNAME("concert_task");
    const auto config = get_init_data();

    set_current_context(&core->ctx_);
    g_current_core = core.get();
    on_task_started();

    task_status status = task_status::finished;
    try {
        CONCERT_PROFILING_SCOPE_N("task");
        CONCERT_PROFILING_SET_TEXT_FMT(32, "id=%llu", static_cast<unsigned long long>(core->ctx_.id_));
        if (config->worker_start_fun_)
            config->worker_start_fun_();
        body();
    } catch (const task_cancelled&) {
        core->error_ = std::current_exception();
        // A task can throw task_cancelled without being asked to stop; that's a regular failure
        status = core->ctx_.cancel_requested_.load(std::memory_order_acquire)
                         ? task_status::cancelled
                         : task_status::failed;
    } catch (...) {
        core->error_ = std::current_exception();
        status = task_status::failed;
    }
    if (status == task_status::failed && config->except_fun_)
        config->except_fun_(core->error_);

    on_task_finished();
    g_current_core = nullptr;
    set_current_context(nullptr);

    {
        std::lock_guard<std::mutex> lock{core->done_mutex_};
        core->done_ = true;
        core->status_.store(status, std::memory_order_release);
    }
    core->done_cv_.notify_all();

    if (core->on_done_)
        core->on_done_();
}

task_id next_task_id() { return ++g_last_task_id; }

std::thread start_task_thread(std::shared_ptr<task_core> core, task_function body) {
    CONCERT_PROFILING_FUNCTION();
    return std::thread([core = std::move(core), body = std::move(body)]() mutable {
        run_task(core, body);
    });
}

void wait_task_done(task_core& core, bool interruptible) {
    CONCERT_PROFILING_SCOPE_C(CONCERT_PROFILING_COLOR_SILVER);
    if (interruptible) {
        interruptible_wait(
                core.done_mutex_, core.done_cv_, [&core] { return core.done_; }, [] {});
    } else {
        std::unique_lock<std::mutex> lock{core.done_mutex_};
        core.done_cv_.wait(lock, [&core] { return core.done_; });
    }
}

bool wait_task_done_until(task_core& core, std::chrono::steady_clock::time_point deadline) {
    CONCERT_PROFILING_SCOPE_C(CONCERT_PROFILING_COLOR_SILVER);
    return interruptible_wait_until(
            core.done_mutex_, core.done_cv_, deadline, [&core] { return core.done_; });
}

void rethrow_task_error(const task_core& core) {
    if (core.error_)
        std::rethrow_exception(core.error_);
}

} // namespace detail

inline namespace v1 {

task_monitor current_task_monitor() {
    detail::task_core* core = detail::g_current_core;
    if (!core)
        return {};
    return task_monitor{core->shared_from_this()};
}

std::uint64_t spawned_tasks_count() { return detail::g_last_task_id.load(); }

} // namespace v1
} // namespace concert
