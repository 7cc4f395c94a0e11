#pragma once

#include "../task_handle.hpp"

#include <condition_variable>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <vector>

namespace concert {
namespace detail {

//! A failure propagated through a conc tree
struct conc_failure {
    //! The exception to be reported
    std::exception_ptr ex_;
    //! True if this is the empty-alternative failure (lowest priority in a race)
    bool no_alternative_{false};
};

/**
 * @brief      The coordinator of one run_conc() call.
 *
 * Tasks spawned for the leaves of the tree notify their completion by posting events in the queue
 * of the runner. The thread that called run_conc() processes these events one by one, in the order
 * in which they arrived; this way, all the decisions about the tree are taken on one thread, and the
 * order of the events is the order in which the tasks completed.
 *
 * Branches that lost (the siblings of a failure, the losers of a race) are retired: their
 * cancellation is requested right away, the outcome propagates up the tree without waiting, and
 * only then the coordinator drains them, waiting for their cleanup before handling the next event.
 *
 * There is one runner per run_conc() call; nothing is shared between different calls.
 */
struct branch;

class conc_runner {
public:
    conc_runner() = default;

    conc_runner(const conc_runner&) = delete;
    conc_runner& operator=(const conc_runner&) = delete;

    //! Returns the notification function to be passed to a spawned task.
    //! When the task is done, `handler` will be executed on the coordinator thread.
    task_function make_notifier(task_function handler);

    //! Waits for the next event and processes it. Interruption point.
    void process_next();

    //! Requests the cancellation of the given branch; the waiting is done later, by drain().
    //! Null branches are ignored. The branch must stay alive until drained.
    void retire(branch* b);

    //! Waits for all the retired branches to stop; not interruptible
    void drain();

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    //! The events posted by the tasks, not yet processed
    std::deque<task_function> events_;
    //! Branches whose cancellation was requested, but not yet awaited
    std::vector<branch*> retired_;

    //! Adds a new event to the queue; called from the task threads
    void post(task_function ev);
};

//! Receives the outcome of a (sub-)tree
template <typename T>
struct result_sink {
    virtual ~result_sink() = default;
    virtual void on_value(T&& val) = 0;
    virtual void on_failure(conc_failure f) = 0;
};

//! The live state of a started (sub-)tree. All the operations are made on the coordinator thread.
struct branch {
    virtual ~branch() = default;
    //! Asks all the tasks of this branch to stop; doesn't wait. The branch won't report anymore.
    virtual void request_cancel() = 0;
    //! Waits until all the tasks of this branch stopped (and their cleanup code finished)
    virtual void await_stopped() = 0;
};

using branch_ptr = std::unique_ptr<branch>;

//! Cancels the tasks of the given branch and waits for their cleanup; null branches are ignored
inline void cancel_branch(branch_ptr& b) {
    if (b) {
        b->request_cancel();
        b->await_stopped();
    }
}

/**
 * @brief      Owns the branches started by one run_conc() call.
 *
 * Ensures that no task started by the call outlives it: no matter how we leave the scope (result,
 * failure, cancellation of the caller), all the tasks still running are cancelled, and we wait for
 * all of them to stop before leaving.
 *
 * Cancellation is first requested for all the tasks, and only after that we wait for them. The
 * tasks will thus stop in parallel.
 */
class run_scope {
public:
    run_scope() = default;
    ~run_scope() { teardown(); }

    run_scope(const run_scope&) = delete;
    run_scope& operator=(const run_scope&) = delete;

    //! Sets the root branch of the tree
    void set_root(branch_ptr root) { root_ = std::move(root); }

    //! Cancels everything that is still running and waits for it
    void teardown();

private:
    branch_ptr root_;
};

} // namespace detail
} // namespace concert
