#pragma once

#include "conc.hpp"
#include "detail/conc_runner.hpp"
#include "detail/conc_nodes.hpp"
#include "this_task.hpp"
#include "profiling.hpp"

namespace concert {

inline namespace v1 {

/**
 * @brief      Evaluates a conc tree, returning its result.
 *
 * @param      c     The tree to be evaluated
 *
 * @return     The value produced by the tree
 *
 * Spawns one task for each leaf that needs to be executed and combines their outcomes following the
 * AND/OR rules of the tree (see @ref conc). Pure values don't spawn anything.
 *
 * If the tree fails, this throws exactly one exception: the one that was reported first (in time)
 * by the combinators of the tree. The other exceptions are discarded; they can still be observed
 * through the exception handler given to init().
 *
 * Whatever way we exit this function (value, failure, or cancellation of the calling task), all the
 * tasks spawned here were stopped and all their cleanup code was executed before we exit. Tasks that
 * are not needed anymore (e.g., the losers of a race, the siblings of a failed task) are cancelled as
 * soon as the outcome of their combinator is known.
 *
 * The waiting done by this function is an interruption point. If the calling task is cancelled (e.g.,
 * by a timeout()), all the tasks of the tree are cancelled, and this throws @ref task_cancelled. This
 * holds even if the cancellation arrives while we are waiting for the cleanup of cancelled tasks,
 * after the outcome of the tree was decided: a cancelled caller never gets a result.
 */
template <typename T>
T run_conc(const conc<T>& c) {
    CONCERT_PROFILING_FUNCTION();
    detail::conc_runner runner;
    detail::root_sink<T> sink;
    detail::run_scope scope;
    scope.set_root(detail::conc_access::node(c)->start(runner, sink));
    runner.drain();
    while (!sink.done_) {
        runner.process_next();
        runner.drain();
    }
    scope.teardown();
    // The waits above are not interruptible; a pending cancellation wins over the outcome
    this_task::check_cancel();
    return sink.take();
}

} // namespace v1
} // namespace concert
