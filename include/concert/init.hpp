#pragma once

#include "except_fun_type.hpp"

#include <functional>
#include <stdexcept>

namespace concert {

inline namespace v1 {

/**
 * @brief      Configuration data for the concert library
 *
 * Store here all the parameters needed to be passed to concert when initializing. Any parameters
 * that are left unfilled will have reasonable defaults in concert.
 */
struct init_data {
    //! Function to be called at the start of each task thread.
    //! Use this if you want to do things like setting thread names, priority, affinity, etc.
    std::function<void()> worker_start_fun_;
    //! Function to be called whenever a task terminates with an exception (cancellation excluded).
    //! Called on the thread of the failing task. Useful for logging the errors that the evaluator
    //! discards, as only one error escapes each combinator.
    except_fun_t except_fun_;
};

/**
 * @brief      Initializes the concert library.
 *
 * @param      config  The configuration to be passed to the library; optional.
 *
 * This will initialize the library, with the given parameters. If the library is already
 * initialized this will throw an @ref already_initialized exception.
 *
 * If this is not explicitly called the library will be initialized with default settings the first
 * time that a task is spawned.
 *
 * @see        shutdown(), is_initialized(), already_initialized
 */
void init(const init_data& config = {});

/**
 * @brief      Exception thrown when attempting to initialize the library more than once.
 *
 * Thrown when manually initializing after the library was already initialized, either automatically
 * or by explicitly calling @ref init().
 *
 * @see init(), is_initialized()
 */
struct already_initialized : std::runtime_error {
    already_initialized()
        : runtime_error("already initialized") {}
};

//! Determines if the library is initialized.
bool is_initialized();

/**
 * @brief      Shuts down the concert library.
 *
 * Drops the configuration given to @ref init(). Tasks spawned after this will use the default
 * configuration (and will implicitly initialize the library again). This is mostly useful in unit
 * tests, to get a clean state for the next test.
 *
 * @warning    Tasks that are already running keep the configuration they were started with.
 */
void shutdown();

} // namespace v1
} // namespace concert
