#pragma once

#include <functional>
#include <exception>

namespace concert {

/**
 * @brief      Type of function to be called for handling exceptions
 *
 * This defines the type of exception handler function used across concert. A handler of this type
 * will be called whenever a task terminates with an exception, even if the exception is later
 * discarded by the @ref run_conc() evaluator.
 */
using except_fun_t = std::function<void(std::exception_ptr)>;

} // namespace concert
