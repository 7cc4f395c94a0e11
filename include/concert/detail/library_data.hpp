#pragma once

#include <memory>

namespace concert {

inline namespace v1 {
struct init_data;
}

namespace detail {

/**
 * @brief      Getter for the configuration that also ensures that the library is initialized.
 *
 * @return     The configuration to be used by newly spawned tasks.
 *
 * The returned object is shared; a task keeps it alive for its entire duration, even if the library
 * is shut down in the meantime.
 */
std::shared_ptr<const init_data> get_init_data();

} // namespace detail
} // namespace concert
