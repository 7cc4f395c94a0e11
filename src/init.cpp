#include "concert/init.hpp"
#include "concert/detail/library_data.hpp"
#include "concert/profiling.hpp"

#include <mutex>

namespace concert {
namespace detail {

//! Protects the access to the global configuration
static std::mutex g_init_mutex;
//! The configuration used by the library; null if the library is not initialized
static std::shared_ptr<const init_data> g_config;

std::shared_ptr<const init_data> get_init_data() {
    std::lock_guard<std::mutex> lock{g_init_mutex};
    if (!g_config) {
        CONCERT_PROFILING_INIT();
        g_config = std::make_shared<init_data>();
    }
    return g_config;
}

} // namespace detail

inline namespace v1 {

void init(const init_data& config) {
    std::lock_guard<std::mutex> lock{detail::g_init_mutex};
    if (detail::g_config)
        throw already_initialized();
    CONCERT_PROFILING_INIT();
    detail::g_config = std::make_shared<init_data>(config);
}

bool is_initialized() {
    std::lock_guard<std::mutex> lock{detail::g_init_mutex};
    return static_cast<bool>(detail::g_config);
}

void shutdown() {
    std::lock_guard<std::mutex> lock{detail::g_init_mutex};
    detail::g_config.reset();
}

} // namespace v1
} // namespace concert
