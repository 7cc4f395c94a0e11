#include <catch2/catch.hpp>
#include <concert/this_task.hpp>
#include <concert/interrupt_mask.hpp>
#include <concert/task_handle.hpp>

#include "test_common/task_utils.hpp"

#include <atomic>

using namespace std::chrono_literals;

TEST_CASE("masks can be nested", "[this_task]") {
    using concert::masking_state;
    REQUIRE(concert::this_task::get_masking_state() == masking_state::unmasked);
    {
        concert::interrupt_mask m1;
        REQUIRE(concert::this_task::get_masking_state() == masking_state::masked);
        {
            concert::interrupt_mask m2;
            REQUIRE(concert::this_task::get_masking_state() == masking_state::masked);
        }
        REQUIRE(concert::this_task::get_masking_state() == masking_state::masked);
    }
    REQUIRE(concert::this_task::get_masking_state() == masking_state::unmasked);
}

TEST_CASE("check_cancel does nothing if the task is not cancelled", "[this_task]") {
    concert::this_task::check_cancel();
    REQUIRE_FALSE(concert::this_task::is_cancel_requested());
    auto h = concert::spawn([] {
        concert::this_task::check_cancel();
        return concert::this_task::is_cancel_requested();
    });
    REQUIRE_FALSE(h.join());
}

TEST_CASE("sleep_for sleeps if not cancelled", "[this_task]") {
    auto start = std::chrono::steady_clock::now();
    concert::this_task::sleep_for(3ms);
    REQUIRE(std::chrono::steady_clock::now() - start >= 3ms);
}

TEST_CASE("cancellation request is visible from within the task", "[this_task]") {
    std::atomic<bool> saw_request{false};
    auto h = concert::spawn([&] {
        concert::interrupt_mask mask;
        // Poll without interruption points
        while (!concert::this_task::is_cancel_requested())
            std::this_thread::sleep_for(100us);
        saw_request = true;
    });
    std::this_thread::sleep_for(1ms);
    h.cancel();
    REQUIRE(saw_request.load());
    // The task was never interrupted, so it finished normally
    REQUIRE(h.status() == concert::task_status::finished);
}

TEST_CASE("long computations can be cancelled through check_cancel", "[this_task]") {
    std::atomic<int> iterations{0};
    auto h = concert::spawn([&] {
        for (;;) {
            concert::this_task::check_cancel();
            iterations++;
            std::this_thread::sleep_for(10us);
        }
    });
    REQUIRE(bounded_wait([&] { return iterations.load() > 10; }));
    h.cancel();
    REQUIRE(h.status() == concert::task_status::cancelled);
}
