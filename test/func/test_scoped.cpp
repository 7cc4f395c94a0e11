#include <catch2/catch.hpp>
#include <concert/scoped.hpp>
#include <concert/task_handle.hpp>
#include <concert/this_task.hpp>

#include "test_common/task_utils.hpp"

#include <atomic>

TEST_CASE("finally runs the cleanup after the body", "[scoped]") {
    int order = 0;
    int body_at = -1;
    int cleanup_at = -1;
    int res = concert::finally(
            [&] {
                body_at = order++;
                return 5;
            },
            [&] { cleanup_at = order++; });
    REQUIRE(res == 5);
    REQUIRE(body_at == 0);
    REQUIRE(cleanup_at == 1);
}

TEST_CASE("finally runs the cleanup on exceptions", "[scoped]") {
    bool cleaned = false;
    REQUIRE_THROWS_AS(concert::finally([] { throw my_exc{}; }, [&] { cleaned = true; }), my_exc);
    REQUIRE(cleaned);
}

TEST_CASE("cleanup code runs masked", "[scoped]") {
    concert::masking_state in_cleanup = concert::masking_state::unmasked;
    concert::finally([] {}, [&] { in_cleanup = concert::this_task::get_masking_state(); });
    REQUIRE(in_cleanup == concert::masking_state::masked);
}

TEST_CASE("bracket releases the acquired resource", "[scoped]") {
    int acquired = 0;
    int released = 0;
    auto res = concert::bracket([&] { return ++acquired; }, [&](int r) { released = r; },
            [](int r) { return r * 10; });
    REQUIRE(res == 10);
    REQUIRE(released == 1);
}

TEST_CASE("bracket releases the resource when the task is cancelled", "[scoped]") {
    std::atomic<int> count{0};
    auto h = concert::spawn([&] {
        concert::bracket_([&] { count++; }, [&] { count--; },
                [] { concert::this_task::sleep_forever(); });
    });
    REQUIRE(bounded_wait([&] { return count.load() == 1; }));
    h.cancel();
    REQUIRE(count.load() == 0);
}

TEST_CASE("blocking cleanup is not interrupted", "[scoped]") {
    std::atomic<bool> started{false};
    std::atomic<bool> cleanup_done{false};
    auto h = concert::spawn([&] {
        concert::finally(
                [&] {
                    started = true;
                    concert::this_task::sleep_forever();
                },
                [&] {
                    // This is an interruption point, but the cleanup runs masked
                    concert::this_task::sleep_for(3ms);
                    cleanup_done = true;
                });
    });
    REQUIRE(bounded_wait([&] { return started.load(); }));
    h.cancel();
    REQUIRE(cleanup_done.load());
}
