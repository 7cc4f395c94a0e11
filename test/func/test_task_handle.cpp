#include <catch2/catch.hpp>
#include <concert/task_handle.hpp>
#include <concert/this_task.hpp>
#include <concert/interrupt_mask.hpp>
#include <concert/scoped.hpp>
#include <concert/sync_var.hpp>

#include "test_common/task_utils.hpp"

#include <atomic>
#include <string>
#include <thread>

using namespace std::chrono_literals;

TEST_CASE("a spawned task produces its value", "[task_handle]") {
    auto h = concert::spawn([] { return std::string{"hello"}; });
    REQUIRE(static_cast<bool>(h));
    REQUIRE(h.join() == "hello");
    REQUIRE(h.status() == concert::task_status::finished);
}

TEST_CASE("void tasks produce unit", "[task_handle]") {
    std::atomic<bool> executed{false};
    concert::task_handle<concert::unit> h = concert::spawn([&] { executed = true; });
    REQUIRE(h.join() == concert::unit{});
    REQUIRE(executed.load());
}

TEST_CASE("default constructed handle is empty", "[task_handle]") {
    concert::task_handle<int> h;
    REQUIRE_FALSE(static_cast<bool>(h));
    REQUIRE(h.id() == 0);
    // Cancelling an empty handle does nothing
    h.cancel();
}

TEST_CASE("join rethrows the exception of the task", "[task_handle]") {
    auto h = concert::spawn([]() -> int { throw my_exc{}; });
    REQUIRE_THROWS_AS(h.join(), my_exc);
    REQUIRE(h.status() == concert::task_status::failed);
}

TEST_CASE("tasks get distinct identities", "[task_handle]") {
    auto h1 = concert::spawn([] { return concert::this_task::get_id(); });
    auto h2 = concert::spawn([] { return concert::this_task::get_id(); });
    auto id1 = h1.id();
    auto id2 = h2.id();
    REQUIRE(id1 != 0);
    REQUIRE(id2 != 0);
    REQUIRE(id1 != id2);
    REQUIRE(h1.join() == id1);
    REQUIRE(h2.join() == id2);
}

TEST_CASE("threads not started by concert have no task identity", "[task_handle]") {
    REQUIRE(concert::this_task::get_id() == 0);
    REQUIRE_FALSE(static_cast<bool>(concert::this_task::monitor()));
}

TEST_CASE("spawning increases the number of spawned tasks", "[task_handle]") {
    auto before = concert::spawned_tasks_count();
    auto h = concert::spawn([] {});
    h.join();
    REQUIRE(concert::spawned_tasks_count() > before);
}

TEST_CASE("cancel stops a sleeping task", "[task_handle]") {
    auto h = concert::spawn([] { concert::this_task::sleep_for(1h); });
    std::this_thread::sleep_for(1ms);
    h.cancel();
    REQUIRE(h.status() == concert::task_status::cancelled);
}

TEST_CASE("cancel waits for the cleanup of the task", "[task_handle]") {
    std::atomic<int> state{0};
    auto h = concert::spawn([&] {
        concert::finally(
                [&] {
                    state = 1;
                    concert::this_task::sleep_forever();
                },
                [&] {
                    // Cleanup that takes some time; cancel needs to wait for it
                    std::this_thread::sleep_for(5ms);
                    state = 2;
                });
    });
    REQUIRE(bounded_wait([&] { return state.load() == 1; }));
    h.cancel();
    REQUIRE(state.load() == 2);
    REQUIRE(h.status() == concert::task_status::cancelled);
}

TEST_CASE("join on a cancelled task throws task_cancelled", "[task_handle]") {
    auto h = concert::spawn([] { concert::this_task::sleep_forever(); });
    h.request_cancel();
    REQUIRE_THROWS_AS(h.join(), concert::task_cancelled);
    REQUIRE(h.status() == concert::task_status::cancelled);
}

TEST_CASE("cancelling a finished task is a no-op", "[task_handle]") {
    auto h = concert::spawn([] { return 42; });
    REQUIRE(h.wait_for(1s));
    h.cancel();
    REQUIRE(h.status() == concert::task_status::finished);
}

TEST_CASE("destroying a handle cancels the running task", "[task_handle]") {
    std::atomic<bool> cleaned{false};
    concert::task_monitor mon;
    {
        auto h = concert::spawn([&] {
            concert::finally([] { concert::this_task::sleep_forever(); }, [&] { cleaned = true; });
        });
        mon = h.monitor();
        REQUIRE(mon.status() == concert::task_status::running);
    }
    REQUIRE(cleaned.load());
    REQUIRE(mon.status() == concert::task_status::cancelled);
}

TEST_CASE("wait_for reports timeouts", "[task_handle]") {
    concert::sync_var<bool> go{false};
    auto h = concert::spawn([&] { return go.wait_until([](bool v) { return v; }); });
    REQUIRE_FALSE(h.wait_for(2ms));
    go.set(true);
    REQUIRE(h.wait_for(1s));
    REQUIRE(h.join());
}

TEST_CASE("spawned tasks start unmasked, even if spawned from a masked region", "[task_handle]") {
    concert::interrupt_mask mask;
    REQUIRE(concert::this_task::get_masking_state() == concert::masking_state::masked);
    auto h = concert::spawn([] { return concert::this_task::get_masking_state(); });
    REQUIRE(h.join() == concert::masking_state::unmasked);
}

TEST_CASE("masked tasks are cancelled after they unmask", "[task_handle]") {
    std::atomic<int> progress{0};
    auto h = concert::spawn([&] {
        {
            concert::interrupt_mask mask;
            progress = 1;
            // The cancellation is not delivered here
            concert::this_task::sleep_for(10ms);
            progress = 2;
        }
        concert::this_task::check_cancel();
        progress = 3;
    });
    REQUIRE(bounded_wait([&] { return progress.load() >= 1; }));
    h.cancel();
    REQUIRE(progress.load() == 2);
    REQUIRE(h.status() == concert::task_status::cancelled);
}

TEST_CASE("monitor obtained inside the task observes it", "[task_handle]") {
    auto h = concert::spawn([] { return concert::this_task::monitor(); });
    auto id = h.id();
    auto mon = h.join();
    REQUIRE(static_cast<bool>(mon));
    REQUIRE(mon.id() == id);
    REQUIRE(mon.status() == concert::task_status::finished);
}

TEST_CASE("a task throwing task_cancelled on its own is a failure", "[task_handle]") {
    auto h = concert::spawn([] { throw concert::task_cancelled{}; });
    REQUIRE_THROWS_AS(h.join(), concert::task_cancelled);
    REQUIRE(h.status() == concert::task_status::failed);
}
