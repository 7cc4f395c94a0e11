#include <catch2/catch.hpp>
#include <concert/init.hpp>
#include <concert/task_handle.hpp>
#include <concert/this_task.hpp>

#include "test_common/task_utils.hpp"

#include <atomic>
#include <vector>

TEST_CASE("can init and shutdown library", "[init]") {
    concert::shutdown();
    REQUIRE_FALSE(concert::is_initialized());
    concert::init();
    REQUIRE(concert::is_initialized());
    concert::shutdown();
    REQUIRE_FALSE(concert::is_initialized());
}

TEST_CASE("can init multiple times", "[init]") {
    concert::shutdown();
    REQUIRE_FALSE(concert::is_initialized());
    concert::init();
    REQUIRE(concert::is_initialized());
    concert::shutdown();
    REQUIRE_FALSE(concert::is_initialized());
    concert::init();
    REQUIRE(concert::is_initialized());
    concert::shutdown();
}

TEST_CASE("can spawn tasks if initialized multiple times", "[init]") {
    concert::shutdown();
    concert::init();
    concert::shutdown();
    concert::init();
    REQUIRE(concert::spawn([] { return 1; }).join() == 1);
    concert::shutdown();
}

TEST_CASE("worker start fun is called for each task", "[init]") {
    concert::shutdown();

    for (int i = 1; i < 10; i++) {
        std::atomic<int> init_count{0};

        concert::init_data config;
        config.worker_start_fun_ = [&]() { init_count++; };
        concert::init(config);

        std::vector<concert::task_handle<concert::unit>> tasks;
        for (int j = 0; j < i; j++)
            tasks.push_back(concert::spawn([] {}));
        for (auto& t : tasks)
            t.join();
        REQUIRE(init_count.load() == i);

        concert::shutdown();
    }
}

TEST_CASE("exception handler is called for failed tasks only", "[init]") {
    concert::shutdown();
    std::atomic<int> num_errors{0};
    concert::init_data config;
    config.except_fun_ = [&](std::exception_ptr) { num_errors++; };
    concert::init(config);

    auto failing = concert::spawn([] { throw my_exc{}; });
    REQUIRE_THROWS_AS(failing.join(), my_exc);
    REQUIRE(num_errors.load() == 1);

    auto cancelled = concert::spawn([] { concert::this_task::sleep_forever(); });
    cancelled.cancel();
    REQUIRE(num_errors.load() == 1);

    concert::shutdown();
}

TEST_CASE("init twice (manually) throws", "[init]") {
    concert::shutdown();
    concert::init();

    REQUIRE_THROWS_AS(concert::init(), concert::already_initialized);
    concert::shutdown();
}

TEST_CASE("init twice (first time automatic) throws", "[init]") {
    concert::shutdown();
    // Spawning a task here initializes the library
    REQUIRE(concert::spawn([] { return 1; }).join() == 1);

    REQUIRE_THROWS_AS(concert::init(), concert::already_initialized);
    concert::shutdown();
}
