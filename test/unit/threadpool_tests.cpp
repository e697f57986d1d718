// Unit tests for ThreadPool
#include <catch2/catch_test_macros.hpp>
#include "util/threadpool.hpp"
#include <atomic>
#include <stdexcept>
#include <vector>

using namespace shapefuzz::util;

TEST_CASE("ThreadPool - results", "[util][threadpool]") {
    ThreadPool pool(4);
    REQUIRE(pool.size() == 4);

    SECTION("Futures carry return values") {
        std::vector<std::future<int>> futures;
        for (int i = 0; i < 32; ++i) {
            futures.push_back(pool.enqueue([i] { return i * i; }));
        }
        for (int i = 0; i < 32; ++i) {
            REQUIRE(futures[i].get() == i * i);
        }
    }

    SECTION("Arguments are forwarded") {
        auto future = pool.enqueue([](int a, int b) { return a + b; }, 40, 2);
        REQUIRE(future.get() == 42);
    }

    SECTION("Exceptions travel through the future") {
        auto future = pool.enqueue([]() -> int { throw std::runtime_error("boom"); });
        REQUIRE_THROWS_AS(future.get(), std::runtime_error);

        // The worker survives
        REQUIRE(pool.enqueue([] { return 7; }).get() == 7);
    }
}

TEST_CASE("ThreadPool - shutdown", "[util][threadpool]") {
    SECTION("Queued tasks still run") {
        std::atomic<int> counter{0};
        {
            ThreadPool pool(2);
            for (int i = 0; i < 100; ++i) {
                pool.enqueue([&counter] { counter.fetch_add(1); });
            }
        }
        REQUIRE(counter.load() == 100);
    }

    SECTION("Enqueue after shutdown throws") {
        ThreadPool pool(1);
        pool.shutdown();
        REQUIRE(pool.is_stopped());
        REQUIRE_THROWS_AS(pool.enqueue([] { return 1; }), std::runtime_error);
    }

    SECTION("Completed task count") {
        ThreadPool pool(2);
        for (int i = 0; i < 10; ++i) {
            pool.enqueue([] {});
        }
        pool.shutdown();
        pool.wait_for_completion();
        REQUIRE(pool.tasks_completed() == 10);
        REQUIRE(pool.pending_tasks() == 0);
    }

    SECTION("Zero requests hardware concurrency") {
        ThreadPool pool(0);
        REQUIRE(pool.size() >= 1);
    }
}
