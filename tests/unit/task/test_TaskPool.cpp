#include <doctest/doctest.h>
#include <blueprint/task/TaskPool.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace BP;
using namespace std::chrono_literals;

TEST_SUITE("task.pool") {

TEST_CASE("TaskPool Misc") {
    SUBCASE("Basic job execution") {
        TaskPool         pool(2);
        std::atomic<int> counter{0};
        CHECK_FALSE(pool.submit([&counter] { counter++; }).has_value());
        pool.waitIdle();
        CHECK(counter == 1);
        CHECK(pool.size() == 2);
    }

    SUBCASE("Multiple jobs execution") {
        TaskPool         pool(4);
        std::atomic<int> counter{0};
        const int        NUM_JOBS = 100;
        for (int i = 0; i < NUM_JOBS; ++i) {
            REQUIRE_FALSE(pool.submit([&counter] { counter++; }).has_value());
        }
        pool.waitIdle();
        CHECK(counter == NUM_JOBS);
    }

    SUBCASE("Single worker keeps submission order") {
        TaskPool         pool(1);
        std::mutex       mutex;
        std::vector<int> order;
        for (int i = 0; i < 50; ++i) {
            REQUIRE_FALSE(pool.submit([&, i] {
                                std::this_thread::sleep_for(i % 5 == 0 ? 1ms : 0ms);
                                std::lock_guard<std::mutex> lock(mutex);
                                order.push_back(i);
                            })
                                  .has_value());
        }
        pool.waitIdle();
        REQUIRE(order.size() == 50);
        for (int i = 0; i < 50; ++i) {
            CHECK(order[i] == i);
        }
    }

    SUBCASE("A throwing job does not stop the worker") {
        TaskPool          pool(1);
        std::atomic<bool> ran{false};
        REQUIRE_FALSE(pool.submit([] { throw std::runtime_error("job failed"); }).has_value());
        REQUIRE_FALSE(pool.submit([&ran] { ran = true; }).has_value());
        pool.waitIdle();
        CHECK(ran);
    }

    SUBCASE("Empty jobs and jobs after shutdown are refused") {
        TaskPool pool(1);
        auto     empty = pool.submit(Executor::Job{});
        REQUIRE(empty.has_value());
        CHECK(empty->code == Error::Code::InvalidType);

        pool.shutdown();
        auto refused = pool.submit([] {});
        REQUIRE(refused.has_value());
        CHECK(refused->code == Error::Code::NotSupported);
    }

    SUBCASE("Shutdown drains queued jobs") {
        std::atomic<int> counter{0};
        {
            TaskPool pool(1);
            for (int i = 0; i < 10; ++i) {
                REQUIRE_FALSE(pool.submit([&counter] {
                                    std::this_thread::sleep_for(1ms);
                                    counter++;
                                })
                                      .has_value());
            }
        }
        CHECK(counter == 10);
    }

    SUBCASE("Zero threads still gets one worker") {
        TaskPool         pool(0);
        std::atomic<int> counter{0};
        REQUIRE_FALSE(pool.submit([&counter] { counter++; }).has_value());
        pool.waitIdle();
        CHECK(counter == 1);
        CHECK(pool.size() == 1);
    }
}

} // TEST_SUITE
