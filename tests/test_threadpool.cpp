#include <catch2/catch_test_macros.hpp>

#include "threadpool/threadpool.hpp"
#include "helpers/test_support.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using test_support::run_awaitable;

TEST_CASE("ThreadPool runs the task off the caller and returns its value")
{
    ThreadPool pool(2);
    net::io_context io;
    std::thread::id task_thread;
    std::thread::id resumed_on;

    auto fut = net::co_spawn(io, [&]() -> net::awaitable<int>
    {
        auto v = co_await pool.spawn_blocking([&] { task_thread = std::this_thread::get_id(); return 42; });
        resumed_on = std::this_thread::get_id();
        co_return v;
    }, net::use_future);
    io.run();

    CHECK(fut.get() == 42);
    CHECK(task_thread != std::this_thread::get_id());
    CHECK(resumed_on == std::this_thread::get_id());
}

TEST_CASE("ThreadPool clamps a zero thread count to one")
{
    ThreadPool pool(0);

    CHECK(pool.size() == 1);
    CHECK(run_awaitable(pool.spawn_blocking([] { return std::string("ok"); })) == "ok");
}

TEST_CASE("ThreadPool turns any thrown value into TaskAborted")
{
    ThreadPool pool(1);

    CHECK_THROWS_AS(run_awaitable(pool.spawn_blocking([]() -> int { throw std::runtime_error("boom"); })),
                    TaskAborted);
    CHECK_THROWS_AS(run_awaitable(pool.spawn_blocking([]() -> int { throw 42; })), TaskAborted);

    // The pool keeps working after a failed task
    CHECK(run_awaitable(pool.spawn_blocking([] { return 1; })) == 1);
}

TEST_CASE("ThreadPool refuses work once stopped")
{
    ThreadPool pool(2);
    pool.stop();

    CHECK_FALSE(pool.is_running());
    CHECK_THROWS_AS(run_awaitable(pool.spawn_blocking([] { return 1; })), TaskAborted);
}

TEST_CASE("ThreadPool stop racing spawn_blocking never strands a caller")
{
    constexpr int rounds = 20;
    constexpr int tasks = 32;

    for (int round = 0; round < rounds; ++round)
    {
        ThreadPool pool(2);
        net::io_context io;
        std::atomic<int> completed{0};
        std::atomic<int> aborted{0};

        std::vector<std::future<void>> callers;
        for (int i = 0; i < tasks; ++i)
        {
            callers.push_back(net::co_spawn(io, [&, i]() -> net::awaitable<void>
            {
                try
                {
                    auto v = co_await pool.spawn_blocking([i]
                    {
                        std::this_thread::sleep_for(100us);
                        return i;
                    });
                    if (v == i)
                    {
                        ++completed;
                    }
                }
                catch (const TaskAborted&)
                {
                    ++aborted;
                }
            }, net::use_future));
        }

        std::jthread stopper([&pool, round]
        {
            std::this_thread::sleep_for(std::chrono::microseconds(50 * (round % 5)));
            pool.stop();
        });

        test_support::run_io(io, 4);
        stopper.join();

        for (auto& f : callers)
        {
            REQUIRE_NOTHROW(f.get());
        }
        CHECK(completed + aborted == tasks);
    }
}

TEST_CASE("ThreadPool can be stopped from one of its own tasks")
{
    auto pool = std::make_unique<ThreadPool>(3);

    auto v = run_awaitable(pool->spawn_blocking([&pool]
    {
        pool->stop();
        return 7;
    }));

    CHECK(v == 7);
    CHECK_FALSE(pool->is_running());
    CHECK_THROWS_AS(run_awaitable(pool->spawn_blocking([] { return 1; })), TaskAborted);

    pool.reset();
}
