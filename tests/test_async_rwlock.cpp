#include <catch2/catch_test_macros.hpp>

#include "concurrency/async_rwlock.hpp"
#include "helpers/test_support.hpp"

#include <boost/asio/detached.hpp>
#include <chrono>
#include <string>
#include <vector>

using concurrency::AsyncRwLock;
using namespace std::chrono_literals;

namespace
{

net::awaitable<void> sleep_for(std::chrono::milliseconds d)
{
    net::steady_timer timer(co_await net::this_coro::executor);
    timer.expires_after(d);
    co_await timer.async_wait(net::use_awaitable);
}

} // namespace

TEST_CASE("AsyncRwLock lets readers hold the lock together")
{
    net::io_context io;
    AsyncRwLock lock;
    int inside = 0;
    int max_inside = 0;

    auto reader = [&]() -> net::awaitable<void>
    {
        auto guard = co_await lock.read();
        max_inside = std::max(max_inside, ++inside);
        co_await sleep_for(20ms);
        --inside;
    };

    for (int i = 0; i < 3; ++i)
    {
        net::co_spawn(io, reader(), net::detached);
    }
    io.run();

    CHECK(max_inside == 3);
    CHECK(inside == 0);
}

TEST_CASE("AsyncRwLock writer excludes readers and readers queue behind a waiting writer")
{
    net::io_context io;
    AsyncRwLock lock;
    std::vector<std::string> events;

    auto reader = [&](std::string name) -> net::awaitable<void>
    {
        auto guard = co_await lock.read();
        events.push_back(name + "+");
        co_await sleep_for(10ms);
        events.push_back(name + "-");
    };

    auto writer = [&]() -> net::awaitable<void>
    {
        auto guard = co_await lock.write();
        events.push_back("w+");
        co_await sleep_for(10ms);
        events.push_back("w-");
    };

    net::co_spawn(io, reader("r1"), net::detached);
    net::co_spawn(io, writer(), net::detached);
    net::co_spawn(io, reader("r2"), net::detached);
    io.run();

    std::vector<std::string> expected{"r1+", "r1-", "w+", "w-", "r2+", "r2-"};
    CHECK(events == expected);
}

TEST_CASE("AsyncRwLock writers are serialized")
{
    net::io_context io;
    AsyncRwLock lock;
    int writers_inside = 0;
    bool overlap = false;
    int completed = 0;

    auto writer = [&]() -> net::awaitable<void>
    {
        auto guard = co_await lock.write();
        if (++writers_inside > 1)
        {
            overlap = true;
        }
        co_await sleep_for(5ms);
        --writers_inside;
        ++completed;
    };

    for (int i = 0; i < 4; ++i)
    {
        net::co_spawn(io, writer(), net::detached);
    }
    io.run();

    CHECK_FALSE(overlap);
    CHECK(completed == 4);
}

TEST_CASE("AsyncRwLock guard release hands the lock to the next waiter")
{
    net::io_context io;
    AsyncRwLock lock;
    bool second_acquired = false;
    size_t waiting_while_held = 0;

    auto flow = [&]() -> net::awaitable<void>
    {
        auto first = co_await lock.write();
        CHECK(first.owns_lock());

        net::co_spawn(io, [&]() -> net::awaitable<void>
        {
            auto g = co_await lock.read();
            second_acquired = true;
        }, net::detached);

        co_await sleep_for(5ms);
        waiting_while_held = lock.waiting();

        first.release();
        CHECK_FALSE(first.owns_lock());
    };

    net::co_spawn(io, flow(), net::detached);
    io.run();

    CHECK(waiting_while_held == 1);
    CHECK(second_acquired);
    CHECK(lock.waiting() == 0);
}

TEST_CASE("AsyncRwLock keeps multi-threaded writers exclusive")
{
    net::io_context io;
    AsyncRwLock lock;
    std::atomic<int> writers_inside{0};
    std::atomic<int> readers_inside{0};
    std::atomic<bool> violation{false};
    std::vector<std::future<void>> done;

    for (int i = 0; i < 8; ++i)
    {
        done.push_back(net::co_spawn(io, [&, i]() -> net::awaitable<void>
        {
            for (int n = 0; n < 50; ++n)
            {
                if ((i + n) % 5 == 0)
                {
                    auto g = co_await lock.write();
                    if (writers_inside.fetch_add(1) != 0 || readers_inside.load() != 0)
                    {
                        violation = true;
                    }
                    writers_inside.fetch_sub(1);
                }
                else
                {
                    auto g = co_await lock.read();
                    readers_inside.fetch_add(1);
                    if (writers_inside.load() != 0)
                    {
                        violation = true;
                    }
                    readers_inside.fetch_sub(1);
                }
            }
        }, net::use_future));
    }

    test_support::run_io(io, 4);
    for (auto& f : done)
    {
        f.get();
    }

    CHECK_FALSE(violation.load());
    CHECK(lock.waiting() == 0);
}
