#pragma once

#include <utility> // must precede boost/asio: Boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

namespace net = boost::asio;

namespace concurrency
{

/**
 * Reader/writer lock for coroutines running on an io_context.
 * Contended acquisitions suspend the coroutine instead of blocking the worker thread.
 * Waiters are served FIFO; a queued writer holds back readers that arrive after it.
 */
class AsyncRwLock
{
public:
    enum class Mode : uint8_t
    {
        Shared,
        Exclusive,
    };

    class [[nodiscard]] Guard
    {
    public:
        Guard() = default;
        Guard(AsyncRwLock* lk, Mode m) : lock(lk), mode(m) {}
        ~Guard() { release(); }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard(Guard&& other) noexcept : lock(std::exchange(other.lock, nullptr)), mode(other.mode) {}
        Guard& operator=(Guard&& other) noexcept
        {
            if (this != &other)
            {
                release();
                lock = std::exchange(other.lock, nullptr);
                mode = other.mode;
            }
            return *this;
        }

        void release()
        {
            if (lock)
            {
                std::exchange(lock, nullptr)->unlock(mode);
            }
        }

        [[nodiscard]] bool owns_lock() const { return lock != nullptr; }

    private:
        AsyncRwLock* lock = nullptr;
        Mode mode = Mode::Shared;
    };

    AsyncRwLock() = default;
    AsyncRwLock(const AsyncRwLock&) = delete;
    AsyncRwLock& operator=(const AsyncRwLock&) = delete;

    template<class Token>
    auto async_acquire(Mode mode, Token&& token)
    {
        return net::async_initiate<Token, void()>(
            [this, mode](auto handler)
            {
                auto resume = [h = std::move(handler)]() mutable
                {
                    auto ex = net::get_associated_executor(h);
                    net::post(ex, std::move(h));
                };

                std::unique_lock lk(mtx);
                if (!try_grant(mode))
                {
                    waiters.push_back(Waiter{mode, std::move(resume)});
                    return;
                }
                lk.unlock();
                resume();
            },
            token);
    }

    net::awaitable<Guard> read()
    {
        co_await async_acquire(Mode::Shared, net::use_awaitable);
        co_return Guard(this, Mode::Shared);
    }

    net::awaitable<Guard> write()
    {
        co_await async_acquire(Mode::Exclusive, net::use_awaitable);
        co_return Guard(this, Mode::Exclusive);
    }

    void unlock(Mode mode);

    [[nodiscard]] size_t waiting() const;

private:
    struct Waiter
    {
        Mode mode;
        std::move_only_function<void()> resume;
    };

    bool try_grant(Mode mode);
    std::vector<std::move_only_function<void()>> wake_next();

    mutable std::mutex mtx;
    size_t readers = 0;
    bool writer = false;
    std::deque<Waiter> waiters;
};

} // namespace concurrency
