#include "concurrency/async_rwlock.hpp"

namespace concurrency
{

bool AsyncRwLock::try_grant(Mode mode)
{
    if (writer || !waiters.empty())
    {
        return false;
    }

    if (mode == Mode::Shared)
    {
        ++readers;
        return true;
    }

    if (readers != 0)
    {
        return false;
    }
    writer = true;
    return true;
}

std::vector<std::move_only_function<void()>> AsyncRwLock::wake_next()
{
    std::vector<std::move_only_function<void()>> ready;
    if (writer || waiters.empty())
    {
        return ready;
    }

    if (waiters.front().mode == Mode::Exclusive)
    {
        if (readers == 0)
        {
            writer = true;
            ready.push_back(std::move(waiters.front().resume));
            waiters.pop_front();
        }
        return ready;
    }

    while (!waiters.empty() && waiters.front().mode == Mode::Shared)
    {
        ++readers;
        ready.push_back(std::move(waiters.front().resume));
        waiters.pop_front();
    }
    return ready;
}

void AsyncRwLock::unlock(Mode mode)
{
    std::vector<std::move_only_function<void()>> ready;
    {
        std::lock_guard lk(mtx);
        if (mode == Mode::Exclusive)
        {
            writer = false;
        }
        else
        {
            --readers;
        }
        ready = wake_next();
    }

    // Resumption only posts; ownership was already transferred under the mutex
    for (auto& resume : ready)
    {
        resume();
    }
}

size_t AsyncRwLock::waiting() const
{
    std::lock_guard lk(mtx);
    return waiters.size();
}

} // namespace concurrency
