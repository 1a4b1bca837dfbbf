#include "threadpool/threadpool.hpp"

#include <algorithm>

ThreadPool::ThreadPool(size_t n_threads)
    : work_guard(net::make_work_guard(pool_ctx))
    , workers(n_threads == 0 ? 1 : n_threads)
{
    for (auto& t : workers)
    {
        t = std::jthread([this] {pool_ctx.run();});
    }
}

ThreadPool::~ThreadPool()
{
    stop();

    for (auto& t : workers)
    {
        // A worker cannot join itself; hand it off instead of terminating
        if (t.joinable() && t.get_id() == std::this_thread::get_id())
        {
            t.detach();
        }
    }
}

void ThreadPool::stop()
{
    {
        std::lock_guard lock(state_mtx);
        if (bool was_running = running.exchange(false); !was_running)
        {
            return;
        }

        // Queued tasks still run to completion; workers exit once the queue drains
        work_guard.reset();
    }

    // From inside a task the other workers wait for that task to return, so nobody is joined here
    auto self = std::this_thread::get_id();
    if (std::ranges::any_of(workers, [self](const std::jthread& t) { return t.get_id() == self; }))
    {
        return;
    }

    for (auto& t : workers)
    {
        if (t.joinable())
        {
            t.join();
        }
    }
}
