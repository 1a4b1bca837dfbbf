#pragma once

#include <boost/asio.hpp>
#include <thread>
#include <vector>
#include <atomic>
#include <exception>
#include <format>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace net = boost::asio;

/**
 * Raised when a blocking task cannot complete: the pool was stopped before it ran,
 * or the task itself threw. Indicates a broken runtime invariant and is never retried.
 */
class TaskAborted : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

/**
 * Dedicated pool for CPU-bound work (key derivation), kept off the request io_context.
 */
class ThreadPool
{
public:
    explicit ThreadPool(size_t n_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /**
     * Run fn on a pool thread and suspend the calling coroutine until it finishes.
     * The result is delivered back on the caller's executor.
     * Throws TaskAborted if the pool is stopped or fn throws anything.
     */
    template<class Fn>
    net::awaitable<std::invoke_result_t<Fn&>> spawn_blocking(Fn fn, std::string_view what = "blocking task")
    {
        using Ret = std::invoke_result_t<Fn&>;

        auto result = co_await net::async_initiate<const net::use_awaitable_t<>&,
                                                   void(std::exception_ptr, std::optional<Ret>)>(
            [this](auto handler, Fn task, std::string name)
            {
                auto caller = net::prefer(net::get_associated_executor(handler),
                                          net::execution::outstanding_work.tracked);

                // Checked under the same mutex stop() takes, so an accepted task is always drained
                std::lock_guard lock(state_mtx);
                if (!running)
                {
                    net::post(caller, [h = std::move(handler), name = std::move(name)]() mutable
                    {
                        h(std::make_exception_ptr(
                              TaskAborted(std::format("{} was aborted: thread pool stopped", name))),
                          std::nullopt);
                    });
                    return;
                }

                net::post(pool_ctx, [h = std::move(handler), task = std::move(task),
                                     name = std::move(name), caller]() mutable
                {
                    std::exception_ptr error;
                    std::optional<Ret> value;
                    try
                    {
                        value.emplace(std::invoke(task));
                    }
                    catch (const std::exception& e)
                    {
                        error = std::make_exception_ptr(TaskAborted(std::format("{} was aborted: {}", name, e.what())));
                    }
                    catch (...)
                    {
                        error = std::make_exception_ptr(TaskAborted(std::format("{} was aborted: unknown exception", name)));
                    }

                    net::post(caller, [h = std::move(h), error, value = std::move(value)]() mutable
                    {
                        h(error, std::move(value));
                    });
                });
            },
            net::use_awaitable, std::move(fn), std::string(what));

        co_return std::move(*result);
    }

    size_t size() const { return workers.size(); }
    [[nodiscard]] bool is_running() const { return running.load(); }

    /**
     * Stop accepting tasks and wait for the queued ones to finish.
     * Called from a pool task, returns without waiting for the workers.
     * The pool must not be destroyed from one of its own workers.
     */
    void stop();

private:
    net::io_context pool_ctx;
    net::executor_work_guard<net::io_context::executor_type> work_guard;
    std::vector<std::jthread> workers;
    std::mutex state_mtx;
    std::atomic<bool> running{true};
};
