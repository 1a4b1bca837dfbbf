#pragma once

#include "concurrency/async_rwlock.hpp"
#include "session/context.hpp"
#include <expected>
#include <functional>
#include <string>

namespace session
{

/**
 * Process-wide holder of the current Context. The variant moves from Sealed to Unsealed
 * at most once; callers re-fetch with current() after a successful unseal instead of
 * keeping a sealed copy around.
 */
class ContextCell
{
public:
    using Bringup = std::function<std::expected<Unsealed, std::string>(Sealed)>;

    explicit ContextCell(Context initial) : ctx(std::move(initial)) {}

    ContextCell(const ContextCell&) = delete;
    ContextCell& operator=(const ContextCell&) = delete;

    net::awaitable<Context> current();

    /**
     * Runs bringup on the sealed context under the exclusive lock and installs its result.
     * Returns false without calling bringup when already unsealed.
     * A bringup error leaves the cell sealed.
     */
    net::awaitable<std::expected<bool, std::string>> promote(Bringup bringup);

private:
    concurrency::AsyncRwLock lock;
    Context ctx;
};

} // namespace session
