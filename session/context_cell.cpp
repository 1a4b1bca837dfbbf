#include "session/context_cell.hpp"
#include "logger.hpp"

namespace session
{

net::awaitable<Context> ContextCell::current()
{
    auto guard = co_await lock.read();
    co_return ctx;
}

net::awaitable<std::expected<bool, std::string>> ContextCell::promote(Bringup bringup)
{
    auto guard = co_await lock.write();

    if (!ctx.is_sealed())
    {
        LOG_DEBUG("Context already unsealed, promotion skipped");
        co_return false;
    }

    // Copy of the shared handles; the cell keeps its sealed context if bringup fails
    auto unsealed = bringup(*ctx.sealed());
    if (!unsealed)
    {
        LOG_ERROR("Peer bring-up failed: {}", unsealed.error());
        co_return std::unexpected(unsealed.error());
    }

    ctx = Context(std::move(*unsealed));
    LOG_INFO("Context unsealed");
    co_return true;
}

} // namespace session
