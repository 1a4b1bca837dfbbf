#include "peer/peer.hpp"
#include "logger.hpp"

#include <format>
#include <system_error>

namespace peer
{

std::string_view PeerControl::peer_id() const
{
    return shared ? std::string_view(shared->peer_id) : std::string_view{};
}

bool PeerControl::is_running() const
{
    return shared && shared->running.load(std::memory_order_acquire);
}

uint64_t PeerControl::heartbeats() const
{
    return shared ? shared->heartbeats.load(std::memory_order_relaxed) : 0;
}

void PeerControl::shutdown()
{
    if (shared)
    {
        shared->stop_requested.store(true, std::memory_order_release);
    }
}

State::State(std::string peer_id, std::filesystem::path monorepo, std::shared_ptr<store::Store> store)
    : id(std::move(peer_id))
    , repo_path(std::move(monorepo))
    , kv(std::move(store))
{
}

std::expected<std::pair<Peer, State>, std::string> Peer::create(
    const crypto::SecretKey& key,
    const Config& cfg,
    std::shared_ptr<store::Store> store)
{
    auto shared = std::make_shared<detail::Shared>();
    shared->peer_id = key.public_id();

    auto monorepo = cfg.root / "git";
    std::error_code ec;
    std::filesystem::create_directories(monorepo, ec);
    if (ec)
    {
        return std::unexpected(std::format("Failed to create monorepo at {}: {}", monorepo.string(), ec.message()));
    }

    if (auto res = store->put("peer/id", shared->peer_id); !res)
    {
        return std::unexpected(std::format("Failed to record peer id: {}", res.error()));
    }

    State state(shared->peer_id, std::move(monorepo), std::move(store));
    return std::pair<Peer, State>{Peer(std::move(shared), cfg), std::move(state)};
}

Peer::Peer(std::shared_ptr<detail::Shared> s, Config c)
    : shared(std::move(s))
    , cfg(std::move(c))
{
}

namespace
{

net::awaitable<void> run_loop(std::shared_ptr<detail::Shared> self, std::chrono::seconds heartbeat)
{
    net::steady_timer timer(co_await net::this_coro::executor);

    self->running.store(true, std::memory_order_release);
    LOG_INFO("Peer {} running", self->peer_id);

    // Shutdown is polled at a short tick so it takes effect well before the next heartbeat
    constexpr auto tick = std::chrono::milliseconds(50);
    auto next_beat = std::chrono::steady_clock::now() + heartbeat;
    while (!self->stop_requested.load(std::memory_order_acquire))
    {
        timer.expires_after(tick);
        auto [ec] = co_await timer.async_wait(net::as_tuple(net::use_awaitable));
        if (ec)
        {
            LOG_WARN("Peer {} timer error: {}", self->peer_id, ec.message());
            break;
        }
        if (std::chrono::steady_clock::now() >= next_beat)
        {
            self->heartbeats.fetch_add(1, std::memory_order_relaxed);
            LOG_DEBUG("Peer {} heartbeat", self->peer_id);
            next_beat += heartbeat;
        }
    }

    self->running.store(false, std::memory_order_release);
    LOG_INFO("Peer {} stopped", self->peer_id);
}

} // namespace

net::awaitable<void> Peer::run()
{
    return run_loop(shared, cfg.heartbeat);
}

} // namespace peer
