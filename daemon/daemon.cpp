#include "daemon.hpp"
#include "crypto/argon2_kdf.hpp"
#include "keystore/file_keystore.hpp"
#include "keystore/memory_keystore.hpp"
#include "logger.hpp"
#include "peer/peer.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

std::expected<std::unique_ptr<Daemon>, std::string> Daemon::create(net::io_context& io, const Config& config)
{
    auto kv = store::Store::open(config.store().path);
    if (!kv)
    {
        return std::unexpected(kv.error());
    }

    std::shared_ptr<keystore::Keystore> ks;
    if (config.runtime().test)
    {
        LOG_WARN("Test mode: keystore is held in memory and lost on exit");
        ks = std::make_shared<keystore::MemoryKeystore>();
    }
    else
    {
        auto cost = crypto::Argon2Kdf::cost_from_name(config.keystore().kdf);
        if (!cost)
        {
            return std::unexpected(cost.error());
        }
        auto file_ks = keystore::FileKeystore::open(config.keystore().path, *cost);
        if (!file_ks)
        {
            return std::unexpected(file_ks.error());
        }
        ks = std::move(*file_ks);
    }

    auto tp = std::make_shared<ThreadPool>(config.runtime().blocking_threads);
    LOG_INFO("ThreadPool initialized with {} threads", tp->size());

    return std::unique_ptr<Daemon>(new Daemon(io, config, std::move(tp), std::move(*kv), std::move(ks),
                                              std::make_shared<service::Manager>()));
}

Daemon::Daemon(net::io_context& io, const Config& config,
               std::shared_ptr<ThreadPool> tp,
               std::shared_ptr<store::Store> store,
               std::shared_ptr<keystore::Keystore> keystore,
               std::shared_ptr<service::Manager> mgr)
    : io_ctx(io)
    , cfg(config)
    , pool(std::move(tp))
    , kv(std::move(store))
    , ks(std::move(keystore))
    , manager(std::move(mgr))
    , cell(session::Sealed{
          .store = kv,
          .test = cfg.runtime().test,
          .service_handle = service::Handle(manager),
          .auth_token = std::make_shared<session::TokenGuard>(),
          .keystore = ks,
          .blocking = pool,
      })
{
}

Daemon::~Daemon()
{
    shutdown();
}

net::awaitable<session::TransitionResult> Daemon::init(keystore::Passphrase passphrase)
{
    auto ctx = co_await cell.current();
    auto result = co_await ctx.create_key(std::move(passphrase));
    if (result)
    {
        co_await activate();
    }
    co_return result;
}

net::awaitable<session::TransitionResult> Daemon::unseal(keystore::Passphrase passphrase)
{
    auto ctx = co_await cell.current();
    auto result = co_await ctx.unseal_keystore(std::move(passphrase));
    if (result)
    {
        co_await activate();
    }
    co_return result;
}

net::awaitable<bool> Daemon::check(std::optional<session::Token> token)
{
    auto ctx = co_await cell.current();
    co_return co_await ctx.check_auth_token(std::move(token));
}

net::awaitable<std::expected<bool, keystore::Error>> Daemon::has_key()
{
    auto keystore = ks;
    co_return co_await pool->spawn_blocking([keystore] { return keystore->has_key(); }, "inspect keystore");
}

net::awaitable<void> Daemon::activate()
{
    auto key = manager->secret_key();
    if (!key)
    {
        co_return;
    }

    peer::Config peer_cfg{cfg.peer().root, cfg.peer().heartbeat};
    auto promoted = co_await cell.promote(
        [this, &key, &peer_cfg](session::Sealed sealed) -> std::expected<session::Unsealed, std::string>
        {
            auto created = peer::Peer::create(*key, peer_cfg, sealed.store);
            if (!created)
            {
                return std::unexpected(created.error());
            }

            auto& [p, state] = *created;
            {
                std::lock_guard lock(peer_mtx);
                peer_ctl = p.control();
            }
            net::co_spawn(io_ctx, p.run(), net::detached);
            return std::move(sealed).into_unsealed(p.control(), std::move(state));
        });

    if (!promoted)
    {
        LOG_ERROR("Keystore unsealed but peer could not start: {}", promoted.error());
    }
}

void Daemon::shutdown()
{
    {
        std::lock_guard lock(peer_mtx);
        peer_ctl.shutdown();
    }
    pool->stop();
}
