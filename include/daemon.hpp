#pragma once

#include "config.hpp"
#include "keystore/keystore.hpp"
#include "peer/peer.hpp"
#include "service/handle.hpp"
#include "session/context_cell.hpp"
#include "store/store.hpp"
#include "threadpool/threadpool.hpp"
#include <boost/asio.hpp>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace net = boost::asio;

/**
 * Wires the store, keystore, service manager and blocking pool into a sealed context,
 * and brings the peer runtime up once a key has been installed.
 */
class Daemon
{
public:
    [[nodiscard]] static std::expected<std::unique_ptr<Daemon>, std::string> create(net::io_context& io, const Config& config);
    ~Daemon();

    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    net::awaitable<session::TransitionResult> init(keystore::Passphrase passphrase);
    net::awaitable<session::TransitionResult> unseal(keystore::Passphrase passphrase);
    net::awaitable<bool> check(std::optional<session::Token> token);

    net::awaitable<session::Context> context() { return cell.current(); }
    net::awaitable<std::expected<bool, keystore::Error>> has_key();

    void shutdown();

    [[nodiscard]] service::Manager& service() { return *manager; }

private:
    Daemon(net::io_context& io, const Config& config,
           std::shared_ptr<ThreadPool> tp,
           std::shared_ptr<store::Store> kv,
           std::shared_ptr<keystore::Keystore> ks,
           std::shared_ptr<service::Manager> mgr);

    // Starts the peer with the installed key and swaps the cell to Unsealed
    net::awaitable<void> activate();

    net::io_context& io_ctx;
    const Config cfg;
    std::shared_ptr<ThreadPool> pool;
    std::shared_ptr<store::Store> kv;
    std::shared_ptr<keystore::Keystore> ks;
    std::shared_ptr<service::Manager> manager;
    session::ContextCell cell;

    std::mutex peer_mtx;
    peer::PeerControl peer_ctl;
};
