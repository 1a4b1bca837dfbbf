#pragma once

#include "crypto/secret_key.hpp"
#include "store/store.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>

namespace net = boost::asio;

namespace peer
{

struct Config
{
    std::filesystem::path root;
    std::chrono::seconds heartbeat{30};
};

namespace detail
{
struct Shared
{
    std::string peer_id;
    std::atomic<bool> running{false};
    std::atomic<bool> stop_requested{false};
    std::atomic<uint64_t> heartbeats{0};
};
}

// Inspect and stop a running Peer from any thread.
class PeerControl
{
public:
    PeerControl() = default;
    explicit PeerControl(std::shared_ptr<detail::Shared> s) : shared(std::move(s)) {}

    [[nodiscard]] std::string_view peer_id() const;
    [[nodiscard]] bool is_running() const;
    [[nodiscard]] uint64_t heartbeats() const;
    void shutdown();

private:
    std::shared_ptr<detail::Shared> shared;
};

// Local repository state owned by the unsealed peer.
class State
{
public:
    State() = default;
    State(std::string peer_id, std::filesystem::path monorepo, std::shared_ptr<store::Store> store);

    [[nodiscard]] const std::string& peer_id() const { return id; }
    [[nodiscard]] const std::filesystem::path& monorepo() const { return repo_path; }
    [[nodiscard]] const std::shared_ptr<store::Store>& store() const { return kv; }

private:
    std::string id;
    std::filesystem::path repo_path;
    std::shared_ptr<store::Store> kv;
};

class Peer
{
public:
    [[nodiscard]] static std::expected<std::pair<Peer, State>, std::string> create(
        const crypto::SecretKey& key,
        const Config& cfg,
        std::shared_ptr<store::Store> store
    );

    [[nodiscard]] PeerControl control() const { return PeerControl(shared); }

    // Heartbeat loop; returns once PeerControl::shutdown() is observed.
    // The returned coroutine shares state with the controls, not with this object.
    net::awaitable<void> run();

private:
    Peer(std::shared_ptr<detail::Shared> s, Config cfg);

    std::shared_ptr<detail::Shared> shared;
    Config cfg;
};

} // namespace peer
