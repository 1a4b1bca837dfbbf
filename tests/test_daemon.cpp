#include <catch2/catch_test_macros.hpp>

#include "daemon.hpp"
#include "helpers/test_support.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>

using keystore::Error;
using keystore::Passphrase;
using test_support::TempDir;

namespace
{

constexpr auto pass = "daemon passphrase";

Config make_config(const TempDir& dir, bool test)
{
    auto path = (dir.path / "keyward.json").string();
    std::ofstream f(path);
    f << std::format(R"({{
        "runtime": {{"blocking_threads": 2, "test": {}}},
        "store": {{"path": "{}"}},
        "keystore": {{"path": "{}", "kdf": "minimal"}},
        "peer": {{"root": "{}", "heartbeat_sec": 1}},
        "logging": {{"level": "warn"}}
    }})",
        test ? "true" : "false",
        (dir.path / "store.db").string(),
        (dir.path / "keystore.db").string(),
        (dir.path / "peer").string());
    f.close();

    auto cfg = Config::load(path);
    if (!cfg)
    {
        throw std::runtime_error(cfg.error());
    }
    return *cfg;
}

std::unique_ptr<Daemon> make_daemon(net::io_context& io, const Config& cfg)
{
    auto d = Daemon::create(io, cfg);
    if (!d)
    {
        throw std::runtime_error(d.error());
    }
    return std::move(*d);
}

net::awaitable<bool> wait_for(std::function<bool()> pred, std::chrono::milliseconds limit = std::chrono::seconds(5))
{
    net::steady_timer timer(co_await net::this_coro::executor);
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (!pred())
    {
        if (std::chrono::steady_clock::now() >= deadline)
        {
            co_return false;
        }
        timer.expires_after(std::chrono::milliseconds(10));
        co_await timer.async_wait(net::use_awaitable);
    }
    co_return true;
}

// Runs body on io with two threads and rethrows anything it threw.
void drive(net::io_context& io, std::function<net::awaitable<void>()> body)
{
    auto fut = net::co_spawn(io, std::move(body), net::use_future);
    test_support::run_io(io, 2);
    fut.get();
}

}

TEST_CASE("Daemon in test mode unseals and starts the peer on init")
{
    TempDir dir;
    auto cfg = make_config(dir, true);
    net::io_context io;
    auto daemon = make_daemon(io, cfg);

    bool started = false;
    bool stopped = false;
    std::optional<session::TransitionResult> token;
    std::optional<session::TransitionResult> again;
    bool valid = false;
    bool absent = true;
    std::string peer_id;

    drive(io, [&]() -> net::awaitable<void>
    {
        token = co_await daemon->init(Passphrase(pass));
        if (token->has_value())
        {
            valid = co_await daemon->check(**token);
        }
        absent = co_await daemon->check(std::nullopt);

        auto ctx = co_await daemon->context();
        if (const auto* u = ctx.unsealed())
        {
            peer_id = u->state.peer_id();
            auto ctl = u->peer_control;
            started = co_await wait_for([ctl] { return ctl.is_running(); });

            again = co_await daemon->init(Passphrase(pass));

            daemon->shutdown();
            stopped = co_await wait_for([ctl] { return !ctl.is_running(); });
        }
        else
        {
            daemon->shutdown();
        }
    });

    REQUIRE(token.has_value());
    REQUIRE(token->has_value());
    CHECK(valid);
    CHECK_FALSE(absent);
    CHECK(peer_id.size() == 64);
    CHECK(started);
    CHECK(stopped);
    CHECK(daemon->service().installs() == 1);
    CHECK(peer_id == daemon->service().secret_key()->public_id());

    REQUIRE(again.has_value());
    REQUIRE_FALSE(again->has_value());
    CHECK(again->error() == Error::KeyAlreadyExists);
}

TEST_CASE("Daemon peer emits heartbeats until shut down")
{
    TempDir dir;
    auto cfg = make_config(dir, true);
    net::io_context io;
    auto daemon = make_daemon(io, cfg);

    bool beat = false;
    bool stopped = false;
    uint64_t beats_at_stop = 0;
    uint64_t beats_after = 0;

    drive(io, [&]() -> net::awaitable<void>
    {
        auto token = co_await daemon->init(Passphrase(pass));
        auto ctx = co_await daemon->context();
        if (!token || !ctx.unsealed())
        {
            daemon->shutdown();
            co_return;
        }

        auto ctl = ctx.unsealed()->peer_control;
        beat = co_await wait_for([ctl] { return ctl.heartbeats() >= 1; });

        daemon->shutdown();
        stopped = co_await wait_for([ctl] { return !ctl.is_running(); });
        beats_at_stop = ctl.heartbeats();

        net::steady_timer idle(co_await net::this_coro::executor);
        idle.expires_after(std::chrono::milliseconds(1200));
        co_await idle.async_wait(net::use_awaitable);
        beats_after = ctl.heartbeats();
    });

    CHECK(beat);
    CHECK(stopped);
    CHECK(beats_at_stop >= 1);
    CHECK(beats_after == beats_at_stop);
}

TEST_CASE("Daemon unseal before init reports NoKeyPresent and stays sealed")
{
    TempDir dir;
    auto cfg = make_config(dir, false);
    net::io_context io;
    auto daemon = make_daemon(io, cfg);

    std::optional<session::TransitionResult> result;
    std::optional<std::expected<bool, Error>> present;
    bool sealed = false;

    drive(io, [&]() -> net::awaitable<void>
    {
        present = co_await daemon->has_key();
        result = co_await daemon->unseal(Passphrase(pass));
        sealed = (co_await daemon->context()).is_sealed();
        daemon->shutdown();
    });

    REQUIRE(present.has_value());
    CHECK(*present == false);
    REQUIRE(result.has_value());
    REQUIRE_FALSE(result->has_value());
    CHECK(result->error() == Error::NoKeyPresent);
    CHECK(sealed);
    CHECK(daemon->service().installs() == 0);
}

TEST_CASE("Daemon reopens a persisted key with the same peer identity")
{
    TempDir dir;
    auto cfg = make_config(dir, false);
    std::string first_id;

    {
        net::io_context io;
        auto daemon = make_daemon(io, cfg);

        drive(io, [&]() -> net::awaitable<void>
        {
            auto token = co_await daemon->init(Passphrase(pass));
            if (token)
            {
                auto ctx = co_await daemon->context();
                if (const auto* u = ctx.unsealed())
                {
                    first_id = u->state.peer_id();
                }
            }
            daemon->shutdown();
        });
    }
    REQUIRE_FALSE(first_id.empty());

    net::io_context io;
    auto daemon = make_daemon(io, cfg);

    std::optional<session::TransitionResult> wrong;
    bool sealed_after_wrong = false;
    std::optional<session::TransitionResult> right;
    std::string second_id;
    bool valid = false;
    std::optional<std::expected<bool, Error>> present;

    drive(io, [&]() -> net::awaitable<void>
    {
        present = co_await daemon->has_key();

        wrong = co_await daemon->unseal(Passphrase("not the daemon passphrase"));
        sealed_after_wrong = (co_await daemon->context()).is_sealed();

        right = co_await daemon->unseal(Passphrase(pass));
        if (right->has_value())
        {
            valid = co_await daemon->check(**right);
        }
        auto ctx = co_await daemon->context();
        if (const auto* u = ctx.unsealed())
        {
            second_id = u->state.peer_id();
        }
        daemon->shutdown();
    });

    REQUIRE(present.has_value());
    CHECK(*present == true);
    REQUIRE(wrong.has_value());
    REQUIRE_FALSE(wrong->has_value());
    CHECK(wrong->error() == Error::WrongPassphrase);
    CHECK(sealed_after_wrong);

    REQUIRE(right.has_value());
    REQUIRE(right->has_value());
    CHECK(valid);
    CHECK(second_id == first_id);

    auto recorded = test_support::open_store(dir)->get("peer/id");
    REQUIRE(recorded.has_value());
    CHECK(recorded->value_or("") == first_id);
}

TEST_CASE("Daemon re-unseal rotates the token and keeps the running peer")
{
    TempDir dir;
    auto cfg = make_config(dir, true);
    net::io_context io;
    auto daemon = make_daemon(io, cfg);

    std::optional<session::TransitionResult> first;
    std::optional<session::TransitionResult> second;
    bool first_valid = true;
    bool second_valid = false;
    std::string id_before;
    std::string id_after;

    drive(io, [&]() -> net::awaitable<void>
    {
        first = co_await daemon->init(Passphrase(pass));
        if (auto ctx = co_await daemon->context(); ctx.unsealed())
        {
            id_before = ctx.unsealed()->state.peer_id();
        }

        second = co_await daemon->unseal(Passphrase(pass));
        if (auto ctx = co_await daemon->context(); ctx.unsealed())
        {
            id_after = ctx.unsealed()->state.peer_id();
        }

        if (first->has_value() && second->has_value())
        {
            first_valid = co_await daemon->check(**first);
            second_valid = co_await daemon->check(**second);
        }
        daemon->shutdown();
    });

    REQUIRE(first.has_value());
    REQUIRE(first->has_value());
    REQUIRE(second.has_value());
    REQUIRE(second->has_value());
    CHECK_FALSE(first_valid);
    CHECK(second_valid);
    CHECK_FALSE(id_before.empty());
    CHECK(id_before == id_after);
    CHECK(daemon->service().installs() == 2);
}

TEST_CASE("Daemon::create fails when the store cannot be opened")
{
    TempDir dir;
    auto cfg = make_config(dir, true);
    cfg.set_paths((dir.path / "missing" / "store.db").string(), cfg.keystore().path, cfg.peer().root);
    net::io_context io;

    auto daemon = Daemon::create(io, cfg);

    CHECK_FALSE(daemon.has_value());
}
