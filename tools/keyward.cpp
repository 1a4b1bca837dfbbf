#include "config.hpp"
#include "crypto/argon2_kdf.hpp"
#include "daemon.hpp"
#include "logger.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>
#include <cstdlib>
#include <iostream>
#include <print>
#include <string>
#include <thread>
#include <vector>

namespace
{

void print_usage(const char* prog)
{
    std::println("Usage: {} [--config <file>] [--test] <command>", prog);
    std::println("Commands:");
    std::println("  init      Create a new secret key sealed with a passphrase");
    std::println("  unseal    Open the existing secret key");
    std::println("  status    Report whether a sealed key exists");
    std::println("The passphrase is read from KEYWARD_PASSPHRASE, or from stdin.");
}

std::optional<keystore::Passphrase> read_passphrase()
{
    if (const char* env = std::getenv("KEYWARD_PASSPHRASE"); env && *env)
    {
        return keystore::Passphrase(env);
    }

    std::string line;
    if (!std::getline(std::cin, line))
    {
        return std::nullopt;
    }
    return keystore::Passphrase(std::move(line));
}

net::awaitable<int> report(Daemon& daemon, const session::TransitionResult& result, std::string_view verb)
{
    if (!result)
    {
        std::println(stderr, "Failed to {}: {}", verb, keystore::to_string(result.error()));
        co_return 1;
    }

    auto ctx = co_await daemon.context();
    std::println("token: {}", *result);
    if (const auto* u = ctx.unsealed())
    {
        std::println("peer:  {}", u->state.peer_id());
    }
    co_return 0;
}

net::awaitable<int> cmd_init(Daemon& daemon, keystore::Passphrase pass)
{
    auto result = co_await daemon.init(std::move(pass));
    co_return co_await report(daemon, result, "create key");
}

net::awaitable<int> cmd_unseal(Daemon& daemon, keystore::Passphrase pass)
{
    auto result = co_await daemon.unseal(std::move(pass));
    co_return co_await report(daemon, result, "unseal keystore");
}

net::awaitable<int> cmd_status(Daemon& daemon)
{
    auto present = co_await daemon.has_key();
    if (!present)
    {
        std::println(stderr, "Failed to inspect keystore: {}", keystore::to_string(present.error()));
        co_return 1;
    }
    std::println("{}", *present ? "sealed key present" : "no key (run init)");
    co_return 0;
}

} // namespace

int main(int argc, char** argv)
{
    std::string config_path = "keyward.json";
    bool force_test = false;
    std::string cmd;

    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg == "--test")
        {
            force_test = true;
        }
        else if (cmd.empty())
        {
            cmd = arg;
        }
        else
        {
            print_usage(argv[0]);
            return 1;
        }
    }

    if (cmd != "init" && cmd != "unseal" && cmd != "status")
    {
        print_usage(argv[0]);
        return 1;
    }

    auto config = Config::load_or_defaults(config_path);
    if (force_test)
    {
        config.set_test(true);
    }

    auto log_cfg = config.logging();
    if (auto result = Logger::init(log_cfg.level, log_cfg.file, log_cfg.max_size_mb, log_cfg.enable_console);
        !result)
    {
        std::println(stderr, "Failed to initialize logger: {}", result.error());
        return 1;
    }

    std::optional<keystore::Passphrase> pass;
    if (cmd != "status")
    {
        pass = read_passphrase();
        if (!pass || !crypto::check_passphrase(pass->unsecure()))
        {
            std::println(stderr, "Passphrase too short (min 8 chars)");
            return 1;
        }
    }

    int rc = 1;
    try
    {
        net::io_context ic;
        auto daemon = Daemon::create(ic, config);
        if (!daemon)
        {
            LOG_ERROR("Failed to start: {}", daemon.error());
            Logger::shutdown();
            return 1;
        }
        auto& d = **daemon;

        auto run = [&]() -> net::awaitable<int>
        {
            int code = 0;
            if (cmd == "init")
            {
                code = co_await cmd_init(d, std::move(*pass));
            }
            else if (cmd == "unseal")
            {
                code = co_await cmd_unseal(d, std::move(*pass));
            }
            else
            {
                code = co_await cmd_status(d);
            }
            d.shutdown();
            co_return code;
        };

        auto fut = net::co_spawn(ic, run(), net::use_future);

        std::vector<std::jthread> threads;
        for (size_t i = 1; i < config.runtime().io_threads; ++i)
        {
            threads.emplace_back([&ic] { ic.run(); });
        }
        ic.run();
        threads.clear();

        rc = fut.get();
    }
    catch (const std::exception& e)
    {
        LOG_ERROR("Fatal: {}", e.what());
        Logger::shutdown();
        return 1;
    }

    Logger::shutdown();
    return rc;
}
