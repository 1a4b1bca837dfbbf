#pragma once

#include "concurrency/async_rwlock.hpp"
#include <boost/asio.hpp>
#include <optional>
#include <string>

namespace net = boost::asio;

namespace session
{

using Token = std::string;

/**
 * The single current bearer token. Readers share the lock; a replacement is exclusive,
 * so a reader sees either the previous token or the new one, never a partial write.
 */
class TokenGuard
{
public:
    static constexpr size_t token_bytes = 32;

    TokenGuard() = default;

    // Fresh token from the CSPRNG, replacing whatever was stored.
    net::awaitable<Token> generate_and_store();

    // An absent token never authenticates, even while nothing is stored.
    net::awaitable<bool> compare(std::optional<Token> presented);

    net::awaitable<std::optional<Token>> get();
    net::awaitable<void> set(std::optional<Token> token);

private:
    concurrency::AsyncRwLock lock;
    std::optional<Token> current;
};

[[nodiscard]] Token new_token();

} // namespace session
