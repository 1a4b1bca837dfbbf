#include "session/token_guard.hpp"
#include "crypto/utils.hpp"

#include <array>

namespace session
{

Token new_token()
{
    std::array<uint8_t, TokenGuard::token_bytes> raw{};
    crypto::random_bytes(raw);
    auto token = crypto::to_hex(raw);
    crypto::secure_clear(raw);
    return token;
}

net::awaitable<Token> TokenGuard::generate_and_store()
{
    auto token = new_token();
    auto guard = co_await lock.write();
    current = token;
    co_return token;
}

net::awaitable<bool> TokenGuard::compare(std::optional<Token> presented)
{
    if (!presented)
    {
        co_return false;
    }

    auto guard = co_await lock.read();
    co_return current.has_value() && crypto::equal_ct(*current, *presented);
}

net::awaitable<std::optional<Token>> TokenGuard::get()
{
    auto guard = co_await lock.read();
    co_return current;
}

net::awaitable<void> TokenGuard::set(std::optional<Token> token)
{
    auto guard = co_await lock.write();
    current = std::move(token);
}

} // namespace session
