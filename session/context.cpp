#include "session/context.hpp"
#include "logger.hpp"

namespace session
{

Unsealed Sealed::into_unsealed(peer::PeerControl peer_control, peer::State state) &&
{
    Unsealed u;
    u.peer_control = std::move(peer_control);
    u.state = std::move(state);
    u.store = std::move(store);
    u.test = test;
    u.service_handle = std::move(service_handle);
    u.auth_token = std::move(auth_token);
    u.keystore = std::move(keystore);
    u.blocking = std::move(blocking);
    return u;
}

bool Context::test() const
{
    return std::visit([](const auto& v) { return v.test; }, inner);
}

const std::shared_ptr<store::Store>& Context::store() const
{
    return std::visit([](const auto& v) -> const std::shared_ptr<store::Store>& { return v.store; }, inner);
}

std::shared_ptr<TokenGuard> Context::auth_token() const
{
    return std::visit([](const auto& v) { return v.auth_token; }, inner);
}

service::Handle& Context::service_handle()
{
    return std::visit([](auto& v) -> service::Handle& { return v.service_handle; }, inner);
}

std::shared_ptr<keystore::Keystore> Context::keystore() const
{
    return std::visit([](const auto& v) { return v.keystore; }, inner);
}

std::shared_ptr<ThreadPool> Context::blocking() const
{
    return std::visit([](const auto& v) { return v.blocking; }, inner);
}

net::awaitable<TransitionResult> Context::unseal_keystore(keystore::Passphrase passphrase)
{
    return transition(&keystore::Keystore::get, std::move(passphrase), "unseal key");
}

net::awaitable<TransitionResult> Context::create_key(keystore::Passphrase passphrase)
{
    return transition(&keystore::Keystore::create_key, std::move(passphrase), "create key");
}

net::awaitable<TransitionResult> Context::transition(KeystoreOp op,
                                                     keystore::Passphrase passphrase,
                                                     std::string_view what)
{
    auto ks = keystore();
    auto pool = blocking();

    auto key = co_await pool->spawn_blocking(
        [ks, op, pass = std::move(passphrase)]() mutable
        {
            return ((*ks).*op)(std::move(pass));
        },
        what);

    if (!key)
    {
        LOG_WARN("Task to {} failed: {}", what, keystore::to_string(key.error()));
        co_return std::unexpected(key.error());
    }

    // Key first, then the token: nobody can authenticate before the key is in place
    service_handle().set_secret_key(std::move(*key));
    auto token = co_await auth_token()->generate_and_store();

    LOG_INFO("Task to {} succeeded, new auth token issued", what);
    co_return token;
}

net::awaitable<bool> Context::check_auth_token(std::optional<Token> token) const
{
    auto guard = auth_token();
    co_return co_await guard->compare(std::move(token));
}

} // namespace session
