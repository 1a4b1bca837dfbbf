#pragma once

#include "keystore/keystore.hpp"
#include "peer/peer.hpp"
#include "service/handle.hpp"
#include "session/token_guard.hpp"
#include "store/store.hpp"
#include "threadpool/threadpool.hpp"
#include <boost/asio.hpp>
#include <expected>
#include <memory>
#include <optional>
#include <string_view>
#include <variant>

namespace net = boost::asio;

namespace session
{

using AuthError = keystore::Error;
using TransitionResult = std::expected<Token, AuthError>;

struct Unsealed;

/// Dependencies available before the keystore has been unlocked.
struct Sealed
{
    /// Persistent session state and cache.
    std::shared_ptr<store::Store> store;
    /// Set when the stack runs in test mode.
    bool test = false;
    /// Receives the secret key once it is obtained.
    service::Handle service_handle = service::Handle::dummy();
    /// Bearer token issued on unsealing.
    std::shared_ptr<TokenGuard> auth_token;
    /// Sealed secret key storage.
    std::shared_ptr<keystore::Keystore> keystore;
    /// Pool for key derivation, kept off the request executor.
    std::shared_ptr<ThreadPool> blocking;

    /// The only way to obtain an Unsealed context. Shared handles carry over, nothing is duplicated.
    [[nodiscard]] Unsealed into_unsealed(peer::PeerControl peer_control, peer::State state) &&;
};

/// Dependencies available once the peer runtime is up.
struct Unsealed
{
    /// Controls the running peer.
    peer::PeerControl peer_control;
    /// Local monorepo state of the peer.
    peer::State state;

    std::shared_ptr<store::Store> store;
    bool test = false;
    service::Handle service_handle = service::Handle::dummy();
    std::shared_ptr<TokenGuard> auth_token;
    std::shared_ptr<keystore::Keystore> keystore;
    std::shared_ptr<ThreadPool> blocking;

private:
    Unsealed() = default;
    friend struct Sealed;
};

/**
 * Dependencies handed to request handlers. Exactly one variant is active;
 * the peer handles are only reachable while unsealed.
 *
 * Coroutine members reference *this: keep the context alive until they complete.
 */
class Context
{
public:
    Context(Sealed sealed) : inner(std::move(sealed)) {}
    Context(Unsealed unsealed) : inner(std::move(unsealed)) {}

    [[nodiscard]] bool test() const;
    [[nodiscard]] const std::shared_ptr<store::Store>& store() const;
    [[nodiscard]] std::shared_ptr<TokenGuard> auth_token() const;
    [[nodiscard]] service::Handle& service_handle();

    [[nodiscard]] bool is_sealed() const { return std::holds_alternative<Sealed>(inner); }
    [[nodiscard]] const Sealed* sealed() const { return std::get_if<Sealed>(&inner); }
    [[nodiscard]] const Unsealed* unsealed() const { return std::get_if<Unsealed>(&inner); }

    /**
     * Open the stored key with passphrase, install it into the service and issue a new auth token.
     *
     * Fails with WrongPassphrase, BackendUnavailable or NoKeyPresent.
     * Throws TaskAborted if the derivation task never completed.
     */
    net::awaitable<TransitionResult> unseal_keystore(keystore::Passphrase passphrase);

    /**
     * Create a key sealed with passphrase, install it and issue a new auth token.
     *
     * Fails with KeyAlreadyExists or BackendUnavailable.
     * Throws TaskAborted if the creation task never completed.
     */
    net::awaitable<TransitionResult> create_key(keystore::Passphrase passphrase);

    net::awaitable<bool> check_auth_token(std::optional<Token> token) const;

private:
    using KeystoreOp = keystore::KeyResult (keystore::Keystore::*)(keystore::Passphrase);

    net::awaitable<TransitionResult> transition(KeystoreOp op,
                                                keystore::Passphrase passphrase,
                                                std::string_view what);

    [[nodiscard]] std::shared_ptr<keystore::Keystore> keystore() const;
    [[nodiscard]] std::shared_ptr<ThreadPool> blocking() const;

    std::variant<Sealed, Unsealed> inner;
};

} // namespace session
