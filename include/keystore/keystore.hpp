#pragma once

#include "crypto/secret_key.hpp"
#include <expected>
#include <string>
#include <string_view>
#include <cstdint>

namespace keystore
{

enum class Error : uint8_t
{
    WrongPassphrase,
    NoKeyPresent,
    KeyAlreadyExists,
    BackendUnavailable,
};

[[nodiscard]] std::string_view to_string(Error e);

/**
 * Operator passphrase. The buffer is wiped when the object dies,
 * including moved-from shells.
 */
class Passphrase
{
public:
    Passphrase() = default;
    explicit Passphrase(std::string value) : secret(std::move(value)) {}
    ~Passphrase();

    Passphrase(const Passphrase&) = delete;
    Passphrase& operator=(const Passphrase&) = delete;
    Passphrase(Passphrase&& other) noexcept;
    Passphrase& operator=(Passphrase&& other) noexcept;

    [[nodiscard]] std::string_view unsecure() const { return secret; }
    [[nodiscard]] size_t size() const { return secret.size(); }

private:
    void wipe();

    std::string secret;
};

using KeyResult = std::expected<crypto::SecretKey, Error>;

/**
 * Storage for the passphrase-sealed secret key.
 * Implementations must be safe to call from several pool threads at once.
 * Both calls are CPU-bound (key derivation) and belong on the blocking pool.
 */
class Keystore
{
public:
    virtual ~Keystore() = default;

    // WrongPassphrase, NoKeyPresent or BackendUnavailable on failure
    [[nodiscard]] virtual KeyResult get(Passphrase passphrase) = 0;

    // KeyAlreadyExists or BackendUnavailable on failure
    [[nodiscard]] virtual KeyResult create_key(Passphrase passphrase) = 0;

    [[nodiscard]] virtual std::expected<bool, Error> has_key() = 0;
};

} // namespace keystore
