#pragma once

#include "keystore/keystore.hpp"
#include "keystore/sealed_key.hpp"
#include <mutex>
#include <optional>

namespace keystore
{

// Keeps the sealed key in process memory. Used for test mode.
class MemoryKeystore : public Keystore
{
public:
    explicit MemoryKeystore(crypto::Argon2Kdf::Cost cost = crypto::Argon2Kdf::minimal());

    KeyResult get(Passphrase passphrase) override;
    KeyResult create_key(Passphrase passphrase) override;
    std::expected<bool, Error> has_key() override;

private:
    crypto::Argon2Kdf::Cost kdf_cost;
    std::mutex mtx;
    std::optional<SealedKey> sealed;
};

} // namespace keystore
