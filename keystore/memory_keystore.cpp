#include "keystore/memory_keystore.hpp"

namespace keystore
{

MemoryKeystore::MemoryKeystore(crypto::Argon2Kdf::Cost cost)
    : kdf_cost(cost)
{
}

KeyResult MemoryKeystore::get(Passphrase passphrase)
{
    std::optional<SealedKey> snapshot;
    {
        std::lock_guard lock(mtx);
        snapshot = sealed;
    }

    if (!snapshot)
    {
        return std::unexpected(Error::NoKeyPresent);
    }
    return open(*snapshot, passphrase.unsecure());
}

KeyResult MemoryKeystore::create_key(Passphrase passphrase)
{
    {
        std::lock_guard lock(mtx);
        if (sealed)
        {
            return std::unexpected(Error::KeyAlreadyExists);
        }
    }

    auto key = crypto::SecretKey::generate();
    auto result = seal(key, passphrase.unsecure(), kdf_cost);
    if (!result)
    {
        return std::unexpected(result.error());
    }

    std::lock_guard lock(mtx);
    // Another create_key may have won while we were deriving
    if (sealed)
    {
        return std::unexpected(Error::KeyAlreadyExists);
    }
    sealed = std::move(*result);
    return key;
}

std::expected<bool, Error> MemoryKeystore::has_key()
{
    std::lock_guard lock(mtx);
    return sealed.has_value();
}

} // namespace keystore
