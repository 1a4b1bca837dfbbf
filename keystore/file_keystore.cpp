#include "keystore/file_keystore.hpp"
#include "logger.hpp"

namespace keystore
{

std::expected<std::shared_ptr<FileKeystore>, std::string> FileKeystore::open(
    std::string_view path,
    crypto::Argon2Kdf::Cost cost)
{
    auto db = store::Store::open(path);
    if (!db)
    {
        return std::unexpected(db.error());
    }
    return std::shared_ptr<FileKeystore>(new FileKeystore(std::move(*db), cost));
}

FileKeystore::FileKeystore(std::shared_ptr<store::Store> s, crypto::Argon2Kdf::Cost cost)
    : db(std::move(s))
    , kdf_cost(cost)
{
}

KeyResult FileKeystore::get(Passphrase passphrase)
{
    auto blob = db->get(entry);
    if (!blob)
    {
        LOG_ERROR("Keystore read failed: {}", blob.error());
        return std::unexpected(Error::BackendUnavailable);
    }
    if (!blob->has_value())
    {
        return std::unexpected(Error::NoKeyPresent);
    }

    auto sealed = SealedKey::parse(**blob);
    if (!sealed)
    {
        return std::unexpected(sealed.error());
    }
    return keystore::open(*sealed, passphrase.unsecure());
}

KeyResult FileKeystore::create_key(Passphrase passphrase)
{
    auto present = has_key();
    if (!present)
    {
        return std::unexpected(present.error());
    }
    if (*present)
    {
        return std::unexpected(Error::KeyAlreadyExists);
    }

    auto key = crypto::SecretKey::generate();
    auto sealed = seal(key, passphrase.unsecure(), kdf_cost);
    if (!sealed)
    {
        return std::unexpected(sealed.error());
    }

    auto inserted = db->insert(entry, sealed->serialize());
    if (!inserted)
    {
        LOG_ERROR("Keystore write failed: {}", inserted.error());
        return std::unexpected(Error::BackendUnavailable);
    }
    if (!*inserted)
    {
        return std::unexpected(Error::KeyAlreadyExists);
    }

    LOG_INFO("Secret key created and sealed in keystore");
    return key;
}

std::expected<bool, Error> FileKeystore::has_key()
{
    auto blob = db->get(entry);
    if (!blob)
    {
        LOG_ERROR("Keystore read failed: {}", blob.error());
        return std::unexpected(Error::BackendUnavailable);
    }
    return blob->has_value();
}

} // namespace keystore
