#pragma once

#include "keystore/keystore.hpp"
#include "keystore/sealed_key.hpp"
#include "store/store.hpp"
#include <expected>
#include <memory>
#include <string>

namespace keystore
{

/**
 * Sealed key persisted in a dedicated SQLite file.
 */
class FileKeystore : public Keystore
{
public:
    static constexpr std::string_view entry = "keystore/secret_key";

    [[nodiscard]] static std::expected<std::shared_ptr<FileKeystore>, std::string> open(
        std::string_view path,
        crypto::Argon2Kdf::Cost cost
    );

    KeyResult get(Passphrase passphrase) override;
    KeyResult create_key(Passphrase passphrase) override;
    std::expected<bool, Error> has_key() override;

private:
    FileKeystore(std::shared_ptr<store::Store> db, crypto::Argon2Kdf::Cost cost);

    std::shared_ptr<store::Store> db;
    crypto::Argon2Kdf::Cost kdf_cost;
};

} // namespace keystore
