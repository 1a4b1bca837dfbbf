#pragma once

#include "keystore/keystore.hpp"
#include "crypto/aesgcm256.hpp"
#include "crypto/argon2_kdf.hpp"
#include <boost/json.hpp>
#include <expected>
#include <string>

namespace json = boost::json;

namespace keystore
{

/**
 * A secret key encrypted under an Argon2id-derived key. The KDF cost travels
 * with the blob so it can be opened regardless of the current configuration.
 */
struct SealedKey
{
    static constexpr int64_t version = 1;

    crypto::Argon2Kdf::Cost cost{};
    crypto::Argon2Kdf::salt_t salt{};
    crypto::AES256GCM::nonce_t nonce{};
    crypto::AES256GCM::ciphertext_t ct;

    [[nodiscard]] std::string serialize() const;
    [[nodiscard]] static std::expected<SealedKey, Error> parse(std::string_view blob);
};

[[nodiscard]] std::expected<SealedKey, Error> seal(const crypto::SecretKey& key,
                                                  std::string_view passphrase,
                                                  crypto::Argon2Kdf::Cost cost);

[[nodiscard]] KeyResult open(const SealedKey& sealed, std::string_view passphrase);

} // namespace keystore
