#include "crypto/argon2_kdf.hpp"
#include "crypto/utils.hpp"

#include <sodium.h>
#include <format>

namespace crypto
{

Argon2Kdf::Cost Argon2Kdf::minimal()
{
    return {crypto_pwhash_OPSLIMIT_MIN, crypto_pwhash_MEMLIMIT_MIN};
}

Argon2Kdf::Cost Argon2Kdf::interactive()
{
    return {crypto_pwhash_OPSLIMIT_INTERACTIVE, crypto_pwhash_MEMLIMIT_INTERACTIVE};
}

Argon2Kdf::Cost Argon2Kdf::moderate()
{
    return {crypto_pwhash_OPSLIMIT_MODERATE, crypto_pwhash_MEMLIMIT_MODERATE};
}

Argon2Kdf::Cost Argon2Kdf::sensitive()
{
    return {crypto_pwhash_OPSLIMIT_SENSITIVE, crypto_pwhash_MEMLIMIT_SENSITIVE};
}

std::expected<Argon2Kdf::Cost, std::string> Argon2Kdf::cost_from_name(std::string_view name)
{
    if (name == "interactive") return interactive();
    if (name == "moderate") return moderate();
    if (name == "sensitive") return sensitive();
    if (name == "minimal") return minimal();
    return std::unexpected(std::format("Unknown kdf cost '{}'", name));
}

Argon2Kdf::salt_t Argon2Kdf::new_salt()
{
    static_assert(salt_len == crypto_pwhash_SALTBYTES);
    salt_t salt{};
    random_bytes(salt);
    return salt;
}

std::expected<AES256GCM::key_t, std::string> Argon2Kdf::derive(
    std::string_view passphrase,
    std::span<const uint8_t> salt,
    Cost cost)
{
    if (sodium_init() < 0)
    {
        return std::unexpected("Failed to initialize libsodium");
    }

    if (salt.size() != salt_len)
    {
        return std::unexpected("Invalid salt length");
    }

    if (cost.ops < crypto_pwhash_OPSLIMIT_MIN || cost.mem < crypto_pwhash_MEMLIMIT_MIN)
    {
        return std::unexpected("Kdf cost below minimum");
    }

    AES256GCM::key_t kek{};
    int result = crypto_pwhash(
        kek.data(), kek.size(),
        passphrase.data(), passphrase.size(),
        salt.data(),
        cost.ops,
        cost.mem,
        crypto_pwhash_ALG_ARGON2ID13
    );

    if (result != 0)
    {
        secure_clear(kek);
        return std::unexpected("Key derivation failed (out of memory?)");
    }

    return kek;
}

bool check_passphrase(std::string_view passphrase)
{
    return passphrase.size() >= 8;
}

} // namespace crypto
