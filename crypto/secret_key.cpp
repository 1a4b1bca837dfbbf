#include "crypto/secret_key.hpp"
#include "crypto/utils.hpp"

#include <sodium.h>
#include <algorithm>
#include <stdexcept>

namespace crypto
{

SecretKey::~SecretKey()
{
    secure_clear(key);
}

SecretKey::SecretKey(SecretKey&& other) noexcept
    : key(other.key)
{
    secure_clear(other.key);
}

SecretKey& SecretKey::operator=(SecretKey&& other) noexcept
{
    if (this != &other)
    {
        key = other.key;
        secure_clear(other.key);
    }
    return *this;
}

SecretKey SecretKey::generate()
{
    SecretKey sk;
    random_bytes(sk.key);
    return sk;
}

std::optional<SecretKey> SecretKey::from_bytes(std::span<const uint8_t> bytes)
{
    if (bytes.size() != size)
    {
        return std::nullopt;
    }
    SecretKey sk;
    std::ranges::copy(bytes, sk.key.begin());
    return sk;
}

std::string SecretKey::public_id() const
{
    ensure_sodium();

    std::array<uint8_t, crypto_sign_PUBLICKEYBYTES> pk{};
    std::array<uint8_t, crypto_sign_SECRETKEYBYTES> sk{};
    static_assert(crypto_sign_SEEDBYTES == size);

    if (crypto_sign_seed_keypair(pk.data(), sk.data(), key.data()) != 0)
    {
        secure_clear(sk);
        throw std::runtime_error("Failed to derive peer identity");
    }
    secure_clear(sk);
    return to_hex(pk);
}

bool operator==(const SecretKey& a, const SecretKey& b)
{
    return sodium_memcmp(a.key.data(), b.key.data(), SecretKey::size) == 0;
}

} // namespace crypto
