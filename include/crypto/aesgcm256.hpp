#pragma once
#include <openssl/evp.h>
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace crypto
{

/**
 * AES-256-GCM over OpenSSL EVP. Used to wrap the secret key under a passphrase-derived key.
 */
class AES256GCM
{
public:
    static constexpr size_t key_sz = 32;
    static constexpr size_t nonce_sz = 12;
    static constexpr size_t tag_sz = 16;

    using key_t = std::array<uint8_t, key_sz>;
    using nonce_t = std::array<uint8_t, nonce_sz>;
    using tag_t = std::array<uint8_t, tag_sz>;
    using data_t = std::vector<uint8_t>;

    struct ciphertext_t
    {
        data_t data;
        tag_t tag;
    };

    static std::optional<ciphertext_t> encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> aad = {}
    );

    // nullopt on authentication failure as well as on malformed input
    static std::optional<data_t> decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        const ciphertext_t& ct,
        std::span<const uint8_t> aad = {}
    );

private:
    static bool chk_sz(std::span<const uint8_t> key, std::span<const uint8_t> nonce);
};

} // namespace crypto
