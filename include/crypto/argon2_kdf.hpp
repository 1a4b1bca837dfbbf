#pragma once

#include "crypto/aesgcm256.hpp"
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace crypto
{

/**
 * Argon2id key derivation (libsodium crypto_pwhash) producing a key-encryption key.
 */
class Argon2Kdf
{
public:
    static constexpr size_t salt_len = 16;

    using salt_t = std::array<uint8_t, salt_len>;

    struct Cost
    {
        uint64_t ops;
        size_t mem;

        friend bool operator==(const Cost&, const Cost&) = default;
    };

    [[nodiscard]] static Cost minimal();
    [[nodiscard]] static Cost interactive();
    [[nodiscard]] static Cost moderate();
    [[nodiscard]] static Cost sensitive();

    // "interactive", "moderate", "sensitive" or "minimal"
    [[nodiscard]] static std::expected<Cost, std::string> cost_from_name(std::string_view name);

    [[nodiscard]] static salt_t new_salt();

    [[nodiscard]] static std::expected<AES256GCM::key_t, std::string> derive(
        std::string_view passphrase,
        std::span<const uint8_t> salt,
        Cost cost
    );
};

[[nodiscard]] bool check_passphrase(std::string_view passphrase);

} // namespace crypto
