#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace crypto
{

/**
 * The long-lived service key guarded by the keystore. Wiped on destruction.
 */
class SecretKey
{
public:
    static constexpr size_t size = 32;
    using bytes_t = std::array<uint8_t, size>;

    SecretKey() = default;
    ~SecretKey();

    SecretKey(const SecretKey&) = default;
    SecretKey& operator=(const SecretKey&) = default;
    SecretKey(SecretKey&& other) noexcept;
    SecretKey& operator=(SecretKey&& other) noexcept;

    [[nodiscard]] static SecretKey generate();
    [[nodiscard]] static std::optional<SecretKey> from_bytes(std::span<const uint8_t> bytes);

    [[nodiscard]] std::span<const uint8_t> bytes() const { return key; }

    // Ed25519 public key derived with the secret key as seed, lowercase hex
    [[nodiscard]] std::string public_id() const;

    friend bool operator==(const SecretKey& a, const SecretKey& b);

private:
    bytes_t key{};
};

} // namespace crypto
