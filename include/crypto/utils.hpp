#pragma once
#include <openssl/crypto.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace crypto
{

template<class T>
void secure_clear(T& cont)
{
    if constexpr (requires { cont.data(); cont.size(); })
    {
        OPENSSL_cleanse(cont.data(), cont.size() * sizeof(*cont.data()));
    }
    else
    {
        OPENSSL_cleanse(std::addressof(cont), sizeof(cont));
    }
}

// Throws std::runtime_error if libsodium cannot be initialized; nothing below works without it.
void ensure_sodium();

void random_bytes(std::span<uint8_t> out);

[[nodiscard]] std::string to_hex(std::span<const uint8_t> bytes);
[[nodiscard]] std::optional<std::vector<uint8_t>> from_hex(std::string_view hex);

// Constant-time for equal lengths; unequal lengths compare false immediately.
[[nodiscard]] bool equal_ct(std::string_view a, std::string_view b);

} // namespace crypto
