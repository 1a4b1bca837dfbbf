#include "crypto/utils.hpp"

#include <sodium.h>
#include <stdexcept>

namespace crypto
{

void ensure_sodium()
{
    if (sodium_init() < 0)
    {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

void random_bytes(std::span<uint8_t> out)
{
    ensure_sodium();
    randombytes_buf(out.data(), out.size());
}

std::string to_hex(std::span<const uint8_t> bytes)
{
    std::string hex(bytes.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
    hex.pop_back();
    return hex;
}

std::optional<std::vector<uint8_t>> from_hex(std::string_view hex)
{
    if (hex.size() % 2 != 0)
    {
        return std::nullopt;
    }

    std::vector<uint8_t> out(hex.size() / 2);
    size_t bin_len = 0;
    const char* end = nullptr;
    if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr, &bin_len, &end) != 0 ||
        bin_len != out.size() || end != hex.data() + hex.size())
    {
        return std::nullopt;
    }
    return out;
}

bool equal_ct(std::string_view a, std::string_view b)
{
    if (a.size() != b.size())
    {
        return false;
    }
    if (a.empty())
    {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace crypto
