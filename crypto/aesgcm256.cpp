#include "crypto/aesgcm256.hpp"
#include "crypto/utils.hpp"
#include <openssl/evp.h>
#include <memory>

namespace crypto
{

namespace
{

struct CtxDeleter
{
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

using cipher_ctx = std::unique_ptr<EVP_CIPHER_CTX, CtxDeleter>;

// Cipher selection, IV length, key and nonce in one step; enc = 1 encrypts, 0 decrypts
cipher_ctx init_gcm(std::span<const uint8_t> key, std::span<const uint8_t> nonce, int enc)
{
    cipher_ctx ctx(EVP_CIPHER_CTX_new());
    if (!ctx)
    {
        return nullptr;
    }

    if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr, enc) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1 ||
        EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data(), enc) != 1)
    {
        return nullptr;
    }
    return ctx;
}

bool feed_aad(EVP_CIPHER_CTX* ctx, std::span<const uint8_t> aad)
{
    if (aad.empty())
    {
        return true;
    }
    int len = 0;
    return EVP_CipherUpdate(ctx, nullptr, std::addressof(len), aad.data(), static_cast<int>(aad.size())) == 1;
}

} // namespace

bool AES256GCM::chk_sz(std::span<const uint8_t> key, std::span<const uint8_t> nonce)
{
    return key.size() == key_sz && nonce.size() == nonce_sz;
}

std::optional<AES256GCM::ciphertext_t> AES256GCM::encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> aad)
{
    if (!chk_sz(key, nonce))
    {
        return std::nullopt;
    }

    auto ctx = init_gcm(key, nonce, 1);
    if (!ctx || !feed_aad(ctx.get(), aad))
    {
        return std::nullopt;
    }

    ciphertext_t result;
    result.data.resize(plaintext.size());

    int len = 0;
    if (EVP_CipherUpdate(ctx.get(), result.data.data(), std::addressof(len), plaintext.data(), static_cast<int>(plaintext.size())) != 1)
    {
        return std::nullopt;
    }

    int final_len = 0;
    if (EVP_CipherFinal_ex(ctx.get(), result.data.data() + len, std::addressof(final_len)) != 1)
    {
        return std::nullopt;
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(result.tag.size()), result.tag.data()) != 1)
    {
        return std::nullopt;
    }

    return result;
}

std::optional<AES256GCM::data_t> AES256GCM::decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    const ciphertext_t& ct,
    std::span<const uint8_t> aad)
{
    if (!chk_sz(key, nonce))
    {
        return std::nullopt;
    }

    auto ctx = init_gcm(key, nonce, 0);
    if (!ctx || !feed_aad(ctx.get(), aad))
    {
        return std::nullopt;
    }

    data_t plaintext(ct.data.size());

    int len = 0;
    if (EVP_CipherUpdate(ctx.get(), plaintext.data(), std::addressof(len), ct.data.data(), static_cast<int>(ct.data.size())) != 1)
    {
        secure_clear(plaintext);
        return std::nullopt;
    }

    tag_t tag = ct.tag;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()), tag.data()) != 1)
    {
        secure_clear(plaintext);
        return std::nullopt;
    }

    int final_len = 0;
    if (EVP_CipherFinal_ex(ctx.get(), plaintext.data() + len, std::addressof(final_len)) != 1)
    {
        secure_clear(plaintext);
        return std::nullopt;
    }

    return plaintext;
}

} // namespace crypto
