#include "keystore/sealed_key.hpp"
#include "crypto/utils.hpp"
#include "logger.hpp"

#include <algorithm>

namespace keystore
{

namespace
{

template<size_t N>
bool read_hex(const json::object& obj, std::string_view key, std::array<uint8_t, N>& out)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_string())
    {
        return false;
    }
    auto bytes = crypto::from_hex(std::string_view(it->value().as_string()));
    if (!bytes || bytes->size() != N)
    {
        return false;
    }
    std::ranges::copy(*bytes, out.begin());
    return true;
}

} // namespace

std::string SealedKey::serialize() const
{
    json::object obj;
    obj["version"] = version;
    obj["kdf"] = json::object{
        {"ops", cost.ops},
        {"mem", static_cast<uint64_t>(cost.mem)},
    };
    obj["salt"] = crypto::to_hex(salt);
    obj["nonce"] = crypto::to_hex(nonce);
    obj["tag"] = crypto::to_hex(ct.tag);
    obj["ciphertext"] = crypto::to_hex(ct.data);
    return json::serialize(obj);
}

std::expected<SealedKey, Error> SealedKey::parse(std::string_view blob)
{
    json::value jv;
    try
    {
        jv = json::parse(blob);
    }
    catch (const std::exception& e)
    {
        LOG_ERROR("Sealed key is not valid JSON: {}", e.what());
        return std::unexpected(Error::BackendUnavailable);
    }

    if (!jv.is_object())
    {
        return std::unexpected(Error::BackendUnavailable);
    }
    const auto& obj = jv.as_object();

    auto ver = obj.find("version");
    if (ver == obj.end() || !ver->value().is_int64() || ver->value().as_int64() != version)
    {
        LOG_ERROR("Sealed key has unsupported version");
        return std::unexpected(Error::BackendUnavailable);
    }

    SealedKey sealed;
    auto kdf = obj.find("kdf");
    if (kdf == obj.end() || !kdf->value().is_object())
    {
        return std::unexpected(Error::BackendUnavailable);
    }
    try
    {
        const auto& k = kdf->value().as_object();
        sealed.cost.ops = k.at("ops").to_number<uint64_t>();
        sealed.cost.mem = k.at("mem").to_number<size_t>();
    }
    catch (const std::exception& e)
    {
        LOG_ERROR("Sealed key has malformed kdf parameters: {}", e.what());
        return std::unexpected(Error::BackendUnavailable);
    }

    auto ct_it = obj.find("ciphertext");
    if (ct_it == obj.end() || !ct_it->value().is_string())
    {
        return std::unexpected(Error::BackendUnavailable);
    }
    auto data = crypto::from_hex(std::string_view(ct_it->value().as_string()));

    if (!data || !read_hex(obj, "salt", sealed.salt) || !read_hex(obj, "nonce", sealed.nonce) ||
        !read_hex(obj, "tag", sealed.ct.tag))
    {
        LOG_ERROR("Sealed key has malformed fields");
        return std::unexpected(Error::BackendUnavailable);
    }
    sealed.ct.data = std::move(*data);
    return sealed;
}

std::expected<SealedKey, Error> seal(const crypto::SecretKey& key,
                                     std::string_view passphrase,
                                     crypto::Argon2Kdf::Cost cost)
{
    SealedKey sealed;
    sealed.cost = cost;
    sealed.salt = crypto::Argon2Kdf::new_salt();
    crypto::random_bytes(sealed.nonce);

    auto kek = crypto::Argon2Kdf::derive(passphrase, sealed.salt, cost);
    if (!kek)
    {
        LOG_ERROR("Sealing key failed: {}", kek.error());
        return std::unexpected(Error::BackendUnavailable);
    }

    auto ct = crypto::AES256GCM::encrypt(*kek, sealed.nonce, key.bytes());
    crypto::secure_clear(*kek);
    if (!ct)
    {
        LOG_ERROR("Sealing key failed: encryption error");
        return std::unexpected(Error::BackendUnavailable);
    }

    sealed.ct = std::move(*ct);
    return sealed;
}

KeyResult open(const SealedKey& sealed, std::string_view passphrase)
{
    auto kek = crypto::Argon2Kdf::derive(passphrase, sealed.salt, sealed.cost);
    if (!kek)
    {
        LOG_ERROR("Opening key failed: {}", kek.error());
        return std::unexpected(Error::BackendUnavailable);
    }

    auto plain = crypto::AES256GCM::decrypt(*kek, sealed.nonce, sealed.ct);
    crypto::secure_clear(*kek);
    if (!plain)
    {
        // GCM tag mismatch: the derived key is wrong
        return std::unexpected(Error::WrongPassphrase);
    }

    auto key = crypto::SecretKey::from_bytes(*plain);
    crypto::secure_clear(*plain);
    if (!key)
    {
        return std::unexpected(Error::BackendUnavailable);
    }
    return std::move(*key);
}

} // namespace keystore
