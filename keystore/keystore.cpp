#include "keystore/keystore.hpp"
#include "crypto/utils.hpp"

namespace keystore
{

std::string_view to_string(Error e)
{
    switch (e)
    {
        case Error::WrongPassphrase:    return "wrong passphrase";
        case Error::NoKeyPresent:       return "no key present";
        case Error::KeyAlreadyExists:   return "key already exists";
        case Error::BackendUnavailable: return "keystore backend unavailable";
    }
    return "unknown keystore error";
}

Passphrase::~Passphrase()
{
    wipe();
}

Passphrase::Passphrase(Passphrase&& other) noexcept
    : secret(std::move(other.secret))
{
    other.wipe();
}

Passphrase& Passphrase::operator=(Passphrase&& other) noexcept
{
    if (this != &other)
    {
        wipe();
        secret = std::move(other.secret);
        other.wipe();
    }
    return *this;
}

void Passphrase::wipe()
{
    // Small strings live in the SSO buffer, so clear the full capacity rather than size()
    secret.resize(secret.capacity());
    crypto::secure_clear(secret);
    secret.clear();
}

} // namespace keystore
