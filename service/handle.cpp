#include "service/handle.hpp"
#include "logger.hpp"

namespace service
{

void Manager::set_secret_key(crypto::SecretKey new_key)
{
    uint64_t n = 0;
    {
        std::lock_guard lock(mtx);
        key = std::move(new_key);
        n = ++install_count;
    }
    LOG_INFO("Secret key installed into service configuration (install #{})", n);
}

std::optional<crypto::SecretKey> Manager::secret_key() const
{
    std::lock_guard lock(mtx);
    return key;
}

uint64_t Manager::installs() const
{
    std::lock_guard lock(mtx);
    return install_count;
}

void Handle::set_secret_key(crypto::SecretKey key)
{
    if (!manager)
    {
        LOG_DEBUG("Dummy service handle ignored secret key");
        return;
    }
    manager->set_secret_key(std::move(key));
}

} // namespace service
