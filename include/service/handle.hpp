#pragma once

#include "crypto/secret_key.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

namespace service
{

/**
 * Holds the service configuration that depends on the secret key.
 * Last installed key wins.
 */
class Manager
{
public:
    Manager() = default;

    void set_secret_key(crypto::SecretKey key);

    [[nodiscard]] std::optional<crypto::SecretKey> secret_key() const;
    [[nodiscard]] uint64_t installs() const;

private:
    mutable std::mutex mtx;
    std::optional<crypto::SecretKey> key;
    uint64_t install_count = 0;
};

class Handle
{
public:
    explicit Handle(std::shared_ptr<Manager> mgr) : manager(std::move(mgr)) {}

    // Handle not attached to any service; installs are dropped
    [[nodiscard]] static Handle dummy() { return Handle(nullptr); }

    void set_secret_key(crypto::SecretKey key);

    [[nodiscard]] bool is_dummy() const { return manager == nullptr; }

private:
    std::shared_ptr<Manager> manager;
};

} // namespace service
