#pragma once

#include <boost/json.hpp>
#include <string>
#include <expected>
#include <cstdint>
#include <chrono>

namespace json = boost::json;

/**
 * Daemon configuration loaded from JSON file.
 * Load-once at startup, immutable thereafter.
 */
class Config
{
public:
    struct RuntimeCfg
    {
        size_t io_threads = 1;
        size_t blocking_threads = 2;
        bool test = false;
    };

    struct StoreCfg
    {
        std::string path = "keyward_store.db";
    };

    struct KeystoreCfg
    {
        std::string path = "keyward_keystore.db";
        std::string kdf = "interactive";
    };

    struct PeerCfg
    {
        std::string root = "keyward_peer";
        std::chrono::seconds heartbeat{30};
    };

    struct LoggingCfg
    {
        std::string level = "info";
        std::string file = "";
        size_t max_size_mb = 100;
        bool enable_console = true;
    };

    [[nodiscard]] static std::expected<Config, std::string> load(const std::string& filepath);
    [[nodiscard]] static Config load_defaults();
    [[nodiscard]] static Config load_or_defaults(const std::string& filepath);

    [[nodiscard]] const RuntimeCfg& runtime() const { return rt; }
    [[nodiscard]] const StoreCfg& store() const { return st; }
    [[nodiscard]] const KeystoreCfg& keystore() const { return ks; }
    [[nodiscard]] const PeerCfg& peer() const { return pr; }
    [[nodiscard]] const LoggingCfg& logging() const { return log; }

    // In-process overrides, used by tests and the CLI's --test flag
    void set_test(bool test) { rt.test = test; }
    void set_paths(std::string store_path, std::string keystore_path, std::string peer_root);

private:
    RuntimeCfg rt;
    StoreCfg st;
    KeystoreCfg ks;
    PeerCfg pr;
    LoggingCfg log;

    [[nodiscard]] static std::expected<Config, std::string> parse(const json::value& jv);
};
