#include "config.hpp"
#include "crypto/argon2_kdf.hpp"

#include <fstream>
#include <sstream>
#include <format>

namespace {

template<std::unsigned_integral Ty>
std::expected<Ty, std::string> get_uint(const json::object& obj, std::string_view key,
                                        Ty min_val, Ty max_val, Ty default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return default_val;
    }
    if (!it->value().is_int64() && !it->value().is_uint64())
    {
        return std::unexpected(std::format("'{}' must be an integer", key));
    }
    if (it->value().is_int64() && it->value().as_int64() < 0)
    {
        return std::unexpected(std::format("'{}' must be between {} and {}", key, min_val, max_val));
    }
    auto val = it->value().to_number<uint64_t>();
    if (val < static_cast<uint64_t>(min_val) || val > static_cast<uint64_t>(max_val))
    {
        return std::unexpected(std::format("'{}' must be between {} and {}",
                                           key, min_val, max_val));
    }
    return static_cast<Ty>(val);
}

std::expected<std::string, std::string> get_string(const json::object& obj, std::string_view key,
                                                   std::string_view default_val, bool allow_empty = true)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return std::string(default_val);
    }
    if (!it->value().is_string())
    {
        return std::unexpected(std::format("'{}' must be a string", key));
    }
    std::string val(it->value().as_string());
    if (!allow_empty && val.empty())
    {
        return std::unexpected(std::format("'{}' must not be empty", key));
    }
    return val;
}

bool get_bool(const json::object& obj, std::string_view key, bool default_val)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_bool())
    {
        return default_val;
    }
    return it->value().as_bool();
}

const json::object* section(const json::object& root, std::string_view name)
{
    auto it = root.find(name);
    if (it == root.end() || !it->value().is_object())
    {
        return nullptr;
    }
    return &it->value().as_object();
}

} // namespace

std::expected<Config, std::string> Config::load(const std::string& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        return std::unexpected(std::format("Failed to open config file: {}", filepath));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    json::value jv;
    try
    {
        jv = json::parse(buffer.str());
    }
    catch (const std::exception& e)
    {
        return std::unexpected(std::format("JSON parse error: {}", e.what()));
    }
    return parse(jv);
}

Config Config::load_defaults()
{
    return Config{};
}

Config Config::load_or_defaults(const std::string& filepath)
{
    auto result = load(filepath);
    if (result)
    {
        return *result;
    }
    return load_defaults();
}

void Config::set_paths(std::string store_path, std::string keystore_path, std::string peer_root)
{
    st.path = std::move(store_path);
    ks.path = std::move(keystore_path);
    pr.root = std::move(peer_root);
}

std::expected<Config, std::string> Config::parse(const json::value& jv)
{
    if (!jv.is_object())
    {
        return std::unexpected("Config root must be a JSON object");
    }
    const auto& root = jv.as_object();
    Config config;

    if (const auto* rt = section(root, "runtime"))
    {
        auto io = get_uint<size_t>(*rt, "io_threads", 1, 256, 1);
        if (!io)
        {
            return std::unexpected(io.error());
        }
        config.rt.io_threads = *io;

        auto blocking = get_uint<size_t>(*rt, "blocking_threads", 1, 256, 2);
        if (!blocking)
        {
            return std::unexpected(blocking.error());
        }
        config.rt.blocking_threads = *blocking;

        config.rt.test = get_bool(*rt, "test", false);
    }

    if (const auto* st = section(root, "store"))
    {
        auto path = get_string(*st, "path", config.st.path, false);
        if (!path)
        {
            return std::unexpected(path.error());
        }
        config.st.path = *path;
    }

    if (const auto* ks = section(root, "keystore"))
    {
        auto path = get_string(*ks, "path", config.ks.path, false);
        if (!path)
        {
            return std::unexpected(path.error());
        }
        config.ks.path = *path;

        auto kdf = get_string(*ks, "kdf", config.ks.kdf, false);
        if (!kdf)
        {
            return std::unexpected(kdf.error());
        }
        if (auto cost = crypto::Argon2Kdf::cost_from_name(*kdf); !cost)
        {
            return std::unexpected(cost.error());
        }
        config.ks.kdf = *kdf;
    }

    if (const auto* pr = section(root, "peer"))
    {
        auto peer_root = get_string(*pr, "root", config.pr.root, false);
        if (!peer_root)
        {
            return std::unexpected(peer_root.error());
        }
        config.pr.root = *peer_root;

        auto hb = get_uint<uint64_t>(*pr, "heartbeat_sec", 1, 3600, 30);
        if (!hb)
        {
            return std::unexpected(hb.error());
        }
        config.pr.heartbeat = std::chrono::seconds(*hb);
    }

    if (const auto* lg = section(root, "logging"))
    {
        auto level = get_string(*lg, "level", "info");
        if (!level)
        {
            return std::unexpected(level.error());
        }
        config.log.level = *level;

        auto file = get_string(*lg, "file", "");
        if (!file)
        {
            return std::unexpected(file.error());
        }
        config.log.file = *file;

        auto max_size = get_uint<size_t>(*lg, "max_size_mb", 1, 10000, 100);
        if (!max_size)
        {
            return std::unexpected(max_size.error());
        }
        config.log.max_size_mb = *max_size;
        config.log.enable_console = get_bool(*lg, "enable_console", true);
    }

    return config;
}
