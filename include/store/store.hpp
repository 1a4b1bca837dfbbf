#pragma once

#include <sqlite3.h>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace store
{

/**
 * Key/value store on a single SQLite file, shared by every context variant.
 * The connection runs in serialized mode, so one handle may be used from any thread.
 */
class Store
{
public:
    [[nodiscard]] static std::expected<std::shared_ptr<Store>, std::string> open(std::string_view db_path);
    ~Store();

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    [[nodiscard]] std::expected<std::optional<std::string>, std::string> get(std::string_view key);
    [[nodiscard]] std::expected<void, std::string> put(std::string_view key, std::string_view value);

    // false when the key is already present; the stored value is left untouched
    [[nodiscard]] std::expected<bool, std::string> insert(std::string_view key, std::string_view value);

    [[nodiscard]] std::expected<bool, std::string> remove(std::string_view key);

    [[nodiscard]] const std::string& path() const { return db_path; }

private:
    Store(sqlite3* db, std::string path);

    [[nodiscard]] bool init_schema();
    [[nodiscard]] std::string last_error() const;

    sqlite3* db;
    std::string db_path;
};

} // namespace store
