#include "store/store.hpp"

#include <format>

namespace store
{

namespace
{

struct StmtDeleter
{
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

using statement = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

// Holds the connection mutex so step, changes() and errmsg() see the same statement
class DbLock
{
public:
    explicit DbLock(sqlite3* db) : mtx(sqlite3_db_mutex(db)) { sqlite3_mutex_enter(mtx); }
    ~DbLock() { sqlite3_mutex_leave(mtx); }

    DbLock(const DbLock&) = delete;
    DbLock& operator=(const DbLock&) = delete;

private:
    sqlite3_mutex* mtx;
};

statement prepare(sqlite3* db, const char* sql)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        return nullptr;
    }
    return statement(stmt);
}

void bind_text(sqlite3_stmt* stmt, int idx, std::string_view text)
{
    sqlite3_bind_text(stmt, idx, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
}

} // namespace

std::expected<std::shared_ptr<Store>, std::string> Store::open(std::string_view db_path)
{
    sqlite3* handle = nullptr;
    std::string path(db_path);
    int rc = sqlite3_open_v2(path.c_str(), &handle,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK)
    {
        std::string err = handle ? sqlite3_errmsg(handle) : "out of memory";
        sqlite3_close(handle);
        return std::unexpected(std::format("Failed to open store '{}': {}", path, err));
    }

    std::shared_ptr<Store> s(new Store(handle, std::move(path)));

    sqlite3_busy_timeout(handle, 5000);
    sqlite3_exec(handle, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(handle, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    if (!s->init_schema())
    {
        return std::unexpected(std::format("Failed to create schema in '{}': {}", s->db_path, s->last_error()));
    }
    return s;
}

Store::Store(sqlite3* handle, std::string path)
    : db(handle)
    , db_path(std::move(path))
{
}

Store::~Store()
{
    if (db)
    {
        sqlite3_close(db);
    }
}

bool Store::init_schema()
{
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS kv (
            key TEXT PRIMARY KEY,
            value BLOB NOT NULL,
            updated_at INTEGER DEFAULT (strftime('%s', 'now'))
        ) WITHOUT ROWID;
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, std::addressof(err));
    if (err)
    {
        sqlite3_free(err);
    }
    return rc == SQLITE_OK;
}

std::string Store::last_error() const
{
    return sqlite3_errmsg(db);
}

std::expected<std::optional<std::string>, std::string> Store::get(std::string_view key)
{
    DbLock lock(db);
    auto stmt = prepare(db, "SELECT value FROM kv WHERE key = ?;");
    if (!stmt)
    {
        return std::unexpected(last_error());
    }
    bind_text(stmt.get(), 1, key);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE)
    {
        return std::optional<std::string>{};
    }
    if (rc != SQLITE_ROW)
    {
        return std::unexpected(last_error());
    }

    const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt.get(), 0));
    int len = sqlite3_column_bytes(stmt.get(), 0);
    return std::optional<std::string>(std::string(data ? data : "", static_cast<size_t>(len)));
}

std::expected<void, std::string> Store::put(std::string_view key, std::string_view value)
{
    DbLock lock(db);
    auto stmt = prepare(db, "INSERT INTO kv (key, value) VALUES (?, ?) "
                            "ON CONFLICT(key) DO UPDATE SET value = excluded.value, "
                            "updated_at = strftime('%s', 'now');");
    if (!stmt)
    {
        return std::unexpected(last_error());
    }
    bind_text(stmt.get(), 1, key);
    sqlite3_bind_blob(stmt.get(), 2, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        return std::unexpected(last_error());
    }
    return {};
}

std::expected<bool, std::string> Store::insert(std::string_view key, std::string_view value)
{
    DbLock lock(db);
    auto stmt = prepare(db, "INSERT OR IGNORE INTO kv (key, value) VALUES (?, ?);");
    if (!stmt)
    {
        return std::unexpected(last_error());
    }
    bind_text(stmt.get(), 1, key);
    sqlite3_bind_blob(stmt.get(), 2, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        return std::unexpected(last_error());
    }
    return sqlite3_changes(db) == 1;
}

std::expected<bool, std::string> Store::remove(std::string_view key)
{
    DbLock lock(db);
    auto stmt = prepare(db, "DELETE FROM kv WHERE key = ?;");
    if (!stmt)
    {
        return std::unexpected(last_error());
    }
    bind_text(stmt.get(), 1, key);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        return std::unexpected(last_error());
    }
    return sqlite3_changes(db) == 1;
}

} // namespace store
