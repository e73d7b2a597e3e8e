#include "daemon/sqlite_snapshot_store.hpp"

#include <chrono>
#include <mutex>
#include <string>

#include <sqlite3.h>

#include "common/json_utils.hpp"

namespace pagewatch {

namespace {

constexpr int kBusyTimeoutMs = 5000;

constexpr const char *kCreateSnapshotsTable =
    "CREATE TABLE IF NOT EXISTS snapshots ("
    "    key TEXT PRIMARY KEY,"
    "    timestamp TEXT NOT NULL,"
    "    text TEXT NOT NULL"
    ");";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw StorageError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw StorageError(message);
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    const int size = sqlite3_column_bytes(stmt, index);
    return std::string(reinterpret_cast<const char *>(text), static_cast<size_t>(size));
}

} // namespace

struct SqliteSnapshotStore::Impl {
    sqlite3 *db = nullptr;
    std::mutex mutex;
};

SqliteSnapshotStore::SqliteSnapshotStore(const QString &databasePath)
    : impl(std::make_unique<Impl>())
{
    const std::string path = databasePath.toStdString();
    if (sqlite3_open(path.c_str(), &impl->db) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw StorageError("failed to open snapshot database " + path + ": " + message);
    }

    sqlite3_busy_timeout(impl->db, kBusyTimeoutMs);
    try {
        execOrThrow(impl->db, kCreateSnapshotsTable);
    } catch (const StorageError &) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw;
    }
}

SqliteSnapshotStore::~SqliteSnapshotStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

bool SqliteSnapshotStore::exists(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "SELECT 1 FROM snapshots WHERE key = ? LIMIT 1;");
    bindText(stmt.get(), 1, key);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc != SQLITE_DONE) {
        throw StorageError(std::string("snapshot lookup failed: ") + sqlite3_errmsg(impl->db));
    }
    return false;
}

std::optional<Snapshot> SqliteSnapshotStore::load(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "SELECT timestamp, text FROM snapshots WHERE key = ?;");
    bindText(stmt.get(), 1, key);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        throw StorageError(std::string("snapshot read failed: ") + sqlite3_errmsg(impl->db));
    }

    Snapshot snapshot;
    snapshot.timestamp = fromIso8601Utc(columnText(stmt.get(), 0));
    snapshot.text = columnText(stmt.get(), 1);
    return snapshot;
}

void SqliteSnapshotStore::save(const std::string &key, const std::string &text)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO snapshots (key, timestamp, text) "
                   "VALUES (?, ?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, toIso8601Utc(std::chrono::system_clock::now()));
    bindText(stmt.get(), 3, text);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw StorageError(std::string("failed to write snapshot: ") + sqlite3_errmsg(impl->db));
    }
}

} // namespace pagewatch
