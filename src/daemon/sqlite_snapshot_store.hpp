#pragma once

#include <memory>

#include <QString>

#include "daemon/snapshot_store.hpp"

namespace pagewatch {

// SQLite backend: a single snapshots table keyed by identity key. Every save
// is one INSERT OR REPLACE, so a record is either the old or the new one.
// One connection serves all threads behind a mutex.
class SqliteSnapshotStore : public SnapshotStore
{
public:
    explicit SqliteSnapshotStore(const QString &databasePath);
    ~SqliteSnapshotStore() override;

    bool exists(const std::string &key) const override;
    std::optional<Snapshot> load(const std::string &key) const override;
    void save(const std::string &key, const std::string &text) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace pagewatch
