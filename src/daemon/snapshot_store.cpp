#include "daemon/snapshot_store.hpp"

#include <QByteArray>
#include <QCryptographicHash>

#include "daemon/file_snapshot_store.hpp"
#include "daemon/sqlite_snapshot_store.hpp"

namespace pagewatch {

std::string identityKey(const std::string &url)
{
    const QByteArray digest = QCryptographicHash::hash(
        QByteArray::fromStdString(url), QCryptographicHash::Md5);
    return digest.toHex().toStdString();
}

std::unique_ptr<SnapshotStore> makeSnapshotStore(const MonitorConfig &config)
{
    switch (config.storeBackend) {
    case StoreBackend::Sqlite:
        return std::make_unique<SqliteSnapshotStore>(config.sqlitePath());
    case StoreBackend::Files:
        break;
    }
    return std::make_unique<FileSnapshotStore>(config.snapshotDir);
}

} // namespace pagewatch
