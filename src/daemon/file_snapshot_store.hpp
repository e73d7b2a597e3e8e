#pragma once

#include <QString>

#include "daemon/snapshot_store.hpp"

namespace pagewatch {

// One pretty-printed JSON file per key: <dir>/<key>.json holding
// {"timestamp": ISO-8601, "text": ...}. Writes go through QSaveFile, so a
// record is replaced by rename only once it is complete.
class FileSnapshotStore : public SnapshotStore
{
public:
    explicit FileSnapshotStore(const QString &directory);

    bool exists(const std::string &key) const override;
    std::optional<Snapshot> load(const std::string &key) const override;
    void save(const std::string &key, const std::string &text) override;

    QString recordPath(const std::string &key) const;

private:
    QString m_directory;
};

} // namespace pagewatch
