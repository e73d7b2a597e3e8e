#include "daemon/file_snapshot_store.hpp"

#include <chrono>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"

namespace pagewatch {

namespace {

void requireValidKey(const std::string &key)
{
    if (key.empty()) {
        throw StorageError("empty snapshot key");
    }
    for (const char ch : key) {
        const bool alnum = (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z')
            || (ch >= 'A' && ch <= 'Z');
        if (!alnum) {
            throw StorageError("invalid snapshot key: " + key);
        }
    }
}

} // namespace

FileSnapshotStore::FileSnapshotStore(const QString &directory)
    : m_directory(directory)
{
}

QString FileSnapshotStore::recordPath(const std::string &key) const
{
    return m_directory + QDir::separator() + QString::fromStdString(key)
        + QStringLiteral(".json");
}

bool FileSnapshotStore::exists(const std::string &key) const
{
    requireValidKey(key);
    return QFileInfo::exists(recordPath(key));
}

std::optional<Snapshot> FileSnapshotStore::load(const std::string &key) const
{
    requireValidKey(key);
    const QString path = recordPath(key);
    QFile file(path);
    if (!file.exists()) {
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        throw StorageError("cannot read snapshot " + path.toStdString() + ": "
                           + file.errorString().toStdString());
    }

    nlohmann::json record;
    try {
        record = nlohmann::json::parse(file.readAll().toStdString());
    } catch (const nlohmann::json::parse_error &ex) {
        throw StorageError("corrupt snapshot " + path.toStdString() + ": " + ex.what());
    }

    if (!record.is_object() || !record.contains("text") || !record.at("text").is_string()) {
        throw StorageError("corrupt snapshot " + path.toStdString() + ": missing text");
    }

    Snapshot snapshot;
    snapshot.text = record.at("text").get<std::string>();
    snapshot.timestamp = fromIso8601Utc(record.value("timestamp", ""));
    return snapshot;
}

void FileSnapshotStore::save(const std::string &key, const std::string &text)
{
    requireValidKey(key);

    Snapshot snapshot;
    snapshot.timestamp = std::chrono::system_clock::now();
    snapshot.text = text;

    std::string payload;
    try {
        payload = nlohmann::json(snapshot).dump(2);
    } catch (const nlohmann::json::type_error &ex) {
        // Invalid UTF-8 in the text.
        throw StorageError(std::string("cannot encode snapshot: ") + ex.what());
    }

    const QString path = recordPath(key);
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        throw StorageError("cannot write snapshot " + path.toStdString() + ": "
                           + file.errorString().toStdString());
    }
    file.write(payload.data(), static_cast<qint64>(payload.size()));
    file.write("\n");
    if (!file.commit()) {
        throw StorageError("cannot commit snapshot " + path.toStdString() + ": "
                           + file.errorString().toStdString());
    }
}

} // namespace pagewatch
