#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "common/monitor_config.hpp"
#include "daemon/file_snapshot_store.hpp"
#include "daemon/snapshot_store.hpp"
#include "daemon/sqlite_snapshot_store.hpp"

using pagewatch::FileSnapshotStore;
using pagewatch::SqliteSnapshotStore;
using pagewatch::StorageError;

class SnapshotStoreTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testIdentityKeyIsStableMd5();
    void testFileStoreRoundTrip();
    void testFileStoreRecordLayout();
    void testFileStoreLastWriteWins();
    void testFileStoreCorruptRecord();
    void testFileStoreFailedWriteKeepsPrior();
    void testFileStoreRejectsPathKeys();
    void testSqliteStoreRoundTrip();
    void testSqliteStorePersistsAcrossReopen();
    void testFactorySelectsBackend();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void SnapshotStoreTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void SnapshotStoreTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void SnapshotStoreTests::testIdentityKeyIsStableMd5()
{
    QCOMPARE(QString::fromStdString(pagewatch::identityKey("https://example.com")),
             QStringLiteral("c984d06aafbecf6bc55569f964148ea3"));
    QCOMPARE(pagewatch::identityKey("https://a.example"),
             pagewatch::identityKey("https://a.example"));
    QVERIFY(pagewatch::identityKey("https://example.com")
            != pagewatch::identityKey("https://example.com/"));
}

void SnapshotStoreTests::testFileStoreRoundTrip()
{
    const QString dir = m_tempDir.path() + "/files-roundtrip";
    QVERIFY(QDir().mkpath(dir));
    FileSnapshotStore store(dir);
    const std::string key = pagewatch::identityKey("https://example.com");

    QVERIFY(!store.exists(key));
    QVERIFY(!store.load(key).has_value());

    const auto before = std::chrono::system_clock::now() - std::chrono::seconds(1);
    store.save(key, "Welcome to Example");
    QVERIFY(store.exists(key));

    const auto loaded = store.load(key);
    QVERIFY(loaded.has_value());
    QCOMPARE(QString::fromStdString(loaded->text), QStringLiteral("Welcome to Example"));
    QVERIFY(loaded->timestamp >= before);
}

void SnapshotStoreTests::testFileStoreRecordLayout()
{
    const QString dir = m_tempDir.path() + "/files-layout";
    QVERIFY(QDir().mkpath(dir));
    FileSnapshotStore store(dir);
    const std::string key = pagewatch::identityKey("https://a.example");
    store.save(key, "line one\nline two");

    QFile file(dir + "/f1e9de895bf5363a3cc0582708c7ce76.json");
    QVERIFY(file.open(QIODevice::ReadOnly));
    const auto record = nlohmann::json::parse(file.readAll().toStdString());
    QCOMPARE(QString::fromStdString(record.at("text").get<std::string>()),
             QStringLiteral("line one\nline two"));
    QVERIFY(record.at("timestamp").is_string());
    QVERIFY(QString::fromStdString(record.at("timestamp").get<std::string>()).endsWith('Z'));
    QCOMPARE(record.size(), std::size_t(2));
    QVERIFY(!record.contains("url"));
}

void SnapshotStoreTests::testFileStoreLastWriteWins()
{
    const QString dir = m_tempDir.path() + "/files-overwrite";
    QVERIFY(QDir().mkpath(dir));
    FileSnapshotStore store(dir);
    const std::string key = pagewatch::identityKey("https://example.com");

    store.save(key, "first");
    store.save(key, "second");
    QCOMPARE(QString::fromStdString(store.load(key)->text), QStringLiteral("second"));
    QCOMPARE(QDir(dir).entryList(QDir::Files).size(), 1);
}

void SnapshotStoreTests::testFileStoreCorruptRecord()
{
    const QString dir = m_tempDir.path() + "/files-corrupt";
    QVERIFY(QDir().mkpath(dir));
    FileSnapshotStore store(dir);
    const std::string key = pagewatch::identityKey("https://example.com");

    QFile file(store.recordPath(key));
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{\"timestamp\": \"2025-01-01T00:00:00\", \"te");
    file.close();
    QVERIFY_THROWS_EXCEPTION(StorageError, store.load(key));

    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write("{\"timestamp\": \"2025-01-01T00:00:00\"}");
    file.close();
    QVERIFY_THROWS_EXCEPTION(StorageError, store.load(key));

    // Records from older tools carry no zone suffix; they still load.
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write("{\"timestamp\": \"2025-01-01T00:00:00.123456\", \"text\": \"legacy\"}");
    file.close();
    QCOMPARE(QString::fromStdString(store.load(key)->text), QStringLiteral("legacy"));

    // Extra fields written by other tools are ignored.
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write("{\"url\": \"https://example.com\", \"timestamp\": \"2025-01-01T00:00:00Z\", "
               "\"text\": \"with url\"}");
    file.close();
    QCOMPARE(QString::fromStdString(store.load(key)->text), QStringLiteral("with url"));
}

void SnapshotStoreTests::testFileStoreFailedWriteKeepsPrior()
{
    const QString dir = m_tempDir.path() + "/files-failed-write";
    QVERIFY(QDir().mkpath(dir));
    FileSnapshotStore store(dir);
    const std::string key = pagewatch::identityKey("https://example.com");
    store.save(key, "good text");

    // Not valid UTF-8, so the record cannot be encoded.
    QVERIFY_THROWS_EXCEPTION(StorageError, store.save(key, std::string("bad \xff\xfe text")));
    QCOMPARE(QString::fromStdString(store.load(key)->text), QStringLiteral("good text"));

    FileSnapshotStore missingDir(m_tempDir.path() + "/does/not/exist");
    QVERIFY_THROWS_EXCEPTION(StorageError, missingDir.save(key, "text"));
    QVERIFY(!missingDir.load(key).has_value());
}

void SnapshotStoreTests::testFileStoreRejectsPathKeys()
{
    FileSnapshotStore store(m_tempDir.path());
    QVERIFY_THROWS_EXCEPTION(StorageError, store.save("../escape", "text"));
    QVERIFY_THROWS_EXCEPTION(StorageError, store.load(""));
}

void SnapshotStoreTests::testSqliteStoreRoundTrip()
{
    SqliteSnapshotStore store(m_tempDir.path() + "/roundtrip.db");
    const std::string key = pagewatch::identityKey("https://example.com");

    QVERIFY(!store.exists(key));
    QVERIFY(!store.load(key).has_value());

    store.save(key, "first");
    store.save(key, std::string("second\0with nul", 15));
    QVERIFY(store.exists(key));

    const auto loaded = store.load(key);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->text.size(), static_cast<size_t>(15));
    QCOMPARE(loaded->text, std::string("second\0with nul", 15));
}

void SnapshotStoreTests::testSqliteStorePersistsAcrossReopen()
{
    const QString path = m_tempDir.path() + "/reopen.db";
    const std::string key = pagewatch::identityKey("https://a.example");
    {
        SqliteSnapshotStore store(path);
        store.save(key, "persisted");
    }
    SqliteSnapshotStore reopened(path);
    QCOMPARE(QString::fromStdString(reopened.load(key)->text), QStringLiteral("persisted"));

    QVERIFY_THROWS_EXCEPTION(StorageError,
                             SqliteSnapshotStore(m_tempDir.path() + "/no/such/dir/x.db"));
}

void SnapshotStoreTests::testFactorySelectsBackend()
{
    pagewatch::MonitorConfig config;
    config.dataDir = m_tempDir.path() + "/factory";
    config.snapshotDir = config.dataDir + "/snapshots";
    QVERIFY(QDir().mkpath(config.snapshotDir));

    config.storeBackend = pagewatch::StoreBackend::Files;
    auto files = pagewatch::makeSnapshotStore(config);
    QVERIFY(dynamic_cast<FileSnapshotStore *>(files.get()) != nullptr);

    config.storeBackend = pagewatch::StoreBackend::Sqlite;
    auto sqlite = pagewatch::makeSnapshotStore(config);
    QVERIFY(dynamic_cast<SqliteSnapshotStore *>(sqlite.get()) != nullptr);
    QVERIFY(QFile::exists(config.sqlitePath()));
}

QTEST_MAIN(SnapshotStoreTests)
#include "test_snapshot_store.moc"
