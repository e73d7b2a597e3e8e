#include <QtTest/QtTest>

#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "daemon/target_registry.hpp"

using pagewatch::TargetRegistry;

namespace {

void writeFile(const QString &path, const QByteArray &content)
{
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write(content);
}

} // namespace

class TargetRegistryTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void testParsesTargetsInOrder();
    void testKeywordsDefaultToEmpty();
    void testMalformedDocumentIsEmpty();
    void testBadEntriesAreSkipped();
    void testMissingAndEmptyFiles();
    void testEnsureExistsCreatesEmptyArray();
    void testAddAndRemoveTargets();
    void testAddReplacesKeywords();
    void testUnreadableFileReportsIoError();
    void testUnreadableFileIsNotOverwritten();

private:
    QTemporaryDir m_tempDir;
};

void TargetRegistryTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
}

void TargetRegistryTests::testParsesTargetsInOrder()
{
    const auto result = TargetRegistry::parse(R"([
        {"url": "https://b.example", "keywords": ["Layoffs", "  hiring  "]},
        {"url": "https://a.example", "keywords": []}
    ])");
    QVERIFY(result.warnings.empty());
    QCOMPARE(result.targets.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(result.targets.at(0).url), QStringLiteral("https://b.example"));
    QCOMPARE(result.targets.at(0).keywords.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(result.targets.at(0).keywords.at(1)), QStringLiteral("hiring"));
    QCOMPARE(QString::fromStdString(result.targets.at(1).url), QStringLiteral("https://a.example"));
}

void TargetRegistryTests::testKeywordsDefaultToEmpty()
{
    const auto result = TargetRegistry::parse(R"([{"url": "https://example.com"},
                                                  {"url": "https://x.example", "keywords": null}])");
    QCOMPARE(result.targets.size(), static_cast<size_t>(2));
    QVERIFY(result.targets.at(0).keywords.empty());
    QVERIFY(result.targets.at(1).keywords.empty());
    QVERIFY(result.warnings.empty());
}

void TargetRegistryTests::testMalformedDocumentIsEmpty()
{
    auto result = TargetRegistry::parse("[{\"url\": ");
    QVERIFY(result.targets.empty());
    QCOMPARE(result.warnings.size(), static_cast<size_t>(1));

    result = TargetRegistry::parse(R"({"url": "https://example.com"})");
    QVERIFY(result.targets.empty());
    QCOMPARE(result.warnings.size(), static_cast<size_t>(1));
}

void TargetRegistryTests::testBadEntriesAreSkipped()
{
    const auto result = TargetRegistry::parse(R"([
        "https://not-an-object.example",
        {"keywords": ["orphan"]},
        {"url": 42},
        {"url": "   "},
        {"url": "https://ok.example", "keywords": ["one", 7, "", "two"]},
        {"url": "https://ok.example", "keywords": ["dup"]},
        {"url": "https://other.example", "keywords": "not-a-list"}
    ])");
    QCOMPARE(result.targets.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(result.targets.at(0).url), QStringLiteral("https://ok.example"));
    QVERIFY(result.targets.at(0).keywords == (std::vector<std::string>{"one", "two"}));
    QCOMPARE(QString::fromStdString(result.targets.at(1).url),
             QStringLiteral("https://other.example"));
    QVERIFY(result.targets.at(1).keywords.empty());
    QCOMPARE(result.warnings.size(), static_cast<size_t>(6));
}

void TargetRegistryTests::testMissingAndEmptyFiles()
{
    TargetRegistry missing(m_tempDir.path() + "/missing.json");
    auto result = missing.load();
    QVERIFY(result.targets.empty());
    QVERIFY(result.warnings.empty());
    QVERIFY(!result.ioError.has_value());

    const QString emptyPath = m_tempDir.path() + "/empty.json";
    writeFile(emptyPath, "  \n");
    result = TargetRegistry(emptyPath).load();
    QVERIFY(result.targets.empty());
    QVERIFY(!result.ioError.has_value());
}

void TargetRegistryTests::testEnsureExistsCreatesEmptyArray()
{
    const QString path = m_tempDir.path() + "/created.json";
    TargetRegistry registry(path);
    QVERIFY(registry.ensureExists());

    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    const auto document = nlohmann::json::parse(file.readAll().toStdString());
    QVERIFY(document.is_array());
    QVERIFY(document.empty());
    file.close();

    // Existing content is left alone.
    writeFile(path, R"([{"url": "https://example.com"}])");
    QVERIFY(registry.ensureExists());
    QCOMPARE(registry.load().targets.size(), static_cast<size_t>(1));
}

void TargetRegistryTests::testAddAndRemoveTargets()
{
    TargetRegistry registry(m_tempDir.path() + "/mutate.json");
    registry.addTarget("https://example.com", {"layoffs"});
    registry.addTarget("  https://second.example  ", {});

    auto targets = registry.load().targets;
    QCOMPARE(targets.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(targets.at(1).url), QStringLiteral("https://second.example"));

    QVERIFY(registry.removeTarget("https://example.com"));
    QVERIFY(!registry.removeTarget("https://example.com"));
    targets = registry.load().targets;
    QCOMPARE(targets.size(), static_cast<size_t>(1));

    QVERIFY_THROWS_EXCEPTION(std::invalid_argument, registry.addTarget("   ", {}));
}

void TargetRegistryTests::testAddReplacesKeywords()
{
    const QString path = m_tempDir.path() + "/replace.json";
    writeFile(path, "not json at all");
    TargetRegistry registry(path);

    registry.addTarget("https://example.com", {"old"});
    registry.addTarget("https://example.com", {"new", " ", "other"});

    const auto result = registry.load();
    QVERIFY(result.warnings.empty());
    QCOMPARE(result.targets.size(), static_cast<size_t>(1));
    QVERIFY(result.targets.at(0).keywords == (std::vector<std::string>{"new", "other"}));
}

void TargetRegistryTests::testUnreadableFileReportsIoError()
{
    // A directory exists but cannot be read as a file.
    TargetRegistry registry(m_tempDir.path());
    const auto result = registry.load();
    QVERIFY(result.ioError.has_value());
    QVERIFY(result.targets.empty());

    QVERIFY_THROWS_EXCEPTION(std::runtime_error, registry.addTarget("https://new.example", {}));
    QVERIFY_THROWS_EXCEPTION(std::runtime_error, registry.removeTarget("https://new.example"));
    QVERIFY(QFileInfo(m_tempDir.path()).isDir());
}

void TargetRegistryTests::testUnreadableFileIsNotOverwritten()
{
    const QString path = m_tempDir.path() + "/locked.json";
    const QByteArray original =
        R"([{"url": "https://a.example"}, {"url": "https://b.example"}])";
    writeFile(path, original);
    QVERIFY(QFile::setPermissions(path, QFileDevice::WriteOwner));

    QFile check(path);
    const bool readable = check.open(QIODevice::ReadOnly);
    check.close();
    if (!readable) {
        TargetRegistry registry(path);
        QVERIFY(registry.load().ioError.has_value());
        QVERIFY_THROWS_EXCEPTION(std::runtime_error,
                                 registry.addTarget("https://new.example", {}));
        QVERIFY_THROWS_EXCEPTION(std::runtime_error,
                                 registry.removeTarget("https://a.example"));
    }

    QVERIFY(QFile::setPermissions(path, QFileDevice::ReadOwner | QFileDevice::WriteOwner));
    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(file.readAll(), original);
}

QTEST_MAIN(TargetRegistryTests)
#include "test_target_registry.moc"
